/* speech_config.cpp - speech controller options and how they are read from a Poco configuration
 *
 * SAYX - system speech command facade
 * Copyright (c) 2022-2025 Sam Tupy
 * This software is provided "as-is", without any express or implied warranty. In no event will the authors be held liable for any damages arising from the use of this software.
 * Permission is granted to anyone to use this software for any purpose, including commercial applications, and to alter it and redistribute it freely, subject to the following restrictions:
 * 1. The origin of this software must not be misrepresented; you must not claim that you wrote the original software. If you use this software in a product, an acknowledgment in the product documentation would be appreciated but is not required.
 * 2. Altered source versions must be plainly marked as such, and must not be misrepresented as being the original software.
 * 3. This notice may not be removed or altered from any source distribution.
*/

#include <Poco/AutoPtr.h>
#include <Poco/Exception.h>
#include <Poco/Path.h>
#include <Poco/String.h>
#include <Poco/Util/IniFileConfiguration.h>
#include <Poco/Util/JSONConfiguration.h>
#include <Poco/Util/PropertyFileConfiguration.h>
#include <Poco/Util/XMLConfiguration.h>
#include "platform.h"
#include "speech_config.h"
#include "speech_script.h"
using namespace std;
using namespace Poco::Util;

speech_options::speech_options() : strict_stderr(true), export_data_format(SAYX_DEFAULT_EXPORT_FORMAT) {}

speech_options load_speech_options(const AbstractConfiguration& config) {
	speech_options opts;
	opts.platform = config.getString("speech.platform", "");
	opts.strict_stderr = config.getBool("speech.strict_stderr", opts.strict_stderr);
	opts.export_data_format = config.getString("speech.export.data_format", opts.export_data_format);
	AbstractConfiguration::Keys keys;
	config.keys("speech.command", keys);
	for (const string& platform : keys) {
		string command = Poco::trim(config.getString("speech.command." + platform, ""));
		if (!command.empty()) opts.commands[platform] = command;
	}
	return opts;
}

speech_options load_speech_options(const string& path) {
	// Same extension dispatch Poco::Util::Application::loadConfiguration uses.
	string ext = Poco::toLower(Poco::Path(path).getExtension());
	Poco::AutoPtr<AbstractConfiguration> config;
	if (ext == "ini") config = new IniFileConfiguration(path);
	else if (ext == "properties") config = new PropertyFileConfiguration(path);
	else if (ext == "json") config = new JSONConfiguration(path);
	else if (ext == "xml") config = new XMLConfiguration(path);
	else throw Poco::InvalidArgumentException("speech configuration file has an unknown extension", path);
	return load_speech_options(*config);
}
