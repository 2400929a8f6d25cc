/* speech_config.h - speech controller options and how they are read from a Poco configuration
 *
 * SAYX - system speech command facade
 * Copyright (c) 2022-2025 Sam Tupy
 * This software is provided "as-is", without any express or implied warranty. In no event will the authors be held liable for any damages arising from the use of this software.
 * Permission is granted to anyone to use this software for any purpose, including commercial applications, and to alter it and redistribute it freely, subject to the following restrictions:
 * 1. The origin of this software must not be misrepresented; you must not claim that you wrote the original software. If you use this software in a product, an acknowledgment in the product documentation would be appreciated but is not required.
 * 2. Altered source versions must be plainly marked as such, and must not be misrepresented as being the original software.
 * 3. This notice may not be removed or altered from any source distribution.
*/

#pragma once
#include <string>
#include <map>
#include <Poco/Util/AbstractConfiguration.h>

struct speech_options {
	std::string platform; // Empty selects the host platform.
	bool strict_stderr; // Any stderr output fails the call, otherwise it is only logged and the exit status decides.
	std::string export_data_format;
	std::map<std::string, std::string> commands; // platform id -> command override.
	speech_options();
};

// Reads speech.platform, speech.strict_stderr, speech.export.data_format and speech.command.<platform>. Missing keys keep their defaults.
speech_options load_speech_options(const Poco::Util::AbstractConfiguration& config);
// Loads an ini, properties, json or xml file by extension and reads the options from it.
speech_options load_speech_options(const std::string& path);
