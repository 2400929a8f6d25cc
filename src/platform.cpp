/* platform.cpp - platform identifiers and the speech command profile bound to each of them
 *
 * SAYX - system speech command facade
 * Copyright (c) 2022-2025 Sam Tupy
 * This software is provided "as-is", without any express or implied warranty. In no event will the authors be held liable for any damages arising from the use of this software.
 * Permission is granted to anyone to use this software for any purpose, including commercial applications, and to alter it and redistribute it freely, subject to the following restrictions:
 * 1. The origin of this software must not be misrepresented; you must not claim that you wrote the original software. If you use this software in a product, an acknowledgment in the product documentation would be appreciated but is not required.
 * 2. Altered source versions must be plainly marked as such, and must not be misrepresented as being the original software.
 * 3. This notice may not be removed or altered from any source distribution.
*/

#include <Poco/Environment.h>
#include <Poco/Format.h>
#include <Poco/String.h>
#include "platform.h"
#include "speech_error.h"
using namespace std;

platform_profile select_platform_profile(const string& platform) {
	platform_profile p;
	if (platform == SAYX_PLATFORM_MACOS) {
		p.command = "say";
		p.base_rate = 175;
		p.supports_export = true;
	} else if (platform == SAYX_PLATFORM_LINUX) {
		p.command = "festival";
		p.base_rate = 100;
	} else if (platform == SAYX_PLATFORM_WIN32) {
		p.command = "powershell";
		p.base_rate = 0; // unsupported
	} else throw UnsupportedPlatformException(Poco::format("speech_controller: unsupported platform %s", platform));
	p.platform = platform;
	return p;
}

bool is_supported_platform(const string& platform) { return platform == SAYX_PLATFORM_MACOS || platform == SAYX_PLATFORM_LINUX || platform == SAYX_PLATFORM_WIN32; }

string host_platform() {
	#ifdef _WIN32
	return SAYX_PLATFORM_WIN32;
	#elif defined(__APPLE__)
	return SAYX_PLATFORM_MACOS;
	#elif defined(__linux__)
	return SAYX_PLATFORM_LINUX;
	#else
	return Poco::toLower(Poco::Environment::osName()); // Not one we drive, select_platform_profile will say so.
	#endif
}

const map<string, string>& speech_platforms() {
	static const map<string, string> platforms = {
		{"WIN32", SAYX_PLATFORM_WIN32},
		{"MACOS", SAYX_PLATFORM_MACOS},
		{"LINUX", SAYX_PLATFORM_LINUX}
	};
	return platforms;
}
