/* platform.h - platform identifiers and the speech command profile bound to each of them
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

#define SAYX_PLATFORM_MACOS "darwin"
#define SAYX_PLATFORM_LINUX "linux"
#define SAYX_PLATFORM_WIN32 "win32"

struct platform_profile {
	std::string platform;
	std::string command;
	int base_rate; // Words per minute at speed 1.0, 0 where the command has no rate control we drive.
	bool supports_export;
	platform_profile() : base_rate(0), supports_export(false) {}
};

// Throws UnsupportedPlatformException for anything but the three identifiers above.
platform_profile select_platform_profile(const std::string& platform);
bool is_supported_platform(const std::string& platform);
std::string host_platform();
// {"WIN32": "win32", "MACOS": "darwin", "LINUX": "linux"}, for callers that branch on capability.
const std::map<std::string, std::string>& speech_platforms();
