/* speech_script.h - builds the command line and piped payload that each platform's speech command expects
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
#include <vector>
#include "child_process.h"
#include "platform.h"

#define SAYX_DEFAULT_EXPORT_FORMAT "LEF32@32000"

extern const char* const g_powershell_speech_script;

struct speech_invocation {
	std::string command;
	std::vector<std::string> args;
	std::string input; // Written to the child's stdin which is then closed. Empty means nothing is piped.
	process_launch_options options;
};

// Voice is ignored when empty and speed when 0, matching what callers pass for "not given".
speech_invocation build_speak_invocation(const platform_profile& profile, const std::string& text, const std::string& voice, double speed);
// Only meaningful for profiles that support export, callers check first.
speech_invocation build_export_invocation(const platform_profile& profile, const std::string& text, const std::string& voice, double speed, const std::string& filename, const std::string& data_format = SAYX_DEFAULT_EXPORT_FORMAT);
int convert_speed(const platform_profile& profile, double speed);
std::string festival_string(const std::string& text);
std::string ascii_decode(const std::string& data);
