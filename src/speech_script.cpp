/* speech_script.cpp - builds the command line and piped payload that each platform's speech command expects
 * say takes everything as arguments, festival reads a scheme script from stdin and the windows path has powershell drive System.Speech with the utterance on stdin.
 *
 * SAYX - system speech command facade
 * Copyright (c) 2022-2025 Sam Tupy
 * This software is provided "as-is", without any express or implied warranty. In no event will the authors be held liable for any damages arising from the use of this software.
 * Permission is granted to anyone to use this software for any purpose, including commercial applications, and to alter it and redistribute it freely, subject to the following restrictions:
 * 1. The origin of this software must not be misrepresented; you must not claim that you wrote the original software. If you use this software in a product, an acknowledgment in the product documentation would be appreciated but is not required.
 * 2. Altered source versions must be plainly marked as such, and must not be misrepresented as being the original software.
 * 3. This notice may not be removed or altered from any source distribution.
*/

#include <cmath>
#include <limits>
#include <Poco/Format.h>
#include "speech_script.h"
using namespace std;

const char* const g_powershell_speech_script = "Add-Type -AssemblyName System.speech; $speak = New-Object System.Speech.Synthesis.SpeechSynthesizer; [Console]::InputEncoding = [System.Text.Encoding]::UTF8; $speak.Speak([Console]::In.ReadToEnd())";

int convert_speed(const platform_profile& profile, double speed) {
	double rate = ceil(profile.base_rate * speed);
	if (!(rate < static_cast<double>(numeric_limits<int>::max()))) return numeric_limits<int>::max();
	if (rate <= static_cast<double>(numeric_limits<int>::min())) return numeric_limits<int>::min();
	return static_cast<int>(rate);
}

string festival_string(const string& text) {
	string out = "\"";
	for (char c : text) {
		if (c == '"' || c == '\\') out += '\\';
		out += c;
	}
	out += '"';
	return out;
}

string ascii_decode(const string& data) {
	string out(data);
	for (char& c : out) c = static_cast<char>(static_cast<unsigned char>(c) & 0x7f);
	return out;
}

static void add_say_args(const platform_profile& profile, speech_invocation& inv, const string& text, const string& voice, double speed) {
	if (!voice.empty()) {
		inv.args.push_back("-v");
		inv.args.push_back(voice);
	}
	inv.args.push_back(text);
	if (speed) {
		inv.args.push_back("-r");
		inv.args.push_back(to_string(convert_speed(profile, speed)));
	}
}

speech_invocation build_speak_invocation(const platform_profile& profile, const string& text, const string& voice, double speed) {
	speech_invocation inv;
	inv.command = profile.command;
	if (profile.platform == SAYX_PLATFORM_MACOS) add_say_args(profile, inv, text, voice, speed);
	else if (profile.platform == SAYX_PLATFORM_LINUX) {
		inv.args.push_back("--pipe");
		// festival plays through Audio_Command in a shell of its own, so the group is what stop has to reach.
		inv.options.new_process_group = true;
		if (speed) inv.input += Poco::format("(Parameter.set 'Audio_Command \"aplay -q -c 1 -t raw -f s16 -r $(($SR*%d/100)) $FILE\") ", convert_speed(profile, speed));
		if (!voice.empty()) inv.input += Poco::format("(%s) ", voice);
		inv.input += Poco::format("(SayText %s)", festival_string(text));
	} else if (profile.platform == SAYX_PLATFORM_WIN32) {
		inv.args.push_back(g_powershell_speech_script);
		inv.input = text;
		inv.options.shell = true;
	}
	return inv;
}

speech_invocation build_export_invocation(const platform_profile& profile, const string& text, const string& voice, double speed, const string& filename, const string& data_format) {
	speech_invocation inv;
	inv.command = profile.command;
	add_say_args(profile, inv, text, voice, speed);
	inv.args.push_back("-o");
	inv.args.push_back(filename);
	inv.args.push_back("--data-format=" + data_format);
	return inv;
}
