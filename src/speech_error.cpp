/* speech_error.cpp - status values, exceptions and the one-shot callback guard used by the speech controller
 *
 * SAYX - system speech command facade
 * Copyright (c) 2022-2025 Sam Tupy
 * This software is provided "as-is", without any express or implied warranty. In no event will the authors be held liable for any damages arising from the use of this software.
 * Permission is granted to anyone to use this software for any purpose, including commercial applications, and to alter it and redistribute it freely, subject to the following restrictions:
 * 1. The origin of this software must not be misrepresented; you must not claim that you wrote the original software. If you use this software in a product, an acknowledgment in the product documentation would be appreciated but is not required.
 * 2. Altered source versions must be plainly marked as such, and must not be misrepresented as being the original software.
 * 3. This notice may not be removed or altered from any source distribution.
*/

#include <typeinfo>
#include <Poco/Format.h>
#include "speech_error.h"

POCO_IMPLEMENT_EXCEPTION(UnsupportedPlatformException, Poco::Exception, "Unsupported platform")

const char* speech_error_name(speech_error_code code) {
	switch (code) {
		case SPEECH_OK: return "ok";
		case SPEECH_UNSUPPORTED_PLATFORM: return "unsupported platform";
		case SPEECH_MISSING_TEXT: return "missing text";
		case SPEECH_MISSING_FILENAME: return "missing filename";
		case SPEECH_PROCESS_STDERR: return "process stderr";
		case SPEECH_PROCESS_FAILED: return "process failed";
		case SPEECH_NO_ACTIVE_SPEECH: return "no active speech";
		case SPEECH_BUSY: return "busy";
		case SPEECH_LAUNCH_FAILED: return "launch failed";
	}
	return "unknown";
}

std::string speech_status::to_string() const {
	if (message.empty()) return speech_error_name(code);
	return Poco::format("%s: %s", std::string(speech_error_name(code)), message);
}

speech_status speech_status::process_failed(const std::string& operation, bool has_code, int code, int signal) {
	std::string code_str = has_code? std::to_string(code) : "null";
	std::string signal_str = signal? std::to_string(signal) : "null";
	speech_status s(SPEECH_PROCESS_FAILED, Poco::format("%s: could not talk, had an error [code: %s] [signal: %s]", operation, code_str, signal_str));
	s.has_exit_code = has_code;
	s.exit_code = code;
	s.signal = signal;
	return s;
}

once_callback::once_callback(const speech_callback& callback) : st(std::make_shared<state>()) { st->callback = callback; }
bool once_callback::operator()(const speech_status& status) const {
	if (st->fired.exchange(true)) return false;
	if (st->callback) st->callback(status);
	return true;
}
