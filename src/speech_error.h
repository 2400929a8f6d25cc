/* speech_error.h - status values, exceptions and the one-shot callback guard used by the speech controller
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
#include <memory>
#include <atomic>
#include <functional>
#include <Poco/Exception.h>

POCO_DECLARE_EXCEPTION(, UnsupportedPlatformException, Poco::Exception)

enum speech_error_code {
	SPEECH_OK,
	SPEECH_UNSUPPORTED_PLATFORM,
	SPEECH_MISSING_TEXT,
	SPEECH_MISSING_FILENAME,
	SPEECH_PROCESS_STDERR,
	SPEECH_PROCESS_FAILED,
	SPEECH_NO_ACTIVE_SPEECH,
	SPEECH_BUSY,
	SPEECH_LAUNCH_FAILED
};
const char* speech_error_name(speech_error_code code);

// What a speech operation hands to its callback. Evaluates to true when it carries an error, so callers can write if (status) handle_failure(status);
struct speech_status {
	speech_error_code code;
	std::string message;
	bool has_exit_code; // False when the child was terminated by a signal.
	int exit_code;
	int signal;
	speech_status() : code(SPEECH_OK), has_exit_code(false), exit_code(0), signal(0) {}
	speech_status(speech_error_code c, const std::string& msg) : code(c), message(msg), has_exit_code(false), exit_code(0), signal(0) {}
	bool ok() const { return code == SPEECH_OK; }
	explicit operator bool() const { return code != SPEECH_OK; }
	std::string to_string() const;
	static speech_status success() { return speech_status(); }
	static speech_status process_failed(const std::string& operation, bool has_code, int code, int signal);
};

typedef std::function<void(const speech_status&)> speech_callback;

// Wraps a callback so that it runs at most once no matter how many copies of the wrapper are invoked. A stderr chunk and the exit notification of the same child both hold a copy.
class once_callback {
	struct state {
		std::atomic<bool> fired{false};
		speech_callback callback;
	};
	std::shared_ptr<state> st;
public:
	once_callback(const speech_callback& callback = nullptr);
	bool operator()(const speech_status& status) const; // Returns false if the callback already ran.
	bool fired() const { return st->fired.load(); }
};
