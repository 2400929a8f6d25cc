/* speech_controller.h - header for the cross platform system speech command controller
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
#include <vector>
#include "child_process.h"
#include "event_loop.h"
#include "platform.h"
#include "speech_config.h"
#include "speech_error.h"
#include "speech_script.h"

namespace Poco { class Logger; }

// Drives the operating system's own speech command: say on macOS, festival on Linux and powershell with System.Speech on Windows.
// Every operation returns immediately and reports through its callback exactly once, always from a later dispatch of the event_loop and never from inside the call itself. At most one utterance runs at a time, a second speak or export while one is active reports SPEECH_BUSY.
class speech_controller {
	struct active_slot {
		std::shared_ptr<child_process> process;
		std::vector<std::shared_ptr<child_process>> stopping; // Terminated by stop() but not yet exited.
	};
	std::shared_ptr<event_loop> loop;
	std::shared_ptr<process_launcher> launcher;
	speech_options options;
	platform_profile current;
	std::shared_ptr<active_slot> active;
	Poco::Logger& logger;
	void defer(const once_callback& callback, const speech_status& status);
	void launch(const std::string& operation, const speech_invocation& invocation, const once_callback& callback);
public:
	// Throws UnsupportedPlatformException if the configured or host platform is not one we can drive.
	speech_controller(std::shared_ptr<event_loop> loop, std::shared_ptr<process_launcher> launcher, const speech_options& options = speech_options());
	speech_controller(std::shared_ptr<event_loop> loop, std::shared_ptr<process_launcher> launcher, const std::string& platform);
	// Override the platform, for example to build another OS's invocation. Throws UnsupportedPlatformException and leaves the current profile untouched on failure.
	void set_platform(const std::string& platform);
	const platform_profile& profile() const { return current; }
	const std::string& platform() const { return current.platform; }
	// Empty voice means the command's default voice, a speed of 0 means the default rate. Speed is a factor, 1.0 is normal, 0.5 half and 2.0 double.
	void speak(const std::string& text, const std::string& voice = "", double speed = 0, const speech_callback& callback = nullptr);
	// macOS only, everywhere else reports SPEECH_UNSUPPORTED_PLATFORM.
	void export_to_file(const std::string& text, const std::string& voice, double speed, const std::string& filename, const speech_callback& callback = nullptr);
	void stop(const speech_callback& callback = nullptr);
	int convert_speed(double speed) const;
	bool is_speaking() const { return active->process != nullptr; }
};

// Convenience for callers without their own launcher, the controller runs real processes through Poco.
std::unique_ptr<speech_controller> create_speech_controller(std::shared_ptr<event_loop> loop, const speech_options& options = speech_options());
