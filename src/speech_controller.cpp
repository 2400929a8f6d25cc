/* speech_controller.cpp - cross platform system speech command controller
 *
 * SAYX - system speech command facade
 * Copyright (c) 2022-2025 Sam Tupy
 * This software is provided "as-is", without any express or implied warranty. In no event will the authors be held liable for any damages arising from the use of this software.
 * Permission is granted to anyone to use this software for any purpose, including commercial applications, and to alter it and redistribute it freely, subject to the following restrictions:
 * 1. The origin of this software must not be misrepresented; you must not claim that you wrote the original software. If you use this software in a product, an acknowledgment in the product documentation would be appreciated but is not required.
 * 2. Altered source versions must be plainly marked as such, and must not be misrepresented as being the original software.
 * 3. This notice may not be removed or altered from any source distribution.
*/

#include <algorithm>
#include <Poco/Exception.h>
#include <Poco/Format.h>
#include <Poco/Logger.h>
#include "process.h"
#include "speech_controller.h"
using namespace std;

speech_controller::speech_controller(shared_ptr<event_loop> loop, shared_ptr<process_launcher> launcher, const speech_options& options) : loop(loop), launcher(launcher), options(options), active(make_shared<active_slot>()), logger(Poco::Logger::get("sayx.speech")) {
	set_platform(options.platform.empty()? host_platform() : options.platform);
}
speech_controller::speech_controller(shared_ptr<event_loop> loop, shared_ptr<process_launcher> launcher, const string& platform) : loop(loop), launcher(launcher), active(make_shared<active_slot>()), logger(Poco::Logger::get("sayx.speech")) {
	set_platform(platform);
}

void speech_controller::set_platform(const string& platform) {
	platform_profile p = select_platform_profile(platform);
	auto it = options.commands.find(platform);
	if (it != options.commands.end()) p.command = it->second;
	current = p;
	poco_debug(logger, Poco::format("Platform set to %s, command %s, base rate %d", current.platform, current.command, current.base_rate));
}

int speech_controller::convert_speed(double speed) const { return ::convert_speed(current, speed); }

void speech_controller::defer(const once_callback& callback, const speech_status& status) {
	loop->post([callback, status]() { callback(status); });
}

void speech_controller::launch(const string& operation, const speech_invocation& invocation, const once_callback& callback) {
	if (active->process) {
		defer(callback, speech_status(SPEECH_BUSY, Poco::format("%s: process %ld is still speaking", operation, active->process->pid())));
		return;
	}
	weak_ptr<active_slot> slot = active;
	shared_ptr<weak_ptr<child_process>> self = make_shared<weak_ptr<child_process>>();
	bool strict = options.strict_stderr;
	Poco::Logger* log = &logger;
	process_events events;
	events.on_stderr = [callback, strict, operation, log](const string& data) {
		string text = ascii_decode(data);
		log->warning(Poco::format("%s: speech command wrote to stderr: %s", operation, text));
		if (strict) callback(speech_status(SPEECH_PROCESS_STDERR, text));
	};
	events.on_exit = [callback, slot, self, operation, log](const process_exit& result) {
		shared_ptr<active_slot> s = slot.lock();
		shared_ptr<child_process> proc = self->lock();
		if (s && proc) {
			if (s->process == proc) s->process.reset();
			else s->stopping.erase(remove(s->stopping.begin(), s->stopping.end(), proc), s->stopping.end());
		}
		if (result.succeeded()) {
			callback(speech_status::success());
			return;
		}
		speech_status status = speech_status::process_failed(operation, result.has_code, result.code, result.signal);
		log->warning(status.message);
		callback(status);
	};
	shared_ptr<child_process> proc;
	try {
		proc = launcher->launch(invocation.command, invocation.args, invocation.options, events);
	} catch (const Poco::Exception& e) {
		logger.error(Poco::format("%s: could not launch %s: %s", operation, invocation.command, e.displayText()));
		defer(callback, speech_status(SPEECH_LAUNCH_FAILED, e.displayText()));
		return;
	}
	*self = proc;
	active->process = proc;
	poco_debug(logger, Poco::format("%s: launched %s as process %ld", operation, invocation.command, proc->pid()));
	if (!invocation.input.empty()) {
		proc->write_input(invocation.input);
		proc->close_input();
	}
}

void speech_controller::speak(const string& text, const string& voice, double speed, const speech_callback& callback) {
	once_callback done(callback);
	if (text.empty()) {
		defer(done, speech_status(SPEECH_MISSING_TEXT, "speak: must provide text parameter"));
		return;
	}
	launch("speak", build_speak_invocation(current, text, voice, speed), done);
}

void speech_controller::export_to_file(const string& text, const string& voice, double speed, const string& filename, const speech_callback& callback) {
	once_callback done(callback);
	if (text.empty()) {
		defer(done, speech_status(SPEECH_MISSING_TEXT, "export_to_file: must provide text parameter"));
		return;
	}
	if (filename.empty()) {
		defer(done, speech_status(SPEECH_MISSING_FILENAME, "export_to_file: must provide filename parameter"));
		return;
	}
	if (!current.supports_export) {
		defer(done, speech_status(SPEECH_UNSUPPORTED_PLATFORM, Poco::format("export_to_file: does not support platform %s", current.platform)));
		return;
	}
	launch("export_to_file", build_export_invocation(current, text, voice, speed, filename, options.export_data_format), done);
}

void speech_controller::stop(const speech_callback& callback) {
	once_callback done(callback);
	shared_ptr<child_process> proc = active->process;
	if (!proc) {
		defer(done, speech_status(SPEECH_NO_ACTIVE_SPEECH, "stop: no speech to kill"));
		return;
	}
	if (current.platform == SAYX_PLATFORM_LINUX) proc->terminate(TERMINATE_PROCESS_GROUP); // festival, its shell and the player all share the group.
	else if (current.platform == SAYX_PLATFORM_WIN32) {
		proc->pause_input();
		proc->terminate(TERMINATE_PROCESS_TREE);
	} else {
		proc->pause_input();
		proc->terminate(TERMINATE_PROCESS);
	}
	// Kept until its exit arrives so that dropping the handle never waits on the child.
	active->stopping.push_back(proc);
	active->process.reset();
	defer(done, speech_status::success());
}

unique_ptr<speech_controller> create_speech_controller(shared_ptr<event_loop> loop, const speech_options& options) {
	return make_unique<speech_controller>(loop, make_shared<system_process_launcher>(loop), options);
}
