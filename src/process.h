/* process.h - Poco based child process launcher used to run the system speech commands
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
#include <memory>
#include <Poco/Mutex.h>
#include <Poco/Pipe.h>
#include <Poco/PipeStream.h>
#include <Poco/Process.h>
#include <Poco/Thread.h>
#include "child_process.h"
#include "event_loop.h"

class process : public child_process {
	// Shared with the watcher thread, which outlives neither this object nor the pipes it reads.
	struct watch_state {
		Poco::Pipe in_pipe;
		Poco::Pipe err_pipe;
		std::unique_ptr<Poco::ProcessHandle> handle;
		Poco::FastMutex exit_mtx;
		bool exited = false;
	};
	std::shared_ptr<watch_state> state;
	std::unique_ptr<Poco::PipeOutputStream> input;
	bool input_paused;
	bool terminate_requested;
	process_launch_options options;
	Poco::Thread watcher;
	static void watch(std::shared_ptr<watch_state> state, std::shared_ptr<event_loop> loop, process_events events);
public:
	process(const std::string& command, const std::vector<std::string>& args, const process_launch_options& options, std::shared_ptr<event_loop> loop, const process_events& events);
	~process();
	long pid() const override;
	bool is_running() const;
	void write_input(const std::string& data) override;
	void close_input() override;
	void pause_input() override;
	void terminate(termination_mode mode) override;

	process(const process&) = delete;
	process& operator=(const process&) = delete;
};

class system_process_launcher : public process_launcher {
	std::shared_ptr<event_loop> loop;
public:
	system_process_launcher(std::shared_ptr<event_loop> loop);
	std::shared_ptr<child_process> launch(const std::string& command, const std::vector<std::string>& args, const process_launch_options& options, const process_events& events) override;
};

// Exposed for tests, turns a shell request into the actual command and argument vector for this OS.
void wrap_process_command(const std::string& command, const std::vector<std::string>& args, const process_launch_options& options, std::string& out_command, std::vector<std::string>& out_args);
// What a dropped process uses to take its child down along with whatever that child spawned.
termination_mode default_termination_mode(const process_launch_options& options);
// Poco reports death by signal as 256 + signal number on POSIX.
process_exit decode_exit_code(int code);
