/* child_process.h - interface between the speech controller and the operating system's process facilities
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
#include <functional>

enum termination_mode {
	TERMINATE_PROCESS, // Default termination signal to the child alone.
	TERMINATE_PROCESS_GROUP, // The child was launched as a group leader, signal everything in its group.
	TERMINATE_PROCESS_TREE // Forceful kill of the child and every descendant.
};

struct process_launch_options {
	bool shell; // Run the command line through the system shell.
	bool new_process_group; // Make the child the leader of a fresh process group so the whole group can be terminated.
	process_launch_options() : shell(false), new_process_group(false) {}
};

struct process_exit {
	bool has_code;
	int code;
	int signal;
	process_exit() : has_code(false), code(0), signal(0) {}
	process_exit(int c) : has_code(true), code(c), signal(0) {}
	bool succeeded() const { return has_code && code == 0 && signal == 0; }
	static process_exit signalled(int sig) { process_exit e; e.signal = sig; return e; }
};

// Launchers must deliver these on the owning event_loop's thread, never from inside launch().
struct process_events {
	std::function<void(const std::string& data)> on_stderr; // First chunk written to the child's error stream.
	std::function<void(const process_exit& exit)> on_exit;
};

class child_process {
public:
	virtual ~child_process() = default;
	virtual long pid() const = 0;
	virtual void write_input(const std::string& data) = 0;
	virtual void close_input() = 0;
	virtual void pause_input() = 0;
	// Fire and forget, failures are logged by the implementation.
	virtual void terminate(termination_mode mode) = 0;
};

class process_launcher {
public:
	virtual ~process_launcher() = default;
	// Throws Poco::Exception if the command cannot be started.
	virtual std::shared_ptr<child_process> launch(const std::string& command, const std::vector<std::string>& args, const process_launch_options& options, const process_events& events) = 0;
};
