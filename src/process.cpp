/* process.cpp - Poco based child process launcher used to run the system speech commands
 * Each child gets a watcher thread that drains its error stream, waits for it to exit and posts both events back to the event_loop that owns the caller.
 *
 * SAYX - system speech command facade
 * Copyright (c) 2022-2025 Sam Tupy
 * This software is provided "as-is", without any express or implied warranty. In no event will the authors be held liable for any damages arising from the use of this software.
 * Permission is granted to anyone to use this software for any purpose, including commercial applications, and to alter it and redistribute it freely, subject to the following restrictions:
 * 1. The origin of this software must not be misrepresented; you must not claim that you wrote the original software. If you use this software in a product, an acknowledgment in the product documentation would be appreciated but is not required.
 * 2. Altered source versions must be plainly marked as such, and must not be misrepresented as being the original software.
 * 3. This notice may not be removed or altered from any source distribution.
*/

#include "process.h"
#include <Poco/Exception.h>
#include <Poco/Format.h>
#include <Poco/Logger.h>

#ifndef _WIN32
	#include <signal.h>
	#include <sys/types.h>
	#include <cerrno>
#endif

using namespace std;

static Poco::Logger& logger() { return Poco::Logger::get("sayx.process"); }

static string quote_shell_arg(const string& arg) {
	#ifdef _WIN32
	// cmd /s strips only the outer quotes Poco adds around the whole line, so anything quoted here would reach the program with its quotes escaped.
	return arg;
	#else
	string out = "'";
	for (char c : arg) {
		if (c == '\'') out += "'\\''";
		else out += c;
	}
	return out + "'";
	#endif
}

void wrap_process_command(const string& command, const vector<string>& args, const process_launch_options& options, string& out_command, vector<string>& out_args) {
	out_command = command;
	out_args = args;
	if (options.shell) {
		string line = command;
		for (const string& a : args) line += " " + quote_shell_arg(a);
		#ifdef _WIN32
		out_command = "cmd.exe";
		out_args = {"/d", "/s", "/c", line};
		#else
		out_command = "/bin/sh";
		out_args = {"-c", line};
		#endif
	}
	#ifndef _WIN32
	if (options.new_process_group) {
		// setsid execs in place when the caller is not already a group leader, so the pid we track is the leader of the new group.
		out_args.insert(out_args.begin(), out_command);
		out_command = "setsid";
	}
	#endif
}

termination_mode default_termination_mode(const process_launch_options& options) {
	#ifdef _WIN32
	if (options.shell) return TERMINATE_PROCESS_TREE; // The handle is cmd.exe, the program it runs holds our pipes.
	#endif
	if (options.new_process_group) return TERMINATE_PROCESS_GROUP;
	return TERMINATE_PROCESS;
}

process_exit decode_exit_code(int code) {
	#ifndef _WIN32
	if (code >= 256) return process_exit::signalled(code - 256);
	#endif
	return process_exit(code);
}

process::process(const string& command, const vector<string>& args, const process_launch_options& options, shared_ptr<event_loop> loop, const process_events& events) : state(make_shared<watch_state>()), input_paused(false), terminate_requested(false), options(options) {
	string launch_command;
	vector<string> launch_args;
	wrap_process_command(command, args, options, launch_command, launch_args);
	try {
		Poco::ProcessHandle handle = Poco::Process::launch(launch_command, launch_args, &state->in_pipe, nullptr, &state->err_pipe);
		state->handle = make_unique<Poco::ProcessHandle>(handle);
	} catch (const Poco::Exception& e) {
		logger().error(Poco::format("Failed to launch '%s': %s", launch_command, e.displayText()));
		state->in_pipe.close(Poco::Pipe::CLOSE_BOTH);
		state->err_pipe.close(Poco::Pipe::CLOSE_BOTH);
		throw;
	}
	input = make_unique<Poco::PipeOutputStream>(state->in_pipe);
	loop->hold();
	shared_ptr<watch_state> st = state;
	try {
		watcher.startFunc([st, loop, events]() { watch(st, loop, events); });
	} catch (const Poco::Exception& e) {
		logger().error(Poco::format("Could not start watcher for process %ld: %s", pid(), e.displayText()));
		loop->release();
		try {
			Poco::Process::kill(*state->handle);
		} catch (const Poco::Exception& kill_error) {
			logger().warning(Poco::format("Could not kill process %ld: %s", pid(), kill_error.displayText()));
		}
		input.reset();
		state->in_pipe.close(Poco::Pipe::CLOSE_BOTH);
		state->err_pipe.close(Poco::Pipe::CLOSE_BOTH);
		throw;
	}
}

process::~process() {
	if (is_running() && !terminate_requested) {
		logger().warning(Poco::format("Process %ld being destroyed while still running, terminating it.", pid()));
		terminate(default_termination_mode(options));
	}
	close_input();
	if (!watcher.isRunning()) return;
	if (!watcher.tryJoin(1000) && state->handle) {
		try {
			Poco::Process::kill(*state->handle);
		} catch (const Poco::Exception& e) {
			logger().warning(Poco::format("Could not kill process %ld: %s", pid(), e.displayText()));
		}
	}
	watcher.join();
}

void process::watch(shared_ptr<watch_state> state, shared_ptr<event_loop> loop, process_events events) {
	char buffer[1024];
	bool reported = false;
	try {
		int n;
		while ((n = state->err_pipe.readBytes(buffer, sizeof(buffer))) > 0) {
			if (reported) continue; // Keep draining so the child never blocks on a full pipe.
			reported = true;
			string chunk(buffer, n);
			if (events.on_stderr) loop->post([events, chunk]() { events.on_stderr(chunk); });
		}
	} catch (const Poco::Exception& e) {
		logger().warning(Poco::format("Reading stderr of process %ld failed: %s", static_cast<long>(state->handle->id()), e.displayText()));
	}
	process_exit result;
	try {
		result = decode_exit_code(Poco::Process::wait(*state->handle));
	} catch (const Poco::Exception& e) {
		logger().warning(Poco::format("Waiting for process %ld failed: %s", static_cast<long>(state->handle->id()), e.displayText()));
	}
	{
		Poco::FastMutex::ScopedLock lock(state->exit_mtx);
		state->exited = true;
	}
	if (events.on_exit) loop->post([events, result]() { events.on_exit(result); });
	loop->release();
}

long process::pid() const {
	if (!state->handle) return 0;
	return static_cast<long>(state->handle->id());
}

bool process::is_running() const {
	if (!state->handle) return false;
	Poco::FastMutex::ScopedLock lock(state->exit_mtx);
	return !state->exited;
}

void process::write_input(const string& data) {
	if (!input || input_paused) {
		logger().warning(Poco::format("Cannot write to process %ld, stdin is not available.", pid()));
		return;
	}
	*input << data;
	input->flush();
	if (!*input) logger().warning(Poco::format("Writing %z bytes to process %ld failed.", data.size(), pid()));
}

void process::close_input() {
	if (!input) return;
	try {
		input->close();
	} catch (const Poco::Exception& e) {
		logger().warning(Poco::format("Closing stdin of process %ld failed: %s", pid(), e.displayText()));
	}
	input.reset();
}

void process::pause_input() { input_paused = true; }

void process::terminate(termination_mode mode) {
	if (!is_running()) {
		poco_debug(logger(), Poco::format("Process %ld already exited, nothing to terminate.", pid()));
		return;
	}
	long id = pid();
	terminate_requested = true;
	try {
		#ifdef _WIN32
		if (mode == TERMINATE_PROCESS_TREE) {
			Poco::Process::Args args = {"/pid", to_string(id), "/T", "/F"};
			Poco::ProcessHandle killer = Poco::Process::launch("taskkill", args, nullptr, nullptr, nullptr);
			poco_debug(logger(), Poco::format("taskkill launched as %ld for process %ld", static_cast<long>(killer.id()), id));
		} else Poco::Process::kill(*state->handle);
		#else
		pid_t target = static_cast<pid_t>(id);
		int sig = SIGTERM;
		if (mode == TERMINATE_PROCESS_GROUP || (mode == TERMINATE_PROCESS_TREE && options.new_process_group)) target = -target;
		if (mode == TERMINATE_PROCESS_TREE) sig = SIGKILL;
		int rc = ::kill(target, sig);
		// Right after launch the child may not have reached setsid yet, in which case it is still alone and can be signalled directly.
		if (rc != 0 && errno == ESRCH && target < 0) rc = ::kill(-target, sig);
		if (rc != 0) throw Poco::SystemException(Poco::format("cannot signal %ld", static_cast<long>(target)), errno);
		#endif
	} catch (const Poco::Exception& e) {
		logger().warning(Poco::format("Could not terminate process %ld: %s", id, e.displayText()));
	}
}

system_process_launcher::system_process_launcher(shared_ptr<event_loop> loop) : loop(loop) {
	#ifndef _WIN32
	signal(SIGPIPE, SIG_IGN); // A speech command that exits before reading its script must not take us down with it.
	#endif
}

shared_ptr<child_process> system_process_launcher::launch(const string& command, const vector<string>& args, const process_launch_options& options, const process_events& events) {
	poco_debug(logger(), Poco::format("Launching %s with %z arguments", command, args.size()));
	return make_shared<process>(command, args, options, loop, events);
}
