/* event_loop.h - single threaded task dispatcher that speech callbacks are delivered on
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
#include <atomic>
#include <functional>
#include <Poco/Notification.h>
#include <Poco/NotificationQueue.h>

// Any thread may post, but tasks only ever run on whichever thread calls one of the run methods. Work sources such as process watchers hold the loop while they have events left to deliver so that run() knows when to return.
class event_loop {
public:
	typedef std::function<void()> task;
private:
	class task_notification : public Poco::Notification {
	public:
		task fn;
		task_notification(const task& t) : fn(t) {}
	};
	Poco::NotificationQueue queue;
	std::atomic<int> holds;
	bool dispatch(Poco::Notification* n);
public:
	event_loop() : holds(0) {}
	void post(const task& t);
	void hold() { holds++; }
	void release() { holds--; }
	int pending() const { return queue.size(); }
	bool has_work() const { return holds.load() > 0 || !queue.empty(); }
	size_t run_pending(); // Runs queued tasks, including ones posted while running, without waiting.
	bool run_one(long timeout_ms); // Waits up to timeout_ms for a task and runs it.
	void run(); // Returns once nothing is queued and no work source holds the loop.
};
