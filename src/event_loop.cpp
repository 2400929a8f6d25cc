/* event_loop.cpp - single threaded task dispatcher that speech callbacks are delivered on
 *
 * SAYX - system speech command facade
 * Copyright (c) 2022-2025 Sam Tupy
 * This software is provided "as-is", without any express or implied warranty. In no event will the authors be held liable for any damages arising from the use of this software.
 * Permission is granted to anyone to use this software for any purpose, including commercial applications, and to alter it and redistribute it freely, subject to the following restrictions:
 * 1. The origin of this software must not be misrepresented; you must not claim that you wrote the original software. If you use this software in a product, an acknowledgment in the product documentation would be appreciated but is not required.
 * 2. Altered source versions must be plainly marked as such, and must not be misrepresented as being the original software.
 * 3. This notice may not be removed or altered from any source distribution.
*/

#include <Poco/AutoPtr.h>
#include "event_loop.h"

void event_loop::post(const task& t) { queue.enqueueNotification(new task_notification(t)); }

bool event_loop::dispatch(Poco::Notification* n) {
	Poco::AutoPtr<Poco::Notification> owned(n); // dequeue hands us a reference.
	if (!owned) return false;
	task_notification* tn = dynamic_cast<task_notification*>(owned.get());
	if (tn && tn->fn) tn->fn();
	return true;
}

size_t event_loop::run_pending() {
	size_t count = 0;
	while (dispatch(queue.dequeueNotification())) count++;
	return count;
}

bool event_loop::run_one(long timeout_ms) { return dispatch(queue.waitDequeueNotification(timeout_ms)); }

void event_loop::run() {
	while (has_work()) run_one(50);
}
