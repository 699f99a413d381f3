// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include "../include/rupload/RunLoop.hpp"

namespace rupload {

RunLoop::RunLoop() :
	m_origin(std::chrono::steady_clock::now()),
	m_timeCache(0),
	m_timeIsCached(false),
	m_stopping(false)
{
}

void RunLoop::registerDescriptor(int fd, Condition cond, const Task &task)
{
	registerDescriptor(fd, cond, [task] (RunLoop *, int, Condition) { if(task) task(); });
}

void RunLoop::unregisterDescriptor(int fd)
{
	unregisterDescriptor(fd, READABLE);
	unregisterDescriptor(fd, WRITABLE);
	unregisterDescriptor(fd, EXCEPTION);
}

std::shared_ptr<Timer> RunLoop::schedule(const Timer::Action &action, Time when, Duration recurInterval)
{
	return m_timers.schedule(action, when, recurInterval);
}

std::shared_ptr<Timer> RunLoop::scheduleRel(const Timer::Action &action, Duration delta, Duration recurInterval)
{
	return schedule(action, getCurrentTime() + delta, recurInterval);
}

void RunLoop::doLater(const Task &task)
{
	m_doLaters.push(task);
}

void RunLoop::stop()
{
	m_stopping = true;
}

Time RunLoop::getCurrentTime() const
{
	return m_timeIsCached ? m_timeCache : getCurrentTimeNoCache();
}

Time RunLoop::getCurrentTimeNoCache() const
{
	using namespace std::chrono;
	return duration_cast<duration<Time>>(steady_clock::now() - m_origin).count();
}

void RunLoop::cacheTime()
{
	m_timeCache = getCurrentTimeNoCache();
	m_timeIsCached = true;
}

void RunLoop::uncacheTime()
{
	m_timeIsCached = false;
}

bool RunLoop::hasDoLaters() const
{
	return not m_doLaters.empty();
}

void RunLoop::processDoLaters()
{
	// tasks queued while draining run on the next cycle, so a task that
	// re-queues itself can't starve descriptors and timers.
	size_t count = m_doLaters.size();
	while((not m_stopping) and count--)
	{
		Task task = m_doLaters.front();
		m_doLaters.pop();
		if(task)
			task();
	}
}

void RunLoop::clear()
{
	m_timers.clear();

	while(hasDoLaters()) // std::queue doesn't have a clear
		m_doLaters.pop();
}

} // namespace rupload
