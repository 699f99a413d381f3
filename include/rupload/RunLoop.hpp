#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <chrono>
#include <cmath>
#include <queue>

#include "Timer.hpp"

namespace rupload {

// Single-threaded cooperative event loop. Everything the upload engine does
// (socket I/O, progress, retry timers, observer notifications) happens in
// callbacks dispatched from run() on one thread.
class RunLoop {
public:
	static const size_t NUM_CONDITIONS = 3;

	enum Condition { READABLE, WRITABLE, EXCEPTION };
	using Action = std::function<void(RunLoop *sender, int fd, Condition cond)>;

	RunLoop();
	virtual ~RunLoop() {}

	RunLoop(const RunLoop&) = delete;

	virtual void registerDescriptor(int fd, Condition cond, const Action &action) = 0;
	virtual void registerDescriptor(int fd, Condition cond, const Task &task);
	virtual void unregisterDescriptor(int fd, Condition cond) = 0;
	virtual void unregisterDescriptor(int fd); // unregister any actions for fd

	std::shared_ptr<Timer> schedule(const Timer::Action &action, Time when, Duration recurInterval = 0);
	std::shared_ptr<Timer> scheduleRel(const Timer::Action &action, Duration delta, Duration recurInterval = 0);

	virtual void doLater(const Task &task);

	// Run until stop() or for at most runInterval seconds.
	virtual void run(Duration runInterval = INFINITY) = 0;
	virtual void stop();

	virtual Time getCurrentTime() const;
	virtual Time getCurrentTimeNoCache() const;

	virtual void clear();

	// called every time through the run loop
	Task onEveryCycle;

protected:
	void cacheTime();
	void uncacheTime();

	virtual bool hasDoLaters() const;
	virtual void processDoLaters();

	std::chrono::steady_clock::time_point m_origin;
	Time             m_timeCache;
	bool             m_timeIsCached;
	TimerList        m_timers;
	bool             m_stopping;
	std::queue<Task> m_doLaters;
};

} // namespace rupload
