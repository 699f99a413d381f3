#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <functional>
#include <memory>
#include <set>

namespace rupload {

class TimerList;

using Time = long double; // A point in time, as seconds since an epoch.
using Duration = long double; // A period of time in seconds.
using Task = std::function<void(void)>;

template <class T> struct deref_less {
	bool operator() (const T& l, const T& r) const
	{
		if(r and not l)
			return true;
		if(not r)
			return false;
		return *l < *r;
	}
};

class Timer : public std::enable_shared_from_this<Timer> {
public:
	const Duration MIN_RECUR_INTERVAL = 0.001;

	Timer(Time when, Duration recurInterval);
	Timer() = delete;
	Timer(const Timer&) = delete;

	using Action = std::function<void(const std::shared_ptr<Timer> &sender, Time now)>;
	Action action;

	bool isDue(Time now) const;
	Time getNextFireTime() const;
	void setNextFireTime(Time when);

	Duration getRecurInterval() const;
	void     setRecurInterval(Duration interval);
	bool     doesRecur() const;

	// Cancel is idempotent, and safe to call from within this timer's own action.
	void cancel();
	bool isCanceled() const;

	static Action makeAction(const std::function<void(Time now)> &fn);
	static Action makeAction(const Task &fn);

	bool operator< (const Timer &rhs) const;

protected:
	friend class TimerList;

	void setTimerList(TimerList *timerList);
	void basicFire(Time now);

	Time       m_when;
	Duration   m_recurInterval;
	TimerList *m_timerList;
	bool       m_canceled    :1;
	bool       m_rescheduled :1; // to override recurInterval
	bool       m_firing      :1;
};

class TimerList {
public:
	TimerList();
	~TimerList();

	std::shared_ptr<Timer> schedule(Time when, Duration recurInterval = 0);
	std::shared_ptr<Timer> schedule(const Timer::Action &action, Time when, Duration recurInterval = 0);

	Duration howLongToNextFire(Time now, Duration maxInterval = 5) const;

	size_t fireDueTimers(Time now); // answer number of timers fired

	void addTimer(const std::shared_ptr<Timer> &timer);
	void removeTimer(const std::shared_ptr<Timer> &timer);

	size_t size() const;
	void clear();

protected:
	std::set<std::shared_ptr<Timer>, deref_less<std::shared_ptr<Timer> > > m_timers;
};

} // namespace rupload
