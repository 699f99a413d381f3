// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <algorithm>

#include "../include/rupload/Timer.hpp"

namespace rupload {

// --- Timer

Timer::Timer(Time when, Duration recurInterval) :
	m_when(when),
	m_timerList(nullptr),
	m_canceled(false),
	m_rescheduled(false),
	m_firing(false)
{
	setRecurInterval(recurInterval);
}

bool Timer::isDue(Time now) const
{
	return m_when <= now;
}

Time Timer::getNextFireTime() const
{
	return m_when;
}

void Timer::setNextFireTime(Time when)
{
	if(isCanceled())
		return;

	if(m_timerList and not m_firing)
	{
		std::shared_ptr<Timer> myself = shared_from_this();
		TimerList *timerList = m_timerList;
		timerList->removeTimer(myself);
		m_when = when;
		timerList->addTimer(myself);
	}
	else
		m_when = when;

	m_rescheduled = true;
}

Duration Timer::getRecurInterval() const
{
	return m_recurInterval;
}

void Timer::setRecurInterval(Duration interval)
{
	if((interval > 0) and (interval < MIN_RECUR_INTERVAL))
		interval = MIN_RECUR_INTERVAL;
	m_recurInterval = interval;
}

bool Timer::doesRecur() const
{
	return (m_recurInterval > 0.0) and not isCanceled();
}

void Timer::cancel()
{
	m_canceled = true;
	if(not m_firing)
		action = nullptr; // break any circular references through captures

	if(m_timerList)
	{
		TimerList *timerList = m_timerList;
		m_timerList = nullptr;
		timerList->removeTimer(shared_from_this());
	}
}

bool Timer::isCanceled() const
{
	return m_canceled;
}

bool Timer::operator< (const Timer &rhs) const
{
	if(m_when == rhs.m_when)
		return this < &rhs;
	return m_when < rhs.m_when;
}

void Timer::setTimerList(TimerList *timerList)
{
	m_timerList = timerList;
}

Timer::Action Timer::makeAction(const std::function<void(Time now)> &fn)
{
	return [=] (const std::shared_ptr<Timer> &, Time now) { fn(now); };
}

Timer::Action Timer::makeAction(const Task &fn)
{
	return [=] (const std::shared_ptr<Timer> &, Time) { fn(); };
}

void Timer::basicFire(Time now)
{
	if(isCanceled())
		return;

	std::shared_ptr<Timer> myself = shared_from_this();
	TimerList *timerList = m_timerList;

	m_rescheduled = false;

	m_firing = true;
	if(action)
		action(myself, now);
	m_firing = false;

	if(isCanceled())
	{
		action = nullptr;
		return;
	}

	if(doesRecur() or m_rescheduled)
	{
		// we were removed from the list before firing, so it's safe to change our sort key.
		if(not m_rescheduled)
			m_when = std::max(m_when + m_recurInterval, now);
		if(timerList)
			timerList->addTimer(myself);
	}
	else
	{
		m_timerList = nullptr; // not in the list anymore
		cancel();
	}
}

// --- TimerList

TimerList::TimerList()
{ }

TimerList::~TimerList()
{
	// cancel all timers in the list to clear potential circular references
	while(not m_timers.empty())
	{
		auto it = m_timers.begin();
		auto each = *it;
		m_timers.erase(it);
		each->setTimerList(nullptr);
		each->cancel();
	}
}

std::shared_ptr<Timer> TimerList::schedule(Time when, Duration recurInterval)
{
	auto rv = std::make_shared<Timer>(when, recurInterval);
	addTimer(rv);
	return rv;
}

std::shared_ptr<Timer> TimerList::schedule(const Timer::Action &action, Time when, Duration recurInterval)
{
	auto rv = schedule(when, recurInterval);
	rv->action = action;
	return rv;
}

Duration TimerList::howLongToNextFire(Time now, Duration maxInterval) const
{
	if(m_timers.empty())
		return maxInterval;

	return std::max(Duration(0), std::min(maxInterval, (*m_timers.begin())->getNextFireTime() - now));
}

size_t TimerList::fireDueTimers(Time now)
{
	size_t rv = 0;

	while(not m_timers.empty())
	{
		auto it = m_timers.begin();
		std::shared_ptr<Timer> each = *it;

		if(not each->isDue(now))
			break;

		m_timers.erase(it);

		each->basicFire(now);
		rv++;
	}

	return rv;
}

void TimerList::addTimer(const std::shared_ptr<Timer> &timer)
{
	if((not timer) or timer->isCanceled())
		return;

	timer->setTimerList(this);
	m_timers.insert(timer);
}

void TimerList::removeTimer(const std::shared_ptr<Timer> &timer)
{
	if(not timer)
		return;

	m_timers.erase(timer);
}

size_t TimerList::size() const
{
	return m_timers.size();
}

void TimerList::clear()
{
	while(not m_timers.empty())
	{
		auto each = *m_timers.begin();
		m_timers.erase(m_timers.begin());
		each->setTimerList(nullptr);
		each->cancel();
	}
}

} // namespace rupload
