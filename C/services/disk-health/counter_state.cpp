/*
 * Disk health service.
 *
 * Copyright (c) 2024 Dianomic Systems
 *
 * Released under the Apache 2.0 Licence
 *
 * Author: Mark Riddoch
 */
#include <counter_state.h>
#include <logger.h>

using namespace std;

/**
 * Reconcile a new cumulative reading with the previous one.
 *
 * The first reading of a counter is added in full. A reading lower
 * than the previous one is taken to be a reset of the counter on the
 * device and is also added in full, so the published counter never
 * decreases. A transient misread is indistinguishable from a reset.
 *
 * @param device	The device the reading is for
 * @param counter	The name of the counter
 * @param current	The cumulative reading
 * @return		The amount to add to the published counter
 */
long long CounterState::reconcile(const string& device, const string& counter, long long current)
{
	lock_guard<mutex> guard(m_mutex);

	map<string, long long>& counters = m_previous[device];
	auto it = counters.find(counter);
	long long increment;
	if (it == counters.end())
	{
		increment = current;
	}
	else if (current >= it->second)
	{
		increment = current - it->second;
	}
	else
	{
		Logger::getLogger()->warn("Counter %s of %s went from %lld to %lld, assuming a reset",
				counter.c_str(), device.c_str(), it->second, current);
		increment = current;
	}
	counters[counter] = current;
	return increment < 0 ? 0 : increment;
}

/**
 * Return the last reading recorded for a counter
 */
bool CounterState::previous(const string& device, const string& counter, long long& value)
{
	lock_guard<mutex> guard(m_mutex);

	auto dev = m_previous.find(device);
	if (dev == m_previous.end())
		return false;
	auto it = dev->second.find(counter);
	if (it == dev->second.end())
		return false;
	value = it->second;
	return true;
}
