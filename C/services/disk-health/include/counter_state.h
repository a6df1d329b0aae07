#ifndef _COUNTER_STATE_H
#define _COUNTER_STATE_H
/*
 * Disk health service.
 *
 * Copyright (c) 2024 Dianomic Systems
 *
 * Released under the Apache 2.0 Licence
 *
 * Author: Mark Riddoch
 */
#include <string>
#include <map>
#include <mutex>

/**
 * The last cumulative value published for each counter of each
 * device. Used to turn the cumulative readings of a device into
 * increments of a monotonic counter.
 *
 * Entries are created on the first reading of a device and are
 * never removed.
 */
class CounterState
{
	public:
		CounterState() {};
		~CounterState() {};

		long long	reconcile(const std::string& device, const std::string& counter,
					  long long current);
		bool		previous(const std::string& device, const std::string& counter,
					 long long& value);

	private:
		std::mutex	m_mutex;
		std::map<std::string, std::map<std::string, long long> >
				m_previous;
};

#endif
