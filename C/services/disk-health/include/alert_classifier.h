#ifndef _ALERT_CLASSIFIER_H
#define _ALERT_CLASSIFIER_H
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
#include <normalized_record.h>

/**
 * The alert thresholds. A reading strictly greater than the
 * threshold is a breach.
 */
struct AlertThresholds
{
	AlertThresholds() : grownDefects(10), pendingSectors(3),
			reallocatedSectors(10), lifetimeUsed(80) {};
	long long	grownDefects;
	long long	pendingSectors;
	long long	reallocatedSectors;
	long long	lifetimeUsed;
};

/**
 * The event published for a device each cycle
 */
class AlertEvent
{
	public:
		enum class Severity
		{
			INFO,
			WARNING,
			CRITICAL
		};

		AlertEvent() : severity(Severity::INFO), eventType("health") {};

		std::string			nodeName;
		std::string			instanceId;
		std::string			device;
		Severity			severity;
		std::string			eventType;
		std::string			message;
		std::map<std::string, std::string>
						details;

		void				escalate(Severity to, const std::string& type);
		std::string			severityName() const;
		std::string			toJSON() const;
};

/**
 * Compares a normalized record against the alert thresholds
 */
class AlertClassifier
{
	public:
		AlertClassifier(const AlertThresholds& thresholds) : m_thresholds(thresholds) {};

		AlertEvent		classify(const NormalizedRecord& record) const;

	private:
		AlertThresholds		m_thresholds;
};

#endif
