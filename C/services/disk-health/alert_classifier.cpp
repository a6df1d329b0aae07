/*
 * Disk health service.
 *
 * Copyright (c) 2024 Dianomic Systems
 *
 * Released under the Apache 2.0 Licence
 *
 * Author: Mark Riddoch
 */
#include <alert_classifier.h>
#include <logger.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <stdio.h>

using namespace std;
using namespace rapidjson;

/**
 * Raise the severity of the event. The severity is never lowered.
 *
 * @param to	The severity of the condition found
 * @param type	The event type of the condition found
 */
void AlertEvent::escalate(Severity to, const string& type)
{
	if ((int)to >= (int)severity)
	{
		severity = to;
		eventType = type;
	}
}

string AlertEvent::severityName() const
{
	switch (severity)
	{
		case Severity::CRITICAL:
			return "critical";
		case Severity::WARNING:
			return "warning";
		default:
			return "info";
	}
}

/**
 * Serialise the event as the JSON message published on the bus
 */
string AlertEvent::toJSON() const
{
	StringBuffer buffer;
	Writer<StringBuffer> writer(buffer);

	writer.StartObject();
	writer.Key("node_name");
	writer.String(nodeName.c_str());
	writer.Key("instance_id");
	writer.String(instanceId.c_str());
	writer.Key("device");
	writer.String(device.c_str());
	writer.Key("event_type");
	writer.String(eventType.c_str());
	writer.Key("severity");
	writer.String(severityName().c_str());
	writer.Key("message");
	writer.String(message.c_str());
	writer.Key("details");
	writer.StartObject();
	for (auto it = details.cbegin(); it != details.cend(); ++it)
	{
		writer.Key(it->first.c_str());
		writer.String(it->second.c_str());
	}
	writer.EndObject();
	writer.EndObject();

	return buffer.GetString();
}

static string breachDetail(long long reading, long long threshold, bool percent)
{
	char buf[128];
	if (percent)
		snprintf(buf, sizeof(buf), "%lld%% (Warning: Exceeds threshold of %lld%%)", reading, threshold);
	else
		snprintf(buf, sizeof(buf), "%lld (Warning: Exceeds threshold of %lld)", reading, threshold);
	return buf;
}

/**
 * Classify a record.
 *
 * The checks are grown defects, pending sectors, reallocated sectors
 * and then SSD life used. The sector checks raise a warning health
 * alert, the life used check a critical lifetime alert. A breach
 * replaces the plain reading in the details with a description of
 * the breach. The message names the most severe breach found.
 *
 * @param record	The normalized record of a device
 * @return		The event to publish
 */
AlertEvent AlertClassifier::classify(const NormalizedRecord& record) const
{
	AlertEvent event;
	event.nodeName = record.nodeName;
	event.instanceId = record.instanceId;
	event.device = record.device;

	boost::optional<long long> wear = wearUsedPercentage(record.attributes);

	// The plain readings
	if (wear)
		event.details["SSDWearPercentage"] = to_string(*wear);
	if (record.temperatureCelsius)
		event.details["TemperatureCelsius"] = to_string(*record.temperatureCelsius);
	if (record.reallocatedSectors)
		event.details["ReallocatedSectors"] = to_string(*record.reallocatedSectors);
	if (record.pendingSectors)
		event.details["PendingSectors"] = to_string(*record.pendingSectors);
	if (record.powerOnHours)
		event.details["PowerOnHours"] = to_string(*record.powerOnHours);
	if (record.ssdLifeUsed)
		event.details["SSDLifeUsed"] = to_string(*record.ssdLifeUsed);

	bool grownDefects = false, pendingSectors = false, reallocatedSectors = false, lifetime = false;

	boost::optional<long long> defects = attributeReading(record.attributes, SmartAttributeKey::GROWN_DEFECTS_COUNT);
	if (defects && *defects > m_thresholds.grownDefects)
	{
		event.details["GrownDefects"] = breachDetail(*defects, m_thresholds.grownDefects, false);
		event.escalate(AlertEvent::Severity::WARNING, "health_alert");
		grownDefects = true;
	}
	if (record.pendingSectors && *record.pendingSectors > m_thresholds.pendingSectors)
	{
		event.details["PendingSectors"] = breachDetail(*record.pendingSectors, m_thresholds.pendingSectors, false);
		event.escalate(AlertEvent::Severity::WARNING, "health_alert");
		pendingSectors = true;
	}
	if (record.reallocatedSectors && *record.reallocatedSectors > m_thresholds.reallocatedSectors)
	{
		event.details["ReallocatedSectors"] = breachDetail(*record.reallocatedSectors,
				m_thresholds.reallocatedSectors, false);
		event.escalate(AlertEvent::Severity::WARNING, "health_alert");
		reallocatedSectors = true;
	}
	if (wear && *wear > m_thresholds.lifetimeUsed)
	{
		event.details["SSDLifeUsed"] = breachDetail(*wear, m_thresholds.lifetimeUsed, true);
		event.escalate(AlertEvent::Severity::CRITICAL, "lifetime_alert");
		lifetime = true;
	}

	// Every populated attribute, by its canonical name
	for (auto it = record.attributes.cbegin(); it != record.attributes.cend(); ++it)
	{
		boost::optional<long long> reading = it->second.rawValue ? it->second.rawValue : it->second.value;
		if (reading)
			event.details[attributeName(it->first)] = to_string(*reading);
	}

	if (lifetime)
		event.message = "SMART data indicates SSD nearing end of life.";
	else if (grownDefects)
		event.message = "SMART data indicates potential drive issues (grown defects).";
	else if (pendingSectors)
		event.message = "SMART data indicates potential drive issues (pending sectors).";
	else if (reallocatedSectors)
		event.message = "SMART data indicates potential drive issues (reallocated sectors).";
	else
		event.message = "SMART data collected successfully.";

	if (event.severity != AlertEvent::Severity::INFO)
	{
		Logger::getLogger()->warn("%s: %s", record.device.c_str(), event.message.c_str());
	}
	return event;
}
