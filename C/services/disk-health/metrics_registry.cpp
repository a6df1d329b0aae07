/*
 * Disk health service.
 *
 * Copyright (c) 2024 Dianomic Systems
 *
 * Released under the Apache 2.0 Licence
 *
 * Author: Mark Riddoch
 */
#include <metrics_registry.h>
#include <string_utils.h>
#include <logger.h>
#include <sstream>
#include <iomanip>

using namespace std;

void MetricsRegistry::registerGauge(const string& name, const string& help)
{
	lock_guard<mutex> guard(m_mutex);
	Family& family = m_families[name];
	family.help = help;
	family.counter = false;
}

void MetricsRegistry::registerCounter(const string& name, const string& help)
{
	lock_guard<mutex> guard(m_mutex);
	Family& family = m_families[name];
	family.help = help;
	family.counter = true;
}

/**
 * Set the value of a gauge. The family must have been registered.
 */
void MetricsRegistry::setGauge(const string& name, const MetricLabels& labels, double value)
{
	lock_guard<mutex> guard(m_mutex);
	auto it = m_families.find(name);
	if (it == m_families.end() || it->second.counter)
	{
		Logger::getLogger()->error("Attempt to set unknown gauge %s", name.c_str());
		return;
	}
	Sample& sample = it->second.samples[labelKey(labels)];
	sample.labels = labels;
	sample.value = value;
}

/**
 * Add to a counter. Negative increments are ignored so that a
 * counter can never go backwards.
 */
void MetricsRegistry::addCounter(const string& name, const MetricLabels& labels, double increment)
{
	lock_guard<mutex> guard(m_mutex);
	auto it = m_families.find(name);
	if (it == m_families.end() || !it->second.counter)
	{
		Logger::getLogger()->error("Attempt to add to unknown counter %s", name.c_str());
		return;
	}
	string key = labelKey(labels);
	auto sample = it->second.samples.find(key);
	if (sample == it->second.samples.end())
	{
		Sample s;
		s.labels = labels;
		s.value = 0;
		sample = it->second.samples.insert(pair<string, Sample>(key, s)).first;
	}
	if (increment > 0)
		sample->second.value += increment;
}

/**
 * Return the current value of a sample
 */
bool MetricsRegistry::getValue(const string& name, const MetricLabels& labels, double& value)
{
	lock_guard<mutex> guard(m_mutex);
	auto it = m_families.find(name);
	if (it == m_families.end())
		return false;
	auto sample = it->second.samples.find(labelKey(labels));
	if (sample == it->second.samples.end())
		return false;
	value = sample->second.value;
	return true;
}

/**
 * Render the registry in the Prometheus text format, version 0.0.4
 */
string MetricsRegistry::exposition()
{
	lock_guard<mutex> guard(m_mutex);
	ostringstream out;
	for (auto it = m_families.cbegin(); it != m_families.cend(); ++it)
	{
		out << "# HELP " << it->first << " " << it->second.help << "\n";
		out << "# TYPE " << it->first << " " << (it->second.counter ? "counter" : "gauge") << "\n";
		for (auto s = it->second.samples.cbegin(); s != it->second.samples.cend(); ++s)
		{
			out << it->first;
			const MetricLabels& labels = s->second.labels;
			if (!labels.empty())
			{
				out << "{";
				for (size_t i = 0; i < labels.size(); i++)
				{
					if (i)
						out << ",";
					out << labels[i].first << "=\"" << escapeLabel(labels[i].second) << "\"";
				}
				out << "}";
			}
			out << " " << formatValue(s->second.value) << "\n";
		}
	}
	return out.str();
}

string MetricsRegistry::labelKey(const MetricLabels& labels)
{
	string key;
	for (size_t i = 0; i < labels.size(); i++)
	{
		key += labels[i].first + "=" + labels[i].second + "\x1f";
	}
	return key;
}

string MetricsRegistry::escapeLabel(const string& value)
{
	string escaped = value;
	StringReplaceAll(escaped, "\\", "\\\\");
	StringReplaceAll(escaped, "\"", "\\\"");
	StringReplaceAll(escaped, "\n", "\\n");
	return escaped;
}

string MetricsRegistry::formatValue(double value)
{
	ostringstream out;
	out << setprecision(15) << value;
	return out.str();
}

/**
 * Construct the publisher and register the metric families
 */
MetricsPublisher::MetricsPublisher(MetricsRegistry& registry) : m_registry(registry)
{
	m_registry.registerGauge(METRIC_TEMPERATURE, "Current disk temperature in Celsius");
	m_registry.registerGauge(METRIC_REALLOCATED, "Number of reallocated sectors");
	m_registry.registerGauge(METRIC_PENDING, "Number of pending sectors");
	m_registry.registerGauge(METRIC_SSD_LIFE_USED, "Percentage of SSD life used");
	m_registry.registerGauge(METRIC_CAPACITY, "Disk capacity in GB");
	m_registry.registerGauge(METRIC_ATTRIBUTES, "Raw value of each normalized SMART attribute");
	m_registry.registerCounter(METRIC_POWER_ON_HOURS, "Total power on hours of the disk");
	m_registry.registerCounter(METRIC_ERROR_COUNTS, "Total error counts of the disk by type");
}

/**
 * Publish a record to the registry
 *
 * @param record	The normalized record of a device
 */
void MetricsPublisher::publish(const NormalizedRecord& record)
{
	MetricLabels labels;
	labels.push_back(make_pair(string("disk"), record.device));
	labels.push_back(make_pair(string("node"), record.nodeName));
	labels.push_back(make_pair(string("instance"), record.instanceId));
	labels.push_back(make_pair(string("osd_id"), record.storageUnitId));

	if (record.temperatureCelsius)
		m_registry.setGauge(METRIC_TEMPERATURE, labels, *record.temperatureCelsius);
	if (record.reallocatedSectors)
		m_registry.setGauge(METRIC_REALLOCATED, labels, *record.reallocatedSectors);
	if (record.pendingSectors)
		m_registry.setGauge(METRIC_PENDING, labels, *record.pendingSectors);
	if (record.ssdLifeUsed)
		m_registry.setGauge(METRIC_SSD_LIFE_USED, labels, *record.ssdLifeUsed);
	m_registry.setGauge(METRIC_CAPACITY, labels, record.capacityGB);

	for (auto it = record.attributes.cbegin(); it != record.attributes.cend(); ++it)
	{
		boost::optional<long long> reading = it->second.rawValue ? it->second.rawValue : it->second.value;
		if (!reading)
			continue;
		MetricLabels attrLabels = labels;
		attrLabels.push_back(make_pair(string("attribute"), attributeName(it->first)));
		m_registry.setGauge(METRIC_ATTRIBUTES, attrLabels, *reading);
	}

	if (record.powerOnHours)
	{
		long long increment = m_counters.reconcile(record.device, "power_on_hours", *record.powerOnHours);
		m_registry.addCounter(METRIC_POWER_ON_HOURS, labels, increment);
	}

	for (auto it = record.errorCounts.cbegin(); it != record.errorCounts.cend(); ++it)
	{
		long long increment = m_counters.reconcile(record.device, it->first, it->second);
		MetricLabels errorLabels = labels;
		errorLabels.push_back(make_pair(string("error_type"), it->first));
		m_registry.addCounter(METRIC_ERROR_COUNTS, errorLabels, increment);
	}
}
