#ifndef _METRICS_REGISTRY_H
#define _METRICS_REGISTRY_H
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
#include <vector>
#include <map>
#include <mutex>
#include <counter_state.h>
#include <normalized_record.h>

#define METRIC_TEMPERATURE	"disk_temperature_celsius"
#define METRIC_REALLOCATED	"disk_reallocated_sectors"
#define METRIC_PENDING		"disk_pending_sectors"
#define METRIC_SSD_LIFE_USED	"ssd_life_used_percentage"
#define METRIC_CAPACITY		"disk_capacity_gb"
#define METRIC_ATTRIBUTES	"smart_attributes"
#define METRIC_POWER_ON_HOURS	"disk_power_on_hours_total"
#define METRIC_ERROR_COUNTS	"disk_error_counts_total"

typedef std::vector<std::pair<std::string, std::string> >	MetricLabels;

/**
 * A set of gauge and counter families rendered in the Prometheus
 * text exposition format. Safe to update from the polling thread
 * while the HTTP server renders it.
 */
class MetricsRegistry
{
	public:
		MetricsRegistry() {};
		~MetricsRegistry() {};

		void		registerGauge(const std::string& name, const std::string& help);
		void		registerCounter(const std::string& name, const std::string& help);
		void		setGauge(const std::string& name, const MetricLabels& labels, double value);
		void		addCounter(const std::string& name, const MetricLabels& labels, double increment);
		bool		getValue(const std::string& name, const MetricLabels& labels, double& value);
		std::string	exposition();

	private:
		class Sample
		{
			public:
				MetricLabels	labels;
				double		value;
		};
		class Family
		{
			public:
				Family() : counter(false) {};
				std::string	help;
				bool		counter;
				std::map<std::string, Sample>
						samples;
		};
		static std::string	labelKey(const MetricLabels& labels);
		static std::string	escapeLabel(const std::string& value);
		static std::string	formatValue(double value);

		std::mutex		m_mutex;
		std::map<std::string, Family>
					m_families;
};

/**
 * Publishes normalized records to the metrics registry. Cumulative
 * device counters are reconciled against their previous readings
 * before they are added to the monotonic counters.
 */
class MetricsPublisher
{
	public:
		MetricsPublisher(MetricsRegistry& registry);
		~MetricsPublisher() {};

		void		publish(const NormalizedRecord& record);
		CounterState&	counterState() { return m_counters; };

	private:
		MetricsRegistry&	m_registry;
		CounterState		m_counters;
};

#endif
