#ifndef _DISK_HEALTH_SERVICE_H
#define _DISK_HEALTH_SERVICE_H
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
#include <iostream>
#include <disk_health_config.h>
#include <command_adapter.h>
#include <attribute_normalizer.h>
#include <storage_unit_resolver.h>
#include <alert_classifier.h>
#include <metrics_registry.h>
#include <metrics_api.h>
#include <nats_publisher.h>
#include <logger.h>

#define SERVICE_NAME	"disk-health"

/**
 * The disk health monitoring loop. Each cycle collects every
 * configured device, normalizes and classifies it and hands the
 * results to the configured sinks.
 */
class DiskHealthService
{
	public:
		DiskHealthService(const DiskHealthConfig& config, CommandAdapter *adapter,
				  std::ostream& out = std::cout);
		~DiskHealthService();

		bool				initialise();
		void				start();
		void				stop();
		std::vector<NormalizedRecord>	runCycle();

		const std::vector<std::string>&	devices() const { return m_devices; };
		const std::vector<AlertEvent>&	lastEvents() const { return m_events; };
		MetricsRegistry&		registry() { return m_registry; };

	private:
		std::vector<std::string>	resolveDevices();
		void				publishEvents();
		int				createTimerFd(int seconds);

		const DiskHealthConfig		m_config;
		CommandAdapter			*m_adapter;
		std::ostream&			m_out;
		Logger				*m_logger;
		AttributeNormalizer		m_normalizer;
		StorageUnitResolver		m_resolver;
		AlertClassifier			m_classifier;
		MetricsRegistry			m_registry;
		MetricsPublisher		m_metrics;
		MetricsApi			*m_metricsApi;
		NatsPublisher			*m_nats;
		std::vector<std::string>	m_devices;
		std::vector<AlertEvent>		m_events;
		volatile bool			m_shutdown;
		int				m_timerfd;
};

#endif
