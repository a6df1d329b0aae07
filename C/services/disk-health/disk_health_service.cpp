/*
 * Disk health service.
 *
 * Copyright (c) 2024 Dianomic Systems
 *
 * Released under the Apache 2.0 Licence
 *
 * Author: Mark Riddoch
 */
#include <disk_health_service.h>
#include <disk_health_exceptions.h>
#include <normalized_record.h>
#include <sys/timerfd.h>
#include <time.h>
#include <unistd.h>
#include <string.h>
#include <errno.h>
#include <stdint.h>
#include <exception>

using namespace std;

/**
 * Construct the service
 *
 * @param config	The validated configuration
 * @param adapter	The source of raw SMART data, ownership passes to the service
 * @param out		The stream the records are written to when there is no push sink
 */
DiskHealthService::DiskHealthService(const DiskHealthConfig& config, CommandAdapter *adapter, ostream& out) :
	m_config(config), m_adapter(adapter), m_out(out),
	m_resolver(config.osdBasePath), m_classifier(config.thresholds),
	m_metrics(m_registry), m_metricsApi(NULL), m_nats(NULL),
	m_shutdown(false), m_timerfd(-1)
{
	m_logger = Logger::getLogger();
}

DiskHealthService::~DiskHealthService()
{
	if (m_metricsApi)
	{
		m_metricsApi->stop();
		delete m_metricsApi;
	}
	delete m_nats;
	delete m_adapter;
	if (m_timerfd != -1)
		close(m_timerfd);
}

/**
 * Work out the list of devices to monitor
 */
vector<string> DiskHealthService::resolveDevices()
{
	if (m_config.testMode && !m_config.testDevices.empty())
	{
		return m_config.testDevices;
	}
	if (m_config.scanAllDisks())
	{
		try {
			return m_adapter->scan();
		} catch (CollectionException& e) {
			m_logger->error("Device scan failed: %s", e.what());
			return vector<string>();
		}
	}
	return m_config.disks;
}

/**
 * Prepare the service to run. Checks the tools, builds the
 * device list and opens the sinks.
 *
 * @return bool	False if the service cannot run
 */
bool DiskHealthService::initialise()
{
	if (!m_adapter->checkTools())
	{
		m_logger->fatal("The diagnostic tools are not available");
		return false;
	}

	m_devices = resolveDevices();
	if (m_devices.empty())
	{
		m_logger->fatal("No devices to monitor");
		return false;
	}
	for (auto& device : m_devices)
	{
		m_logger->info("Monitoring device %s", device.c_str());
	}

	if (m_config.natsEnabled())
	{
		try {
			m_nats = new NatsPublisher(m_config.natsUrl, SERVICE_NAME);
			m_nats->connect();
		} catch (DiskHealthException& e) {
			m_logger->fatal("Unable to connect to NATS: %s", e.what());
			return false;
		}
	}

	if (m_config.prometheus)
	{
		m_metricsApi = new MetricsApi(m_registry, m_config.prometheusPort);
		m_metricsApi->start();
	}
	return true;
}

/**
 * Run a single collection cycle over every device. A device that
 * fails to collect or process is skipped for this cycle.
 *
 * @return vector<NormalizedRecord>	The records of the devices collected
 */
vector<NormalizedRecord> DiskHealthService::runCycle()
{
	vector<NormalizedRecord> records;
	m_events.clear();

	if (m_devices.empty())
	{
		m_devices = resolveDevices();
	}

	for (auto& device : m_devices)
	{
		try {
			RawDeviceRecord raw = m_adapter->collect(device);
			NormalizedDevice normalized = m_normalizer.normalize(raw);
			string unitId = m_resolver.resolve(device);
			NormalizedRecord record = buildNormalizedRecord(raw, normalized,
					m_config.nodeName, m_config.instanceId, unitId);

			AlertEvent event = m_classifier.classify(record);
			if (m_config.prometheus)
			{
				m_metrics.publish(record);
			}
			m_events.push_back(event);
			records.push_back(record);
		} catch (CollectionException& e) {
			m_logger->error("Failed to collect SMART data for %s: %s", device.c_str(), e.what());
		} catch (exception& e) {
			m_logger->error("Failed to process SMART data for %s: %s", device.c_str(), e.what());
		}
	}

	if (m_config.natsEnabled())
	{
		publishEvents();
	}
	else
	{
		m_out << recordsToJSON(records) << endl;
	}
	m_logger->info("Collected %d of %d devices", (int)records.size(), (int)m_devices.size());
	return records;
}

/**
 * Send this cycle's events to the message bus
 */
void DiskHealthService::publishEvents()
{
	if (!m_nats)
	{
		try {
			m_nats = new NatsPublisher(m_config.natsUrl, SERVICE_NAME);
		} catch (ConfigurationException& e) {
			m_logger->error("Invalid NATS URL: %s", e.what());
			return;
		}
	}
	int published = 0;
	for (auto& event : m_events)
	{
		try {
			m_nats->publish(m_config.natsSubject, event.toJSON());
			published++;
		} catch (PublishException& e) {
			m_logger->error("Failed to publish event for %s: %s", event.device.c_str(), e.what());
		}
	}
	if (published)
	{
		try {
			m_nats->flush();
		} catch (PublishException& e) {
			m_logger->error("Failed to flush events: %s", e.what());
		}
	}
}

/**
 * Create a timer FD on which a read would return data every time the given
 * interval elapses
 *
 * @param seconds	The interval in seconds
 */
int DiskHealthService::createTimerFd(int seconds)
{
	int fd = -1;
	struct itimerspec new_value;
	struct timespec now;

	if (clock_gettime(CLOCK_MONOTONIC, &now) == -1)
	   m_logger->error("clock_gettime");

	new_value.it_value.tv_sec = now.tv_sec + seconds;
	new_value.it_value.tv_nsec = now.tv_nsec;
	new_value.it_interval.tv_sec = seconds;
	new_value.it_interval.tv_nsec = 0;

	errno=0;
	fd = timerfd_create(CLOCK_MONOTONIC, 0);
	if (fd == -1)
	{
		m_logger->error("timerfd_create failed, errno=%d (%s)", errno, strerror(errno));
		return fd;
	}
	if (timerfd_settime(fd, TFD_TIMER_ABSTIME, &new_value, NULL) == -1)
	{
		m_logger->error("timerfd_settime failed, errno=%d (%s)", errno, strerror(errno));
		close(fd);
		return -1;
	}
	return fd;
}

/**
 * Run the monitoring loop. The first cycle runs immediately, the
 * following ones on each tick of the interval timer. Returns when
 * stop is called or after one cycle in single cycle mode.
 */
void DiskHealthService::start()
{
	runCycle();
	if (m_config.once)
	{
		return;
	}

	m_timerfd = createTimerFd(m_config.interval);
	while (!m_shutdown)
	{
		if (m_timerfd == -1)
		{
			sleep(m_config.interval);
		}
		else
		{
			uint64_t exp;
			ssize_t s = read(m_timerfd, &exp, sizeof(uint64_t));
			if (s != sizeof(uint64_t))
			{
				if (errno != EINTR)
					m_logger->error("timerfd read()");
				continue;
			}
			if (exp > 1)
			{
				m_logger->warn("%d collection cycles have been skipped", (int)(exp - 1));
			}
		}
		if (m_shutdown)
			break;
		runCycle();
	}
	m_logger->info("Disk health service shutting down");
}

/**
 * Request the loop to stop after the current cycle
 */
void DiskHealthService::stop()
{
	m_shutdown = true;
}
