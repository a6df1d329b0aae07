/*
 * Disk health service.
 *
 * Copyright (c) 2024 Dianomic Systems
 *
 * Released under the Apache 2.0 Licence
 *
 * Author: Mark Riddoch
 */
#include <disk_health_config.h>
#include <disk_health_exceptions.h>
#include <string_utils.h>
#include <logger.h>
#include <stdlib.h>
#include <string.h>
#include <errno.h>
#include <limits.h>
#include <unistd.h>

using namespace std;

/**
 * Construct the configuration with the default values
 */
DiskHealthConfig::DiskHealthConfig() : interval(DEFAULT_INTERVAL), prometheus(false),
	prometheusPort(DEFAULT_PROMETHEUS_PORT), natsSubject(DEFAULT_NATS_SUBJECT),
	commandTimeout(DEFAULT_COMMAND_TIMEOUT), testMode(false),
	testDataPath(DEFAULT_TEST_DATA), testScenario(DEFAULT_TEST_SCENARIO),
	logLevel(DEFAULT_LOG_LEVEL), foreground(false), once(false)
{
	disks = parseList(DEFAULT_DISKS);
	char host[HOST_NAME_MAX + 1];
	if (gethostname(host, sizeof(host)) == 0)
	{
		host[HOST_NAME_MAX] = 0;
		nodeName = host;
	}
}

/**
 * Split a comma separated list, dropping empty items
 */
vector<string> DiskHealthConfig::parseList(const string& value)
{
	vector<string> items;
	vector<string> parts = StringSplit(value, ',');
	for (auto& part : parts)
	{
		string item = StringTrim(part);
		if (!item.empty())
			items.push_back(item);
	}
	return items;
}

bool DiskHealthConfig::parseBool(const string& name, const string& value)
{
	string v = StringToLower(StringTrim(value));
	if (v == "true" || v == "1" || v == "yes")
		return true;
	if (v == "false" || v == "0" || v == "no" || v.empty())
		return false;
	throw ConfigurationException("Invalid boolean value '" + value + "' for " + name);
}

long long DiskHealthConfig::parseInteger(const string& name, const string& value)
{
	string v = StringTrim(value);
	char *end;
	errno = 0;
	long long result = strtoll(v.c_str(), &end, 10);
	if (v.empty() || *end != 0 || errno == ERANGE)
	{
		throw ConfigurationException("Invalid integer value '" + value + "' for " + name);
	}
	return result;
}

void DiskHealthConfig::setPort(const string& name, const string& value)
{
	long long port = parseInteger(name, value);
	if (port < 1 || port > 65535)
	{
		throw ConfigurationException("Port " + value + " for " + name + " is out of range");
	}
	prometheusPort = (unsigned short)port;
}

/**
 * Apply the command line arguments
 *
 * @param argc	The argument count
 * @param argv	The arguments
 * @throws ConfigurationException for a malformed value
 */
void DiskHealthConfig::parseArguments(int argc, char *argv[])
{
	for (int i = 1; i < argc; i++)
	{
		if (!strcmp(argv[i], "-d"))
		{
			foreground = true;
		}
		else if (!strcmp(argv[i], "--once"))
		{
			once = true;
		}
		else if (!strcmp(argv[i], "--prometheus"))
		{
			prometheus = true;
		}
		else if (!strcmp(argv[i], "--test-mode"))
		{
			testMode = true;
		}
		else if (!strncmp(argv[i], "--disks=", 8))
		{
			disks = parseList(&argv[i][8]);
		}
		else if (!strncmp(argv[i], "--interval=", 11))
		{
			interval = (int)parseInteger("interval", &argv[i][11]);
		}
		else if (!strncmp(argv[i], "--prometheus-port=", 18))
		{
			setPort("prometheus-port", &argv[i][18]);
		}
		else if (!strncmp(argv[i], "--nats-url=", 11))
		{
			natsUrl = &argv[i][11];
		}
		else if (!strncmp(argv[i], "--nats-subject=", 15))
		{
			natsSubject = &argv[i][15];
		}
		else if (!strncmp(argv[i], "--node-name=", 12))
		{
			nodeName = &argv[i][12];
		}
		else if (!strncmp(argv[i], "--instance-id=", 14))
		{
			instanceId = &argv[i][14];
		}
		else if (!strncmp(argv[i], "--grown-defects-threshold=", 26))
		{
			thresholds.grownDefects = parseInteger("grown-defects-threshold", &argv[i][26]);
		}
		else if (!strncmp(argv[i], "--pending-sectors-threshold=", 28))
		{
			thresholds.pendingSectors = parseInteger("pending-sectors-threshold", &argv[i][28]);
		}
		else if (!strncmp(argv[i], "--reallocated-sectors-threshold=", 32))
		{
			thresholds.reallocatedSectors = parseInteger("reallocated-sectors-threshold", &argv[i][32]);
		}
		else if (!strncmp(argv[i], "--lifetime-used-threshold=", 26))
		{
			thresholds.lifetimeUsed = parseInteger("lifetime-used-threshold", &argv[i][26]);
		}
		else if (!strncmp(argv[i], "--osd-base-path=", 16))
		{
			osdBasePath = &argv[i][16];
		}
		else if (!strncmp(argv[i], "--command-timeout=", 18))
		{
			commandTimeout = (int)parseInteger("command-timeout", &argv[i][18]);
		}
		else if (!strncmp(argv[i], "--test-data=", 12))
		{
			testDataPath = &argv[i][12];
		}
		else if (!strncmp(argv[i], "--test-scenario=", 16))
		{
			testScenario = &argv[i][16];
		}
		else if (!strncmp(argv[i], "--test-devices=", 15))
		{
			testDevices = parseList(&argv[i][15]);
		}
		else if (!strncmp(argv[i], "--logLevel=", 11))
		{
			logLevel = &argv[i][11];
		}
		else
		{
			Logger::getLogger()->warn("Ignoring unrecognised argument %s", argv[i]);
		}
	}
}

/**
 * Merge the environment variables over the current values.
 * Variables that are unset leave the value unchanged.
 */
void DiskHealthConfig::mergeEnvironment()
{
	const char *v;

	if ((v = getenv("DISKS")) != NULL)
		disks = parseList(v);
	if ((v = getenv("INTERVAL")) != NULL)
		interval = (int)parseInteger("INTERVAL", v);
	if ((v = getenv("PROMETHEUS")) != NULL)
		prometheus = parseBool("PROMETHEUS", v);
	if ((v = getenv("PROMETHEUS_PORT")) != NULL)
		setPort("PROMETHEUS_PORT", v);
	if ((v = getenv("NATS_URL")) != NULL)
		natsUrl = v;
	if ((v = getenv("NATS_SUBJECT")) != NULL && *v)
		natsSubject = v;
	if ((v = getenv("NODE_NAME")) != NULL && *v)
		nodeName = v;
	if ((v = getenv("INSTANCE_ID")) != NULL)
		instanceId = v;
	if ((v = getenv("GROWN_DEFECTS_THRESHOLD")) != NULL)
		thresholds.grownDefects = parseInteger("GROWN_DEFECTS_THRESHOLD", v);
	if ((v = getenv("PENDING_SECTORS_THRESHOLD")) != NULL)
		thresholds.pendingSectors = parseInteger("PENDING_SECTORS_THRESHOLD", v);
	if ((v = getenv("REALLOCATED_SECTORS_THRESHOLD")) != NULL)
		thresholds.reallocatedSectors = parseInteger("REALLOCATED_SECTORS_THRESHOLD", v);
	if ((v = getenv("LIFETIME_USED_THRESHOLD")) != NULL)
		thresholds.lifetimeUsed = parseInteger("LIFETIME_USED_THRESHOLD", v);
	if ((v = getenv("CEPH_OSD_BASE_PATH")) != NULL)
		osdBasePath = v;
	if ((v = getenv("COMMAND_TIMEOUT")) != NULL)
		commandTimeout = (int)parseInteger("COMMAND_TIMEOUT", v);
	if ((v = getenv("TEST_MODE")) != NULL)
		testMode = parseBool("TEST_MODE", v);
	if ((v = getenv("TEST_DATA_PATH")) != NULL && *v)
		testDataPath = v;
	if ((v = getenv("TEST_SCENARIO")) != NULL && *v)
		testScenario = v;
	if ((v = getenv("TEST_DEVICES")) != NULL)
		testDevices = parseList(v);
}

/**
 * Check the configuration is usable
 *
 * @throws ConfigurationException describing the first problem found
 */
void DiskHealthConfig::validate() const
{
	if (disks.empty())
	{
		throw ConfigurationException("The disk list is empty");
	}
	if (interval <= 0)
	{
		throw ConfigurationException("The polling interval must be a positive number of seconds");
	}
	if (commandTimeout <= 0)
	{
		throw ConfigurationException("The command timeout must be a positive number of seconds");
	}
	if (thresholds.lifetimeUsed < 0 || thresholds.lifetimeUsed > 100)
	{
		throw ConfigurationException("The lifetime used threshold must be between 0 and 100");
	}
	if (thresholds.grownDefects < 0 || thresholds.pendingSectors < 0 || thresholds.reallocatedSectors < 0)
	{
		throw ConfigurationException("Sector thresholds must not be negative");
	}
	if (natsEnabled() && natsSubject.empty())
	{
		throw ConfigurationException("A NATS subject is required when a NATS URL is given");
	}
}

/**
 * Return true if the disk list asks for every device to be scanned
 */
bool DiskHealthConfig::scanAllDisks() const
{
	for (auto& disk : disks)
	{
		if (disk.compare(SCAN_ALL_DISKS) == 0)
			return true;
	}
	return false;
}
