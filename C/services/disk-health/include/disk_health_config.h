#ifndef _DISK_HEALTH_CONFIG_H
#define _DISK_HEALTH_CONFIG_H
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
#include <alert_classifier.h>

#define DEFAULT_DISKS			"/dev/sda,/dev/sdb"
#define DEFAULT_INTERVAL		10
#define DEFAULT_PROMETHEUS_PORT		8080
#define DEFAULT_NATS_SUBJECT		"osd.disk.health"
#define DEFAULT_COMMAND_TIMEOUT		30
#define DEFAULT_TEST_DATA		"./testdata"
#define DEFAULT_TEST_SCENARIO		"healthy"
#define DEFAULT_LOG_LEVEL		"warning"
#define SCAN_ALL_DISKS			"*"

/**
 * The runtime configuration of the disk health service.
 * Command line arguments are applied first and the environment
 * is merged over them.
 */
class DiskHealthConfig
{
	public:
		DiskHealthConfig();

		void			parseArguments(int argc, char *argv[]);
		void			mergeEnvironment();
		void			validate() const;

		bool			scanAllDisks() const;
		bool			natsEnabled() const { return !natsUrl.empty(); };

		std::vector<std::string>	disks;
		int			interval;
		bool			prometheus;
		unsigned short		prometheusPort;
		std::string		natsUrl;
		std::string		natsSubject;
		std::string		nodeName;
		std::string		instanceId;
		AlertThresholds		thresholds;
		std::string		osdBasePath;
		int			commandTimeout;
		bool			testMode;
		std::string		testDataPath;
		std::string		testScenario;
		std::vector<std::string>	testDevices;
		std::string		logLevel;
		bool			foreground;
		bool			once;

		static std::vector<std::string>	parseList(const std::string& value);
		static bool		parseBool(const std::string& name, const std::string& value);
		static long long	parseInteger(const std::string& name, const std::string& value);

	private:
		void			setPort(const std::string& name, const std::string& value);
};

#endif
