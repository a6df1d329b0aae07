#ifndef _COMMAND_ADAPTER_H
#define _COMMAND_ADAPTER_H
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
#include <smartctl_output.h>

/**
 * The source of raw SMART data for a device. Implementations either
 * run the diagnostic tools or replay recorded output.
 */
class CommandAdapter
{
	public:
		virtual ~CommandAdapter() {};

		/**
		 * Collect the raw record of a device
		 *
		 * @param device	The device path, e.g. /dev/sda
		 * @throws CollectionException on failure
		 */
		virtual RawDeviceRecord		collect(const std::string& device) = 0;

		/**
		 * Return the list of devices present on the host
		 */
		virtual std::vector<std::string>
						scan() = 0;

		/**
		 * Check that the tools needed are available
		 */
		virtual bool			checkTools() = 0;
};

/**
 * Collect SMART data by running smartctl and, for NVMe
 * devices, nvme-cli
 */
class SmartctlCommandAdapter : public CommandAdapter
{
	public:
		SmartctlCommandAdapter(int timeoutSeconds);

		RawDeviceRecord			collect(const std::string& device);
		std::vector<std::string>	scan();
		bool				checkTools();

		static std::string		shellQuote(const std::string& arg);
		static bool			collectionFailed(int exitStatus);

	private:
		int				runCommand(const std::string& command, std::string& output);
		void				enrichNVMe(RawDeviceRecord& record, const std::string& device);

		int				m_timeout;
		std::string			m_smartctl;
		std::string			m_nvme;
		std::string			m_timeoutCmd;
};

/**
 * Replay recorded tool output from a directory of fixtures.
 * The smartctl output of a device is read from
 * <root>/scenarios/<scenario>/<device basename>.json, the optional
 * nvme-cli output from <basename>.id-ctrl.json and <basename>.error-log.json
 */
class FixtureCommandAdapter : public CommandAdapter
{
	public:
		FixtureCommandAdapter(const std::string& dataRoot,
				      const std::string& scenario,
				      const std::vector<std::string>& devices);

		RawDeviceRecord			collect(const std::string& device);
		std::vector<std::string>	scan();
		bool				checkTools();

		std::string			fixturePath(const std::string& device,
							    const std::string& suffix = ".json") const;

	private:
		std::string			m_dataRoot;
		std::string			m_scenario;
		std::vector<std::string>	m_devices;
};

#endif
