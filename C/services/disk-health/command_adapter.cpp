/*
 * Disk health service.
 *
 * Copyright (c) 2024 Dianomic Systems
 *
 * Released under the Apache 2.0 Licence
 *
 * Author: Mark Riddoch
 */
#include <command_adapter.h>
#include <disk_health_exceptions.h>
#include <file_utils.h>
#include <string_utils.h>
#include <logger.h>
#include <stdio.h>
#include <string.h>
#include <errno.h>
#include <sys/wait.h>

// Exit status of timeout(1) when the deadline expires
#define TIMEOUT_EXPIRED		124

// smartctl exit status bits for command line and device open failures
#define SMARTCTL_CMDLINE_ERROR	0x01
#define SMARTCTL_OPEN_ERROR	0x02

#define SMARTCTL_OPTIONS	"--json --info --health --attributes --tolerance=verypermissive " \
				"--nocheck=standby --format=brief --log=error"

using namespace std;

/**
 * Construct the adapter that runs the diagnostic tools
 *
 * @param timeoutSeconds	The deadline of each tool invocation
 */
SmartctlCommandAdapter::SmartctlCommandAdapter(int timeoutSeconds) : m_timeout(timeoutSeconds)
{
	m_smartctl = findExecutable("smartctl");
	m_nvme = findExecutable("nvme");
	m_timeoutCmd = findExecutable("timeout");
}

/**
 * Check that smartctl is installed. nvme-cli is optional.
 *
 * @return bool	True if smartctl was found
 */
bool SmartctlCommandAdapter::checkTools()
{
	if (m_smartctl.empty())
	{
		Logger::getLogger()->error("smartctl was not found in the PATH, install smartmontools");
		return false;
	}
	if (m_nvme.empty())
	{
		Logger::getLogger()->info("nvme-cli is not installed, NVMe devices will not be enriched");
	}
	if (m_timeoutCmd.empty())
	{
		Logger::getLogger()->warn("timeout command not found, tool invocations have no deadline");
	}
	return true;
}

/**
 * Quote an argument for the shell
 */
string SmartctlCommandAdapter::shellQuote(const string& arg)
{
	string quoted = arg;
	StringReplaceAll(quoted, "'", "'\\''");
	return "'" + quoted + "'";
}

/**
 * Return true if a smartctl exit status means no data was collected
 */
bool SmartctlCommandAdapter::collectionFailed(int exitStatus)
{
	return (exitStatus & (SMARTCTL_CMDLINE_ERROR | SMARTCTL_OPEN_ERROR)) != 0;
}

/**
 * Run a command with the configured deadline and capture the
 * standard output
 *
 * @param command	The command line
 * @param output	The captured output
 * @return int		The exit status of the command
 * @throws CollectionException if the command could not be run
 */
int SmartctlCommandAdapter::runCommand(const string& command, string& output)
{
	string cmd = command;
	if (!m_timeoutCmd.empty())
	{
		cmd = m_timeoutCmd + " " + to_string(m_timeout) + " " + command;
	}
	cmd += " 2>/dev/null";

	Logger::getLogger()->debug("Running %s", cmd.c_str());
	FILE *pipe = popen(cmd.c_str(), "r");
	if (!pipe)
	{
		throw CollectionException(string("popen call failed: ") + strerror(errno));
	}
	char buffer[4096];
	size_t n;
	while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0)
	{
		output.append(buffer, n);
	}
	int status = pclose(pipe);
	if (status == -1)
	{
		throw CollectionException(string("Unable to wait for command: ") + strerror(errno));
	}
	if (WIFEXITED(status))
	{
		int exitStatus = WEXITSTATUS(status);
		if (exitStatus == TIMEOUT_EXPIRED && !m_timeoutCmd.empty())
		{
			throw CollectionException("Command timed out after " + to_string(m_timeout)
					+ " seconds: " + command);
		}
		return exitStatus;
	}
	throw CollectionException("Command terminated abnormally: " + command);
}

/**
 * Collect the SMART data of a device
 *
 * @param device	The device path
 * @return RawDeviceRecord	The parsed record
 * @throws CollectionException if smartctl fails or its output is unusable
 */
RawDeviceRecord SmartctlCommandAdapter::collect(const string& device)
{
	string output;
	int status = runCommand(shellQuote(m_smartctl) + " " + SMARTCTL_OPTIONS + " " + shellQuote(device), output);
	if (StringTrim(output).empty())
	{
		throw CollectionException("smartctl produced no output for " + device
				+ ", exit status " + to_string(status));
	}

	// The JSON carries the reason of a failure, parse it first
	RawDeviceRecord record = parseSmartctlOutput(output, device);
	if (collectionFailed(status))
	{
		throw CollectionException("smartctl failed for " + device + ", exit status " + to_string(status));
	}

	if (record.protocol == DeviceProtocol::NVME && !m_nvme.empty())
	{
		enrichNVMe(record, device);
	}
	return record;
}

/**
 * Merge the nvme-cli controller identity and error log into the
 * record. Failures only lose the enrichment.
 */
void SmartctlCommandAdapter::enrichNVMe(RawDeviceRecord& record, const string& device)
{
	try {
		string output;
		int status = runCommand(shellQuote(m_nvme) + " id-ctrl " + shellQuote(device) + " -o json", output);
		if (status != 0)
		{
			throw CollectionException("nvme id-ctrl exit status " + to_string(status));
		}
		record.enrich(parseNVMeIdController(output));
	} catch (CollectionException& e) {
		Logger::getLogger()->warn("Unable to read NVMe controller identity of %s: %s", device.c_str(), e.what());
	}

	try {
		string output;
		int status = runCommand(shellQuote(m_nvme) + " error-log " + shellQuote(device) + " -o json", output);
		if (status != 0)
		{
			throw CollectionException("nvme error-log exit status " + to_string(status));
		}
		record.enrich(parseNVMeErrorLog(output));
	} catch (CollectionException& e) {
		Logger::getLogger()->warn("Unable to read NVMe error log of %s: %s", device.c_str(), e.what());
	}
}

/**
 * Return the devices smartctl can open
 *
 * @throws CollectionException if the scan fails
 */
vector<string> SmartctlCommandAdapter::scan()
{
	string output;
	int status = runCommand(shellQuote(m_smartctl) + " --scan-open -j", output);
	if (collectionFailed(status))
	{
		throw CollectionException("smartctl --scan-open failed, exit status " + to_string(status));
	}
	return parseSmartctlScan(output);
}

/**
 * Construct an adapter that replays fixtures
 *
 * @param dataRoot	The fixture root directory
 * @param scenario	The scenario directory to read
 * @param devices	The devices returned by a scan
 */
FixtureCommandAdapter::FixtureCommandAdapter(const string& dataRoot,
					     const string& scenario,
					     const vector<string>& devices) :
	m_dataRoot(dataRoot), m_scenario(scenario), m_devices(devices)
{
}

bool FixtureCommandAdapter::checkTools()
{
	string dir = m_dataRoot + "/scenarios/" + m_scenario;
	if (!isDirectory(dir))
	{
		Logger::getLogger()->error("Test scenario directory %s does not exist", dir.c_str());
		return false;
	}
	Logger::getLogger()->info("Running in test mode with scenario %s", m_scenario.c_str());
	return true;
}

string FixtureCommandAdapter::fixturePath(const string& device, const string& suffix) const
{
	return m_dataRoot + "/scenarios/" + m_scenario + "/" + pathBasename(device) + suffix;
}

/**
 * Read the recorded output of a device
 *
 * @throws CollectionException if the fixture is missing or invalid
 */
RawDeviceRecord FixtureCommandAdapter::collect(const string& device)
{
	string path = fixturePath(device);
	string contents;
	if (!readFileContents(path, contents))
	{
		throw CollectionException("Unable to read test data " + path);
	}
	RawDeviceRecord record = parseSmartctlOutput(contents, device);

	if (record.protocol == DeviceProtocol::NVME)
	{
		string companion;
		if (readFileContents(fixturePath(device, ".id-ctrl.json"), companion))
		{
			try {
				record.enrich(parseNVMeIdController(companion));
			} catch (CollectionException& e) {
				Logger::getLogger()->warn("Unable to read NVMe controller identity of %s: %s", device.c_str(), e.what());
			}
		}
		companion.clear();
		if (readFileContents(fixturePath(device, ".error-log.json"), companion))
		{
			try {
				record.enrich(parseNVMeErrorLog(companion));
			} catch (CollectionException& e) {
				Logger::getLogger()->warn("Unable to read NVMe error log of %s: %s", device.c_str(), e.what());
			}
		}
	}
	return record;
}

/**
 * The configured test devices, or every fixture in the scenario
 */
vector<string> FixtureCommandAdapter::scan()
{
	if (!m_devices.empty())
	{
		return m_devices;
	}
	vector<string> devices;
	vector<string> files = listDirectory(m_dataRoot + "/scenarios/" + m_scenario, true);
	for (auto& file : files)
	{
		string name = pathBasename(file);
		if (name.size() > 5 && name.compare(name.size() - 5, 5, ".json") == 0
				&& name.find('.') == name.size() - 5)
		{
			devices.push_back("/dev/" + name.substr(0, name.size() - 5));
		}
	}
	return devices;
}
