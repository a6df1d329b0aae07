#ifndef _DISK_HEALTH_TEST_FIXTURES_H
#define _DISK_HEALTH_TEST_FIXTURES_H
/*
 * Disk health service unit tests.
 *
 * Copyright (c) 2024 Dianomic Systems
 *
 * Released under the Apache 2.0 Licence
 *
 * Author: Mark Riddoch
 */
#include <string>
#include <file_utils.h>
#include <smartctl_output.h>

#ifndef DISK_HEALTH_TEST_DATA
#define DISK_HEALTH_TEST_DATA	"data"
#endif

/**
 * Read a recorded tool output from a test scenario
 */
inline std::string readFixture(const std::string& scenario, const std::string& file)
{
	std::string contents;
	readFileContents(std::string(DISK_HEALTH_TEST_DATA) + "/scenarios/" + scenario + "/" + file, contents);
	return contents;
}

inline RawDeviceRecord loadRecord(const std::string& scenario, const std::string& device)
{
	return parseSmartctlOutput(readFixture(scenario, device + ".json"), "/dev/" + device);
}

#endif
