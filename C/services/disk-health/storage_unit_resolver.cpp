/*
 * Disk health service.
 *
 * Copyright (c) 2024 Dianomic Systems
 *
 * Released under the Apache 2.0 Licence
 *
 * Author: Mark Riddoch
 */
#include <storage_unit_resolver.h>
#include <file_utils.h>
#include <string_utils.h>
#include <logger.h>
#include <regex>
#include <sys/stat.h>
#include <sys/sysmacros.h>
#include <stdlib.h>

using namespace std;

/**
 * Construct the resolver. No filesystem access is made until
 * the first call to resolve.
 *
 * @param baseDir	The directory holding the storage unit directories,
 *			an empty string disables the mapping
 * @param sysRoot	The root of the sysfs tree
 * @param devRoot	The directory holding the device nodes
 */
StorageUnitResolver::StorageUnitResolver(const string& baseDir, const string& sysRoot, const string& devRoot) :
		m_baseDir(baseDir), m_sysRoot(sysRoot), m_devRoot(devRoot)
{
}

/**
 * Return the storage unit that uses a device
 *
 * @param device	The device path, e.g. /dev/sda or /dev/nvme1
 * @return		The storage unit identifier or an empty string
 *			if the device is not mapped
 */
string StorageUnitResolver::resolve(const string& device)
{
	if (m_baseDir.empty())
		return "";

	call_once(m_built, &StorageUnitResolver::buildCache, this);

	Logger *logger = Logger::getLogger();
	vector<string> candidates = candidateDevices(device);
	for (auto it = candidates.cbegin(); it != candidates.cend(); ++it)
	{
		string canonical = canonicalPath(*it);
		auto hit = m_cache.find(canonical);
		if (hit == m_cache.end() && canonical.compare(*it) != 0)
		{
			hit = m_cache.find(*it);
		}
		if (hit != m_cache.end())
		{
			logger->debug("Device %s is used by storage unit %s", it->c_str(), hit->second.c_str());
			return hit->second;
		}
	}
	logger->debug("No storage unit found for device %s", device.c_str());
	return "";
}

/**
 * Return the number of device paths in the mapping
 */
size_t StorageUnitResolver::mappingCount()
{
	if (m_baseDir.empty())
		return 0;
	call_once(m_built, &StorageUnitResolver::buildCache, this);
	return m_cache.size();
}

/**
 * Check for an NVMe controller name, nvme followed only by digits
 */
bool StorageUnitResolver::isNVMeController(const string& name) const
{
	return StringStartsWith(name, "nvme") && name.size() > 4 && StringIsDigits(name.substr(4));
}

/**
 * Return the device paths to look up for a device. A controller
 * device such as /dev/nvme1 is expanded to its namespaces, first from
 * the nvme class in sysfs and otherwise from the device directory.
 *
 * @param device	The configured device path
 * @return		The device followed by any namespace devices
 */
vector<string> StorageUnitResolver::candidateDevices(const string& device) const
{
	vector<string> candidates;
	candidates.push_back(device);

	string controller = pathBasename(device);
	if (!isNVMeController(controller))
		return candidates;

	regex nsPattern("^" + controller + "n[0-9]+$");
	vector<string> entries = listDirectory(m_sysRoot + "/class/nvme/" + controller);
	for (auto it = entries.cbegin(); it != entries.cend(); ++it)
	{
		if (regex_match(*it, nsPattern))
		{
			candidates.push_back(m_devRoot + "/" + *it);
		}
	}

	if (candidates.size() == 1)
	{
		vector<string> matches = globPaths(m_devRoot + "/" + controller + "n*");
		for (auto it = matches.cbegin(); it != matches.cend(); ++it)
		{
			if (regex_match(pathBasename(*it), nsPattern))
			{
				candidates.push_back(*it);
			}
		}
	}

	for (size_t i = 1; i < candidates.size(); i++)
	{
		Logger::getLogger()->debug("Found namespace %s of controller %s",
				candidates[i].c_str(), device.c_str());
	}
	return candidates;
}

/**
 * Register a device under its literal and canonical paths
 */
void StorageUnitResolver::addMapping(const string& device, const string& unitId)
{
	m_cache[device] = unitId;
	string canonical = canonicalPath(device);
	if (canonical.compare(device) != 0)
	{
		m_cache[canonical] = unitId;
	}
	Logger::getLogger()->debug("Mapped device %s to storage unit %s", device.c_str(), unitId.c_str());
}

/**
 * Find the dm-N name of a /dev/mapper device by matching its device
 * number against the dev files of the device mapper block devices
 *
 * @param mapperDevice	The /dev/mapper path
 * @return		The dm-N name or an empty string
 */
string StorageUnitResolver::mapperToDmName(const string& mapperDevice) const
{
	struct stat sb;
	if (stat(mapperDevice.c_str(), &sb) != 0)
	{
		Logger::getLogger()->warn("Unable to stat device mapper device %s", mapperDevice.c_str());
		return "";
	}
	string wanted = to_string(major(sb.st_rdev)) + ":" + to_string(minor(sb.st_rdev));

	vector<string> matches = globPaths(m_sysRoot + "/block/dm-*");
	for (auto it = matches.cbegin(); it != matches.cend(); ++it)
	{
		if (readFirstLine(*it + "/dev").compare(wanted) == 0)
		{
			return pathBasename(*it);
		}
	}
	Logger::getLogger()->warn("No device mapper entry found for %s", mapperDevice.c_str());
	return "";
}

/**
 * Resolve a device mapper device to the physical devices beneath it
 *
 * @param dmName	The dm-N name of the device
 * @return		The device paths of the leaf devices
 */
vector<string> StorageUnitResolver::resolveDeviceMapperSlaves(const string& dmName) const
{
	set<string> visited;
	vector<string> leaves;
	unwindSlaves(dmName, visited, leaves);
	return leaves;
}

/**
 * Walk the slaves of a device mapper device. Slaves that are
 * themselves device mapper devices are walked in turn, a device
 * already visited is not walked again.
 */
void StorageUnitResolver::unwindSlaves(const string& dmName, set<string>& visited, vector<string>& leaves) const
{
	if (!visited.insert(dmName).second)
	{
		Logger::getLogger()->warn("Device mapper loop detected at %s", dmName.c_str());
		return;
	}

	string slavesDir = m_sysRoot + "/block/" + dmName + "/slaves";
	vector<string> slaves;
	if (isDirectory(slavesDir))
	{
		slaves = listDirectory(slavesDir, true);
	}
	if (slaves.empty())
	{
		// A device with no slaves is itself the leaf
		leaves.push_back(m_devRoot + "/" + dmName);
		return;
	}

	for (auto it = slaves.cbegin(); it != slaves.cend(); ++it)
	{
		if (StringStartsWith(*it, "dm-"))
		{
			unwindSlaves(*it, visited, leaves);
		}
		else
		{
			leaves.push_back(m_devRoot + "/" + *it);
		}
	}
}

/**
 * Build the device to storage unit mapping. Called once.
 */
void StorageUnitResolver::buildCache()
{
	Logger *logger = Logger::getLogger();

	if (!isDirectory(m_baseDir))
	{
		logger->debug("Storage unit directory %s does not exist, mapping disabled", m_baseDir.c_str());
		return;
	}
	logger->info("Building storage unit mapping from %s", m_baseDir.c_str());

	string mapperPrefix = m_devRoot + "/mapper/";
	vector<string> units = globPaths(m_baseDir + "/*_*");
	for (auto it = units.cbegin(); it != units.cend(); ++it)
	{
		if (!isDirectory(*it))
			continue;

		string blockPath = *it + "/block";
		string unitId = readFirstLine(*it + "/whoami");
		if (unitId.empty())
		{
			logger->debug("No identity in %s, skipped", it->c_str());
			continue;
		}

		string literal;
		if (!readSymlink(blockPath, literal))
		{
			if (!pathExists(blockPath))
				continue;
			literal = blockPath;
		}
		string canonical = canonicalPath(literal);

		string dmName;
		if (StringStartsWith(pathBasename(canonical), "dm-"))
		{
			dmName = pathBasename(canonical);
		}
		else if (StringStartsWith(literal, mapperPrefix) || StringStartsWith(canonical, mapperPrefix))
		{
			dmName = mapperToDmName(canonical);
			if (dmName.empty())
				continue;
		}

		if (dmName.empty())
		{
			addMapping(literal, unitId);
			if (canonical.compare(literal) != 0)
				addMapping(canonical, unitId);
			continue;
		}

		vector<string> physical = resolveDeviceMapperSlaves(dmName);
		for (auto dev = physical.cbegin(); dev != physical.cend(); ++dev)
		{
			addMapping(*dev, unitId);
		}
	}
	logger->info("Storage unit mapping built with %d device paths", (int)m_cache.size());
}
