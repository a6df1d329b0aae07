#ifndef _STORAGE_UNIT_RESOLVER_H
#define _STORAGE_UNIT_RESOLVER_H
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
#include <set>
#include <map>
#include <mutex>

/**
 * Maps a physical device to the identifier of the storage unit
 * (object storage daemon) that consumes it.
 *
 * The base directory holds one "<fsid>_<uuid>" directory per storage
 * unit, each with a "block" symlink to its device and a "whoami" file
 * containing the unit identifier. Device mapper targets are unwound
 * through sysfs to the physical devices beneath them.
 *
 * The mapping is built on first use and then never rebuilt, a device
 * that is swapped needs a restart of the service to be remapped.
 */
class StorageUnitResolver
{
	public:
		StorageUnitResolver(const std::string& baseDir,
				    const std::string& sysRoot = "/sys",
				    const std::string& devRoot = "/dev");
		~StorageUnitResolver() {};

		std::string			resolve(const std::string& device);
		std::vector<std::string>	candidateDevices(const std::string& device) const;
		std::vector<std::string>	resolveDeviceMapperSlaves(const std::string& dmName) const;
		size_t				mappingCount();

	private:
		void				buildCache();
		void				addMapping(const std::string& device, const std::string& unitId);
		std::string			mapperToDmName(const std::string& mapperDevice) const;
		void				unwindSlaves(const std::string& dmName,
							     std::set<std::string>& visited,
							     std::vector<std::string>& leaves) const;
		bool				isNVMeController(const std::string& name) const;

		std::string			m_baseDir;
		std::string			m_sysRoot;
		std::string			m_devRoot;
		std::map<std::string, std::string>
						m_cache;
		std::once_flag			m_built;
};

#endif
