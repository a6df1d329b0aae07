#ifndef _DEVICE_INFO_H
#define _DEVICE_INFO_H
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
#include <smartctl_output.h>
#include <smart_attributes.h>

/**
 * The canonical description of a device, derived each cycle
 * from the raw smartctl record.
 */
class DeviceInfo
{
	public:
		DeviceInfo() : capacityGB(0), dwpd(0), rpm(0), healthStatus(false) {};

		std::string	vendor;
		std::string	product;
		std::string	modelFamily;
		std::string	deviceModel;
		std::string	serialNumber;
		std::string	firmwareVersion;
		std::string	lunId;
		std::string	vendorId;
		std::string	subsystemVendorId;
		double		capacityGB;
		double		dwpd;
		long long	rpm;
		std::string	formFactor;
		std::string	media;
		bool		healthStatus;
};

DeviceInfo	fillDeviceInfo(const RawDeviceRecord& raw, const AttributeSet& attributes);
bool		normalizeDeviceInfo(DeviceInfo& info);
void		normalizeVendor(DeviceInfo& info);
std::string	detectOEMRelationship(const std::string& vendor, const std::string& model,
				const std::string& product);
void		enhanceDeviceInfo(DeviceInfo& info);

#endif
