#ifndef _NORMALIZED_RECORD_H
#define _NORMALIZED_RECORD_H
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
#include <map>
#include <boost/optional.hpp>
#include <attribute_normalizer.h>

/**
 * The per device, per cycle unit of publication. It joins the
 * device description, the canonical attributes, the scalar fields
 * derived from them and the storage unit that consumes the device.
 */
class NormalizedRecord
{
	public:
		NormalizedRecord() : capacityGB(0) {};

		std::string			nodeName;
		std::string			instanceId;
		std::string			device;
		std::string			storageUnitId;
		DeviceInfo			deviceInfo;
		double				capacityGB;
		boost::optional<bool>		healthStatus;
		boost::optional<long long>	temperatureCelsius;
		boost::optional<long long>	reallocatedSectors;
		boost::optional<long long>	pendingSectors;
		boost::optional<long long>	powerOnHours;
		boost::optional<long long>	ssdLifeUsed;
		std::map<std::string, long long>
						errorCounts;
		AttributeSet			attributes;

		std::string			toJSON() const;
};

NormalizedRecord buildNormalizedRecord(const RawDeviceRecord& raw,
				       const NormalizedDevice& normalized,
				       const std::string& nodeName,
				       const std::string& instanceId,
				       const std::string& storageUnitId);
boost::optional<long long> attributeReading(const AttributeSet& attributes, SmartAttributeKey key);
std::string recordsToJSON(const std::vector<NormalizedRecord>& records);

#endif
