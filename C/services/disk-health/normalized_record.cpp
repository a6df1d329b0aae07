/*
 * Disk health service.
 *
 * Copyright (c) 2024 Dianomic Systems
 *
 * Released under the Apache 2.0 Licence
 *
 * Author: Mark Riddoch
 */
#include <normalized_record.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

using namespace std;
using namespace rapidjson;

/**
 * Return the raw value of an attribute, falling back to the
 * normalized value when the device gave no raw value
 *
 * @param attributes	The normalized attributes
 * @param key		The attribute to read
 * @return		The reading, if the device populated it
 */
boost::optional<long long> attributeReading(const AttributeSet& attributes, SmartAttributeKey key)
{
	auto it = attributes.find(key);
	if (it == attributes.end())
		return boost::none;
	if (it->second.rawValue)
		return it->second.rawValue;
	return it->second.value;
}

/**
 * Join the normalized device with the fields derived from it
 *
 * @param raw		The raw smartctl record
 * @param normalized	The output of the attribute normalizer
 * @param nodeName	The node the device is attached to
 * @param instanceId	The instance identity
 * @param storageUnitId	The storage unit using the device, may be empty
 */
NormalizedRecord buildNormalizedRecord(const RawDeviceRecord& raw,
				       const NormalizedDevice& normalized,
				       const string& nodeName,
				       const string& instanceId,
				       const string& storageUnitId)
{
	NormalizedRecord record;
	record.nodeName = nodeName;
	record.instanceId = instanceId;
	record.device = raw.deviceName;
	record.storageUnitId = storageUnitId;
	record.deviceInfo = normalized.info;
	record.capacityGB = normalized.info.capacityGB;
	record.healthStatus = raw.smartPassed;
	record.attributes = normalized.attributes;

	// The normalized value of the temperature attribute is a vendor
	// scale, only the device reading and the raw value are Celsius
	auto temperature = normalized.attributes.find(SmartAttributeKey::TEMPERATURE_CELSIUS);
	if (raw.temperature && *raw.temperature > 0)
		record.temperatureCelsius = raw.temperature;
	else if (temperature != normalized.attributes.end() && temperature->second.rawValue)
		record.temperatureCelsius = *temperature->second.rawValue & 0xFF;	// ATA packs min and max above

	record.reallocatedSectors = attributeReading(normalized.attributes, SmartAttributeKey::REALLOCATED_SECTOR_CT);
	record.pendingSectors = attributeReading(normalized.attributes, SmartAttributeKey::CURRENT_PENDING_SECTOR);
	record.powerOnHours = attributeReading(normalized.attributes, SmartAttributeKey::POWER_ON_HOURS);
	if (!record.powerOnHours)
		record.powerOnHours = raw.powerOnHours;
	record.ssdLifeUsed = wearUsedPercentage(normalized.attributes);

	const vector<SmartAttributeKey>& counters = errorCounterKeys();
	for (auto it = counters.cbegin(); it != counters.cend(); ++it)
	{
		boost::optional<long long> reading = attributeReading(normalized.attributes, *it);
		if (reading)
			record.errorCounts[attributeName(*it)] = *reading;
	}
	return record;
}

static void writeOptional(Writer<StringBuffer>& writer, const char *name, const boost::optional<long long>& value)
{
	writer.Key(name);
	if (value)
		writer.Int64(*value);
	else
		writer.Null();
}

static void writeDeviceInfo(Writer<StringBuffer>& writer, const DeviceInfo& info)
{
	writer.StartObject();
	writer.Key("model_family");
	writer.String(info.modelFamily.c_str());
	writer.Key("device_model");
	writer.String(info.deviceModel.c_str());
	writer.Key("serial_number");
	writer.String(info.serialNumber.c_str());
	writer.Key("firmware_version");
	writer.String(info.firmwareVersion.c_str());
	writer.Key("vendor");
	writer.String(info.vendor.c_str());
	writer.Key("product");
	writer.String(info.product.c_str());
	writer.Key("lun_id");
	writer.String(info.lunId.c_str());
	if (!info.vendorId.empty())
	{
		writer.Key("vendor_id");
		writer.String(info.vendorId.c_str());
		writer.Key("subsystem_vendor_id");
		writer.String(info.subsystemVendorId.c_str());
	}
	writer.Key("capacity");
	writer.Double(info.capacityGB);
	writer.Key("dwpd");
	writer.Double(info.dwpd);
	writer.Key("rpm");
	writer.Int64(info.rpm);
	writer.Key("form_factor");
	writer.String(info.formFactor.c_str());
	writer.Key("media");
	writer.String(info.media.c_str());
	writer.Key("health_status");
	writer.Bool(info.healthStatus);
	writer.EndObject();
}

static void writeRecord(Writer<StringBuffer>& writer, const NormalizedRecord& record)
{
	writer.StartObject();
	writer.Key("node_name");
	writer.String(record.nodeName.c_str());
	writer.Key("instance_id");
	writer.String(record.instanceId.c_str());
	writer.Key("device");
	writer.String(record.device.c_str());
	writer.Key("osd_id");
	writer.String(record.storageUnitId.c_str());
	writer.Key("device_info");
	writeDeviceInfo(writer, record.deviceInfo);
	writer.Key("capacity_gb");
	writer.Double(record.capacityGB);
	writer.Key("health_status");
	if (record.healthStatus)
		writer.Bool(*record.healthStatus);
	else
		writer.Null();
	writeOptional(writer, "temperature_celsius", record.temperatureCelsius);
	writeOptional(writer, "reallocated_sectors", record.reallocatedSectors);
	writeOptional(writer, "pending_sectors", record.pendingSectors);
	writeOptional(writer, "power_on_hours", record.powerOnHours);
	writeOptional(writer, "ssd_life_used", record.ssdLifeUsed);

	writer.Key("error_counts");
	writer.StartObject();
	for (auto it = record.errorCounts.cbegin(); it != record.errorCounts.cend(); ++it)
	{
		writer.Key(it->first.c_str());
		writer.Int64(it->second);
	}
	writer.EndObject();

	writer.Key("attributes");
	writer.StartObject();
	for (auto it = record.attributes.cbegin(); it != record.attributes.cend(); ++it)
	{
		writer.Key(attributeName(it->first).c_str());
		writer.StartObject();
		writer.Key("description");
		writer.String(it->second.description.c_str());
		writer.Key("unit");
		writer.String(it->second.unit.c_str());
		writeOptional(writer, "threshold", it->second.threshold);
		writeOptional(writer, "value", it->second.value);
		writeOptional(writer, "worst", it->second.worst);
		writeOptional(writer, "raw_value", it->second.rawValue);
		writer.EndObject();
	}
	writer.EndObject();
	writer.EndObject();
}

/**
 * Serialise the record as a JSON object
 */
string NormalizedRecord::toJSON() const
{
	StringBuffer buffer;
	Writer<StringBuffer> writer(buffer);
	writeRecord(writer, *this);
	return buffer.GetString();
}

/**
 * Serialise the records of a cycle as a single line JSON array
 */
string recordsToJSON(const vector<NormalizedRecord>& records)
{
	StringBuffer buffer;
	Writer<StringBuffer> writer(buffer);
	writer.StartArray();
	for (auto it = records.cbegin(); it != records.cend(); ++it)
	{
		writeRecord(writer, *it);
	}
	writer.EndArray();
	return buffer.GetString();
}
