/*
 * Disk health service.
 *
 * Copyright (c) 2024 Dianomic Systems
 *
 * Released under the Apache 2.0 Licence
 *
 * Author: Mark Riddoch
 */
#include <smartctl_output.h>
#include <disk_health_exceptions.h>
#include <json_utils.h>
#include <string_utils.h>
#include <logger.h>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <stdio.h>

using namespace std;
using namespace rapidjson;

/**
 * Return the name smartctl uses for a protocol
 */
string protocolName(DeviceProtocol protocol)
{
	switch (protocol)
	{
		case DeviceProtocol::ATA:
			return "ATA";
		case DeviceProtocol::SCSI:
			return "SCSI";
		case DeviceProtocol::NVME:
			return "NVMe";
		default:
			return "unknown";
	}
}

RawDeviceRecord::RawDeviceRecord() : protocol(DeviceProtocol::UNKNOWN), rotationRate(0),
	nvmeTotalCapacity(0), nvmeUnallocatedCapacity(0), smartAvailable(false),
	hasAtaAttributes(false), hasScsiErrorLog(false), hasNVMeHealthLog(false)
{
}

/**
 * Merge the identity returned by "nvme id-ctrl" into the record.
 * nvme-cli reports the untruncated model, serial and firmware strings
 * and the subsystem NQN that carries the OEM name of rebadged drives.
 *
 * @param controller	The controller identity
 */
void RawDeviceRecord::enrich(const NVMeControllerIdentity& controller)
{
	if (!controller.modelNumber.empty())
	{
		modelName = controller.modelNumber;
		deviceModel = controller.modelNumber;
	}
	if (!controller.serialNumber.empty())
		serialNumber = controller.serialNumber;
	if (!controller.firmwareRevision.empty())
		firmwareVersion = controller.firmwareRevision;
	if (controller.totalCapacity > 0)
		nvmeTotalCapacity = controller.totalCapacity;
	if (controller.unallocatedCapacity > 0)
		nvmeUnallocatedCapacity = controller.unallocatedCapacity;
	if (controller.vendorId > 0)
	{
		char buf[32];
		snprintf(buf, sizeof(buf), "VID:0x%04llx", controller.vendorId);
		vendor = buf;
	}
	if (!controller.subsystemNQN.empty())
	{
		product = controller.subsystemNQN;
		Logger::getLogger()->debug("SubsystemNQN %s added to %s for OEM detection",
				controller.subsystemNQN.c_str(), deviceName.c_str());
	}
	if (!controller.ieee.empty())
		logicalUnitId = controller.ieee;

	nvmeController = controller;
}

/**
 * Merge the NVMe error log into the record. The media error count
 * and the number of log entries replace the values of the health log.
 *
 * @param errorLog	The error log
 */
void RawDeviceRecord::enrich(const NVMeErrorLog& errorLog)
{
	if (!errorLog.errors.empty())
	{
		NVMeErrorSummary summary = classifyNVMeErrors(errorLog);
		if (hasNVMeHealthLog)
		{
			nvmeHealth.mediaErrors = summary.mediaErrors;
			nvmeHealth.numErrLogEntries = errorLog.errors.size();
		}
		Logger::getLogger()->debug("NVMe error analysis for %s: total %lld, media %lld",
				deviceName.c_str(), summary.totalErrors, summary.mediaErrors);
	}
	nvmeErrorLog = errorLog;
}

/**
 * Parse one row of the SCSI error counter log
 */
static void parseScsiErrorCounter(const Value& log, const char *name, ScsiErrorCounter& counter)
{
	const Value *row = JSONGetObject(log, name);
	if (!row)
		return;
	counter.totalErrorsCorrected = JSONGetInt64(*row, "total_errors_corrected", 0);
	counter.totalUncorrectedErrors = JSONGetInt64(*row, "total_uncorrected_errors", 0);

	// Some smartctl versions print this as a string, others as a number
	Value::ConstMemberIterator itr = row->FindMember("gigabytes_processed");
	if (itr != row->MemberEnd())
	{
		if (itr->value.IsString())
		{
			counter.gigabytesProcessed = itr->value.GetString();
		}
		else if (itr->value.IsNumber())
		{
			char buf[64];
			snprintf(buf, sizeof(buf), "%.3f", itr->value.GetDouble());
			counter.gigabytesProcessed = buf;
		}
	}
}

/**
 * Parse the JSON output of smartctl for a single device.
 *
 * @param json		The smartctl output
 * @param device	The device that was queried, used when the
 *			output does not name the device
 * @return		The raw device record
 * @throws CollectionException if the output cannot be parsed or
 *	smartctl reports that it failed to open the device
 */
RawDeviceRecord parseSmartctlOutput(const string& json, const string& device)
{
	Document doc;
	doc.Parse(json.c_str());
	if (doc.HasParseError())
	{
		throw CollectionException("Unable to parse smartctl output for " + device + ": "
				+ GetParseError_En(doc.GetParseError()));
	}
	if (!doc.IsObject())
	{
		throw CollectionException("Unexpected smartctl output for " + device);
	}

	// Bits 0 and 1 of the exit status are command line and device open failures
	const Value *smartctl = JSONGetObject(doc, "smartctl");
	if (smartctl)
	{
		long long exitStatus = JSONGetInt64(*smartctl, "exit_status", 0);
		if (exitStatus & 0x3)
		{
			string reason = "exit status " + to_string(exitStatus);
			const Value *messages = JSONGetArray(*smartctl, "messages");
			if (messages && messages->Size() > 0)
			{
				reason = JSONGetString((*messages)[0], "string", reason);
			}
			throw CollectionException("smartctl failed for " + device + ": " + reason);
		}
	}

	RawDeviceRecord record;
	record.deviceName = device;

	const Value *dev = JSONGetObject(doc, "device");
	if (dev)
	{
		record.deviceName = JSONGetString(*dev, "name", device);
		record.infoName = JSONGetString(*dev, "info_name");
		record.deviceType = JSONGetString(*dev, "type");
		string protocol = JSONGetString(*dev, "protocol");
		if (protocol == "ATA")
			record.protocol = DeviceProtocol::ATA;
		else if (protocol == "SCSI")
			record.protocol = DeviceProtocol::SCSI;
		else if (protocol == "NVMe")
			record.protocol = DeviceProtocol::NVME;
	}

	record.modelFamily = JSONGetString(doc, "model_family");
	record.modelName = JSONGetString(doc, "model_name");
	record.scsiModelName = JSONGetString(doc, "scsi_model_name");
	record.deviceModel = JSONGetString(doc, "device_model");
	if (record.deviceModel.empty())
		record.deviceModel = record.modelName;
	if (record.deviceModel.empty())
		record.deviceModel = record.scsiModelName;
	record.serialNumber = JSONGetString(doc, "serial_number");
	record.firmwareVersion = JSONGetString(doc, "firmware_version");
	record.vendor = JSONGetString(doc, "vendor");
	record.product = JSONGetString(doc, "product");
	record.logicalUnitId = JSONGetString(doc, "logical_unit_id");
	record.scsiVendor = JSONGetString(doc, "scsi_vendor");
	record.scsiProduct = JSONGetString(doc, "scsi_product");
	record.rotationRate = JSONGetInt64(doc, "rotation_rate", 0);

	const Value *formFactor = JSONGetObject(doc, "form_factor");
	if (formFactor)
		record.formFactor = JSONGetString(*formFactor, "name");

	long long value;
	const Value *userCapacity = JSONGetObject(doc, "user_capacity");
	if (userCapacity && JSONHasInt64(*userCapacity, "bytes", value))
		record.userCapacityBytes = value;
	record.nvmeTotalCapacity = JSONGetInt64(doc, "nvme_total_capacity", 0);
	record.nvmeUnallocatedCapacity = JSONGetInt64(doc, "nvme_unallocated_capacity", 0);

	const Value *pciVendor = JSONGetObject(doc, "nvme_pci_vendor");
	if (pciVendor)
	{
		if (JSONHasInt64(*pciVendor, "id", value))
			record.nvmePciVendorId = value;
		if (JSONHasInt64(*pciVendor, "subsystem_id", value))
			record.nvmePciSubsystemId = value;
	}

	const Value *smartSupport = JSONGetObject(doc, "smart_support");
	if (smartSupport)
		record.smartAvailable = JSONGetBool(*smartSupport, "available", false);
	const Value *smartStatus = JSONGetObject(doc, "smart_status");
	if (smartStatus && smartStatus->HasMember("passed"))
		record.smartPassed = JSONGetBool(*smartStatus, "passed", false);

	const Value *powerOnTime = JSONGetObject(doc, "power_on_time");
	if (powerOnTime && JSONHasInt64(*powerOnTime, "hours", value))
		record.powerOnHours = value;
	const Value *temperature = JSONGetObject(doc, "temperature");
	if (temperature && JSONHasInt64(*temperature, "current", value))
		record.temperature = value;

	const Value *ataAttributes = JSONGetObject(doc, "ata_smart_attributes");
	const Value *table = ataAttributes ? JSONGetArray(*ataAttributes, "table") : NULL;
	if (table)
	{
		record.hasAtaAttributes = true;
		for (Value::ConstValueIterator itr = table->Begin(); itr != table->End(); ++itr)
		{
			if (!itr->IsObject())
				continue;
			AtaAttributeEntry entry;
			entry.id = JSONGetInt64(*itr, "id", 0);
			entry.name = JSONGetString(*itr, "name");
			entry.value = JSONGetInt64(*itr, "value", 0);
			entry.worst = JSONGetInt64(*itr, "worst", 0);
			entry.thresh = JSONGetInt64(*itr, "thresh", 0);
			const Value *raw = JSONGetObject(*itr, "raw");
			entry.raw = raw ? JSONGetInt64(*raw, "value", 0) : 0;
			record.ataAttributes.push_back(entry);
		}
	}

	const Value *startStop = JSONGetObject(doc, "scsi_start_stop_cycle_counter");
	if (startStop && JSONHasInt64(*startStop, "accumulated_start_stop_cycles", value))
		record.scsiStartStopCycles = value;
	if (JSONHasInt64(doc, "scsi_grown_defect_list", value))
		record.scsiGrownDefects = value;

	const Value *errorLog = JSONGetObject(doc, "scsi_error_counter_log");
	if (errorLog)
	{
		record.hasScsiErrorLog = true;
		parseScsiErrorCounter(*errorLog, "read", record.scsiRead);
		parseScsiErrorCounter(*errorLog, "write", record.scsiWrite);
		parseScsiErrorCounter(*errorLog, "verify", record.scsiVerify);
	}

	const Value *health = JSONGetObject(doc, "nvme_smart_health_information_log");
	if (health)
	{
		record.hasNVMeHealthLog = true;
		NVMeHealthLog& log = record.nvmeHealth;
		log.criticalWarning = JSONGetInt64(*health, "critical_warning", 0);
		log.temperature = JSONGetInt64(*health, "temperature", 0);
		log.availableSpare = JSONGetInt64(*health, "available_spare", 0);
		log.availableSpareThreshold = JSONGetInt64(*health, "available_spare_threshold", 0);
		log.percentageUsed = JSONGetInt64(*health, "percentage_used", 0);
		log.powerCycles = JSONGetInt64(*health, "power_cycles", 0);
		log.powerOnHours = JSONGetInt64(*health, "power_on_hours", 0);
		log.unsafeShutdowns = JSONGetInt64(*health, "unsafe_shutdowns", 0);
		log.hostReads = JSONGetInt64(*health, "host_reads", 0);
		log.hostWrites = JSONGetInt64(*health, "host_writes", 0);
		log.controllerBusyTime = JSONGetInt64(*health, "controller_busy_time", 0);
		log.mediaErrors = JSONGetInt64(*health, "media_errors", 0);
		log.numErrLogEntries = JSONGetInt64(*health, "num_err_log_entries", 0);
	}

	return record;
}

/**
 * Parse the output of "smartctl --scan-open -j"
 *
 * @param json	The smartctl output
 * @return	The names of the SMART capable devices
 * @throws CollectionException if the output cannot be parsed
 */
vector<string> parseSmartctlScan(const string& json)
{
	Document doc;
	doc.Parse(json.c_str());
	if (doc.HasParseError() || !doc.IsObject())
	{
		throw CollectionException("Unable to parse smartctl scan output");
	}

	vector<string> devices;
	const Value *list = JSONGetArray(doc, "devices");
	if (!list)
		return devices;
	for (Value::ConstValueIterator itr = list->Begin(); itr != list->End(); ++itr)
	{
		string name = JSONGetString(*itr, "name");
		if (!name.empty())
			devices.push_back(name);
	}
	return devices;
}
