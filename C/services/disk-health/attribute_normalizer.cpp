/*
 * Disk health service.
 *
 * Copyright (c) 2024 Dianomic Systems
 *
 * Released under the Apache 2.0 Licence
 *
 * Author: Mark Riddoch
 */
#include <attribute_normalizer.h>
#include <nvme_cli_output.h>
#include <logger.h>
#include <stdlib.h>
#include <errno.h>

using namespace std;

/**
 * Parse the decimal string smartctl uses for the SCSI gigabytes
 * processed counters. The fractional part is discarded.
 *
 * @param value	The string to parse
 * @return	The whole number of gigabytes, 0 if not a number
 */
long long parseGigabytes(const string& value)
{
	if (value.empty())
		return 0;
	char *end;
	errno = 0;
	double gb = strtod(value.c_str(), &end);
	if (end == value.c_str() || errno == ERANGE || gb < 0)
		return 0;
	return (long long)gb;
}

/**
 * Normalize a raw smartctl record
 *
 * @param raw	The record returned by the command adapter
 * @return	The device description and the populated attributes
 */
NormalizedDevice AttributeNormalizer::normalize(const RawDeviceRecord& raw) const
{
	NormalizedDevice result;
	result.attributes = newAttributeSet();

	switch (raw.protocol)
	{
		case DeviceProtocol::ATA:
			processAta(raw, result.attributes);
			break;
		case DeviceProtocol::SCSI:
			processScsi(raw, result.attributes);
			break;
		case DeviceProtocol::NVME:
			processNVMe(raw, result.attributes);
			processNVMeEnrichment(raw, result.attributes);
			break;
		default:
			Logger::getLogger()->warn("Device %s reports an unsupported protocol",
					raw.deviceName.c_str());
			break;
	}
	cleanupSmartAttributes(result.attributes);

	result.info = fillDeviceInfo(raw, result.attributes);
	normalizeDeviceInfo(result.info);
	normalizeVendor(result.info);
	enhanceDeviceInfo(result.info);
	if (result.info.capacityGB < 0)
		result.info.capacityGB = 0;

	return result;
}

/**
 * Set the value and raw value of an attribute to a single reading
 */
void AttributeNormalizer::setReading(AttributeSet& attributes, SmartAttributeKey key, long long reading) const
{
	auto it = attributes.find(key);
	if (it == attributes.end())
		return;
	it->second.value = reading;
	it->second.rawValue = reading;
}

/**
 * Walk the ATA attribute table. Names are resolved through the
 * catalog, anything not in the catalog is dropped.
 */
void AttributeNormalizer::processAta(const RawDeviceRecord& raw, AttributeSet& attributes) const
{
	for (auto it = raw.ataAttributes.cbegin(); it != raw.ataAttributes.cend(); ++it)
	{
		SmartAttributeKey key;
		if (!lookupAttributeKey(it->name, key))
		{
			Logger::getLogger()->warn("Unrecognized ATA SMART attribute %s on %s",
					it->name.c_str(), raw.deviceName.c_str());
			continue;
		}
		auto attr = attributes.find(key);
		if (attr == attributes.end())
			continue;

		if (isWearAttribute(key))
		{
			// The device reports life remaining, we publish life used
			attr->second.value = 100 - it->value;
		}
		else
		{
			attr->second.value = it->value;
		}
		attr->second.worst = it->worst;
		attr->second.threshold = it->thresh;
		attr->second.rawValue = it->raw;
		Logger::getLogger()->debug("%s: %s value %lld raw %lld", raw.deviceName.c_str(),
				it->name.c_str(), *attr->second.value, it->raw);
	}
}

/**
 * Populate the attributes carried by the SCSI log pages
 */
void AttributeNormalizer::processScsi(const RawDeviceRecord& raw, AttributeSet& attributes) const
{
	Logger *logger = Logger::getLogger();

	if (raw.powerOnHours)
		setReading(attributes, SmartAttributeKey::POWER_ON_HOURS, *raw.powerOnHours);

	if (raw.temperature)
	{
		if (*raw.temperature > 0)
			setReading(attributes, SmartAttributeKey::TEMPERATURE_CELSIUS, *raw.temperature);
		else
			logger->warn("Unexpected temperature value %lld for SCSI device %s",
					*raw.temperature, raw.deviceName.c_str());
	}

	if (raw.scsiStartStopCycles)
		setReading(attributes, SmartAttributeKey::POWER_CYCLE_COUNT, *raw.scsiStartStopCycles);

	if (raw.scsiGrownDefects)
	{
		if (*raw.scsiGrownDefects >= 0)
			setReading(attributes, SmartAttributeKey::GROWN_DEFECTS_COUNT, *raw.scsiGrownDefects);
		else
			logger->warn("Invalid grown defects count %lld for SCSI device %s",
					*raw.scsiGrownDefects, raw.deviceName.c_str());
	}

	if (!raw.hasScsiErrorLog)
		return;

	setReading(attributes, SmartAttributeKey::READ_ERRORS_CORRECTED, raw.scsiRead.totalErrorsCorrected);
	setReading(attributes, SmartAttributeKey::WRITE_ERRORS_CORRECTED, raw.scsiWrite.totalErrorsCorrected);
	setReading(attributes, SmartAttributeKey::VERIFY_ERRORS_CORRECTED, raw.scsiVerify.totalErrorsCorrected);

	setReading(attributes, SmartAttributeKey::TOTAL_UNCORRECTED_READ_ERRORS, raw.scsiRead.totalUncorrectedErrors);
	setReading(attributes, SmartAttributeKey::TOTAL_UNCORRECTED_WRITE_ERRORS, raw.scsiWrite.totalUncorrectedErrors);
	setReading(attributes, SmartAttributeKey::TOTAL_UNCORRECTED_VERIFY_ERRORS, raw.scsiVerify.totalUncorrectedErrors);

	if (!raw.scsiRead.gigabytesProcessed.empty())
		setReading(attributes, SmartAttributeKey::READ_GIGABYTES_PROCESSED,
				parseGigabytes(raw.scsiRead.gigabytesProcessed));
	if (!raw.scsiWrite.gigabytesProcessed.empty())
		setReading(attributes, SmartAttributeKey::WRITE_GIGABYTES_PROCESSED,
				parseGigabytes(raw.scsiWrite.gigabytesProcessed));
	if (!raw.scsiVerify.gigabytesProcessed.empty())
		setReading(attributes, SmartAttributeKey::VERIFY_GIGABYTES_PROCESSED,
				parseGigabytes(raw.scsiVerify.gigabytesProcessed));
}

/**
 * Populate the attributes carried by the NVMe SMART/health log
 */
void AttributeNormalizer::processNVMe(const RawDeviceRecord& raw, AttributeSet& attributes) const
{
	if (!raw.hasNVMeHealthLog)
		return;

	Logger *logger = Logger::getLogger();
	const NVMeHealthLog& log = raw.nvmeHealth;

	setReading(attributes, SmartAttributeKey::POWER_ON_HOURS, log.powerOnHours);
	if (log.temperature > 0)
		setReading(attributes, SmartAttributeKey::TEMPERATURE_CELSIUS, log.temperature);
	else
		logger->warn("Unexpected temperature value %lld for NVMe device %s",
				log.temperature, raw.deviceName.c_str());
	setReading(attributes, SmartAttributeKey::POWER_CYCLE_COUNT, log.powerCycles);
	setReading(attributes, SmartAttributeKey::UNSAFE_SHUTDOWNS, log.unsafeShutdowns);
	setReading(attributes, SmartAttributeKey::HOST_READ_COMMANDS, log.hostReads);
	setReading(attributes, SmartAttributeKey::HOST_WRITE_COMMANDS, log.hostWrites);
	setReading(attributes, SmartAttributeKey::CONTROLLER_BUSY_TIME, log.controllerBusyTime);
	setReading(attributes, SmartAttributeKey::ERROR_INFORMATION_LOG_ENTRIES, log.numErrLogEntries);
	if (log.percentageUsed >= 0 && log.percentageUsed <= 100)
		setReading(attributes, SmartAttributeKey::PERCENTAGE_USED, log.percentageUsed);
	else
		logger->warn("Unexpected percentage used value %lld for NVMe device %s",
				log.percentageUsed, raw.deviceName.c_str());
	setReading(attributes, SmartAttributeKey::AVAILABLE_SPARE, log.availableSpare);
	setReading(attributes, SmartAttributeKey::AVAILABLE_SPARE_THRESHOLD, log.availableSpareThreshold);
	setReading(attributes, SmartAttributeKey::MEDIA_AND_DATA_INTEGRITY_ERRORS, log.mediaErrors);
}

/**
 * Populate the attributes derived from the nvme-cli controller
 * identity and error log, when the command adapter obtained them
 */
void AttributeNormalizer::processNVMeEnrichment(const RawDeviceRecord& raw, AttributeSet& attributes) const
{
	if (raw.nvmeErrorLog)
	{
		NVMeErrorSummary summary = classifyNVMeErrors(*raw.nvmeErrorLog);
		setReading(attributes, SmartAttributeKey::NVME_ERROR_LOG_ENTRIES,
				raw.nvmeErrorLog->errors.size());
		if (summary.mediaErrors > 0)
			setReading(attributes, SmartAttributeKey::NVME_MEDIA_ERRORS, summary.mediaErrors);
		if (summary.abortedCommands > 0)
			setReading(attributes, SmartAttributeKey::NVME_ABORTED_COMMANDS, summary.abortedCommands);
		if (summary.timeoutErrors > 0)
			setReading(attributes, SmartAttributeKey::NVME_TIMEOUT_ERRORS, summary.timeoutErrors);
		if (summary.fabricWarnings > 0)
			setReading(attributes, SmartAttributeKey::NVME_FABRIC_WARNINGS, summary.fabricWarnings);
		if (summary.sparseErrors > 0)
			setReading(attributes, SmartAttributeKey::NVME_SPARSE_ERRORS, summary.sparseErrors);
		if (summary.changeNotifications > 0)
			setReading(attributes, SmartAttributeKey::NVME_CHANGE_NOTIFICATIONS, summary.changeNotifications);
	}

	if (raw.nvmeController)
	{
		const NVMeControllerIdentity& controller = *raw.nvmeController;
		if (controller.vendorId > 0)
			setReading(attributes, SmartAttributeKey::NVME_VENDOR_ID, controller.vendorId);
		if (controller.subsystemVendorId > 0)
			setReading(attributes, SmartAttributeKey::NVME_SUBSYSTEM_VENDOR_ID,
					controller.subsystemVendorId);
		if (!controller.ieee.empty())
		{
			char *end;
			long long oui = strtoll(controller.ieee.c_str(), &end, 16);
			if (end != controller.ieee.c_str() && *end == '\0')
				setReading(attributes, SmartAttributeKey::NVME_IEEE_OUI, oui);
			else
				Logger::getLogger()->debug("IEEE OUI '%s' of %s is not hexadecimal",
						controller.ieee.c_str(), raw.deviceName.c_str());
		}
	}
}
