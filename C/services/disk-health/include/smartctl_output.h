#ifndef _SMARTCTL_OUTPUT_H
#define _SMARTCTL_OUTPUT_H
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
#include <boost/optional.hpp>
#include <nvme_cli_output.h>

/**
 * The device protocol as reported by smartctl
 */
enum class DeviceProtocol
{
	UNKNOWN,
	ATA,
	SCSI,
	NVME
};

std::string protocolName(DeviceProtocol protocol);

/**
 * One row of the ATA SMART attribute table
 */
struct AtaAttributeEntry
{
	long long	id;
	std::string	name;
	long long	value;
	long long	worst;
	long long	thresh;
	long long	raw;
};

/**
 * One of the read, write or verify rows of the SCSI error counter log
 */
struct ScsiErrorCounter
{
	ScsiErrorCounter() : totalErrorsCorrected(0), totalUncorrectedErrors(0) {};
	long long	totalErrorsCorrected;
	long long	totalUncorrectedErrors;
	std::string	gigabytesProcessed;
};

/**
 * The NVMe SMART/health information log page
 */
struct NVMeHealthLog
{
	NVMeHealthLog() : criticalWarning(0), temperature(0), availableSpare(0),
			availableSpareThreshold(0), percentageUsed(0), powerCycles(0),
			powerOnHours(0), unsafeShutdowns(0), hostReads(0), hostWrites(0),
			controllerBusyTime(0), mediaErrors(0), numErrLogEntries(0) {};
	long long	criticalWarning;
	long long	temperature;
	long long	availableSpare;
	long long	availableSpareThreshold;
	long long	percentageUsed;
	long long	powerCycles;
	long long	powerOnHours;
	long long	unsafeShutdowns;
	long long	hostReads;
	long long	hostWrites;
	long long	controllerBusyTime;
	long long	mediaErrors;
	long long	numErrLogEntries;
};

/**
 * The protocol tagged record of a single smartctl run against
 * one device. It is built by the command adapter, optionally
 * enriched with nvme-cli data, and then only read.
 */
class RawDeviceRecord
{
	public:
		RawDeviceRecord();

		DeviceProtocol			protocol;
		std::string			deviceName;
		std::string			infoName;
		std::string			deviceType;

		std::string			modelFamily;
		std::string			deviceModel;
		std::string			modelName;
		std::string			serialNumber;
		std::string			firmwareVersion;
		std::string			vendor;
		std::string			product;
		std::string			logicalUnitId;
		std::string			scsiVendor;
		std::string			scsiProduct;
		std::string			scsiModelName;
		std::string			formFactor;
		long long			rotationRate;

		boost::optional<long long>	userCapacityBytes;
		long long			nvmeTotalCapacity;
		long long			nvmeUnallocatedCapacity;
		boost::optional<long long>	nvmePciVendorId;
		boost::optional<long long>	nvmePciSubsystemId;

		bool				smartAvailable;
		boost::optional<bool>		smartPassed;
		boost::optional<long long>	powerOnHours;
		boost::optional<long long>	temperature;

		bool				hasAtaAttributes;
		std::vector<AtaAttributeEntry>	ataAttributes;

		boost::optional<long long>	scsiStartStopCycles;
		boost::optional<long long>	scsiGrownDefects;
		bool				hasScsiErrorLog;
		ScsiErrorCounter		scsiRead;
		ScsiErrorCounter		scsiWrite;
		ScsiErrorCounter		scsiVerify;

		bool				hasNVMeHealthLog;
		NVMeHealthLog			nvmeHealth;

		// Data merged from nvme-cli, when available
		boost::optional<NVMeControllerIdentity>	nvmeController;
		boost::optional<NVMeErrorLog>		nvmeErrorLog;

		void				enrich(const NVMeControllerIdentity& controller);
		void				enrich(const NVMeErrorLog& errorLog);
};

RawDeviceRecord parseSmartctlOutput(const std::string& json, const std::string& device);
std::vector<std::string> parseSmartctlScan(const std::string& json);

#endif
