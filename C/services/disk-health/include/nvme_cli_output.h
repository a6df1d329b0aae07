#ifndef _NVME_CLI_OUTPUT_H
#define _NVME_CLI_OUTPUT_H
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

/**
 * The fields of "nvme id-ctrl -o json" that are merged into
 * the smartctl record
 */
struct NVMeControllerIdentity
{
	NVMeControllerIdentity() : vendorId(0), subsystemVendorId(0),
			totalCapacity(0), unallocatedCapacity(0) {};
	long long	vendorId;
	long long	subsystemVendorId;
	std::string	modelNumber;
	std::string	serialNumber;
	std::string	firmwareRevision;
	std::string	subsystemNQN;
	std::string	ieee;
	long long	totalCapacity;
	long long	unallocatedCapacity;
};

/**
 * A single entry of "nvme error-log -o json"
 */
struct NVMeErrorEntry
{
	NVMeErrorEntry() : errorCount(0), statusField(0), lba(0), namespaceId(0),
			vendorSpecific(0), transportType(0), transportTypeSpecificInfo(0) {};
	long long	errorCount;
	long long	statusField;
	long long	lba;
	long long	namespaceId;
	long long	vendorSpecific;
	long long	transportType;
	long long	transportTypeSpecificInfo;
};

struct NVMeErrorLog
{
	std::vector<NVMeErrorEntry>	errors;
};

/**
 * Error counts derived by classifying the entries of an NVMe error log
 */
struct NVMeErrorSummary
{
	NVMeErrorSummary() : totalErrors(0), mediaErrors(0), abortedCommands(0),
			timeoutErrors(0), fabricWarnings(0), sparseErrors(0),
			changeNotifications(0) {};
	long long	totalErrors;
	long long	mediaErrors;
	long long	abortedCommands;
	long long	timeoutErrors;
	long long	fabricWarnings;
	long long	sparseErrors;
	long long	changeNotifications;
};

#define NVME_STATUS_CODE_MASK		0x7FF
#define NVME_STATUS_MEDIA_ERROR		0x281
#define NVME_STATUS_UNRECOVERED_READ	0x282
#define NVME_STATUS_ABORTED		0x7
#define NVME_STATUS_TIMEOUT		0x4

NVMeControllerIdentity parseNVMeIdController(const std::string& json);
NVMeErrorLog parseNVMeErrorLog(const std::string& json);
NVMeErrorSummary classifyNVMeErrors(const NVMeErrorLog& errorLog);

#endif
