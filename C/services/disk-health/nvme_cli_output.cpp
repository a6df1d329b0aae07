/*
 * Disk health service.
 *
 * Copyright (c) 2024 Dianomic Systems
 *
 * Released under the Apache 2.0 Licence
 *
 * Author: Mark Riddoch
 */
#include <nvme_cli_output.h>
#include <disk_health_exceptions.h>
#include <json_utils.h>
#include <string_utils.h>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <stdio.h>

using namespace std;
using namespace rapidjson;

/**
 * Parse the JSON output of "nvme id-ctrl <device> -o json"
 *
 * @param json	The output of nvme-cli
 * @return	The controller identity fields
 * @throws CollectionException if the output is not a JSON object
 */
NVMeControllerIdentity parseNVMeIdController(const string& json)
{
	Document doc;
	doc.Parse(json.c_str());
	if (doc.HasParseError() || !doc.IsObject())
	{
		throw CollectionException(string("Unable to parse nvme id-ctrl output: ")
				+ (doc.HasParseError() ? GetParseError_En(doc.GetParseError()) : "not an object"));
	}

	NVMeControllerIdentity identity;
	identity.vendorId = JSONGetInt64(doc, "vid", 0);
	identity.subsystemVendorId = JSONGetInt64(doc, "ssvid", 0);
	identity.modelNumber = StringTrim(JSONGetString(doc, "mn"));
	identity.serialNumber = StringTrim(JSONGetString(doc, "sn"));
	identity.firmwareRevision = StringTrim(JSONGetString(doc, "fr"));
	identity.subsystemNQN = StringTrim(JSONGetString(doc, "subnqn"));
	identity.totalCapacity = JSONGetInt64(doc, "tnvmcap", 0);
	identity.unallocatedCapacity = JSONGetInt64(doc, "unvmcap", 0);

	// Depending on the nvme-cli version the IEEE OUI is a number or a string
	long long oui;
	Value::ConstMemberIterator itr = doc.FindMember("ieee");
	if (itr != doc.MemberEnd() && itr->value.IsString())
	{
		identity.ieee = StringTrim(itr->value.GetString());
	}
	else if (JSONHasInt64(doc, "ieee", oui) && oui > 0)
	{
		char buf[32];
		snprintf(buf, sizeof(buf), "0x%06llx", oui);
		identity.ieee = buf;
	}
	return identity;
}

/**
 * Parse the JSON output of "nvme error-log <device> -o json"
 *
 * @param json	The output of nvme-cli
 * @return	The error log entries
 * @throws CollectionException if the output is not a JSON object
 */
NVMeErrorLog parseNVMeErrorLog(const string& json)
{
	Document doc;
	doc.Parse(json.c_str());
	if (doc.HasParseError() || !doc.IsObject())
	{
		throw CollectionException(string("Unable to parse nvme error-log output: ")
				+ (doc.HasParseError() ? GetParseError_En(doc.GetParseError()) : "not an object"));
	}

	NVMeErrorLog errorLog;
	const Value *entries = JSONGetArray(doc, "errors");
	if (!entries)
	{
		entries = JSONGetArray(doc, "error_log");
	}
	if (!entries)
	{
		return errorLog;
	}

	for (Value::ConstValueIterator itr = entries->Begin(); itr != entries->End(); ++itr)
	{
		if (!itr->IsObject())
			continue;
		NVMeErrorEntry entry;
		entry.errorCount = JSONGetInt64(*itr, "error_count", 0);
		entry.statusField = JSONGetInt64(*itr, "status_field", 0);
		entry.lba = JSONGetInt64(*itr, "lba", 0);
		entry.namespaceId = JSONGetInt64(*itr, "nsid", 0);
		entry.vendorSpecific = JSONGetInt64(*itr, "vs", 0);
		entry.transportType = JSONGetInt64(*itr, "trtype", 0);
		entry.transportTypeSpecificInfo = JSONGetInt64(*itr, "trtype_spec_info", 0);
		errorLog.errors.push_back(entry);
	}
	return errorLog;
}

/**
 * Classify the entries of an NVMe error log.
 *
 * Only entries with a non-zero error count contribute. The status
 * code is the low eleven bits of the status field. A single entry may
 * count towards several classes, e.g. an unrecovered media error with
 * an LBA is both a media error and a sparse error.
 *
 * @param errorLog	The error log to classify
 * @return		The error counts by class
 */
NVMeErrorSummary classifyNVMeErrors(const NVMeErrorLog& errorLog)
{
	NVMeErrorSummary summary;

	for (size_t i = 0; i < errorLog.errors.size(); i++)
	{
		const NVMeErrorEntry& entry = errorLog.errors[i];
		if (entry.errorCount <= 0)
			continue;

		summary.totalErrors += entry.errorCount;
		long long statusCode = entry.statusField & NVME_STATUS_CODE_MASK;
		switch (statusCode)
		{
			case NVME_STATUS_MEDIA_ERROR:
				summary.mediaErrors += entry.errorCount;
				break;
			case NVME_STATUS_ABORTED:
				summary.abortedCommands += entry.errorCount;
				break;
			case NVME_STATUS_TIMEOUT:
				summary.timeoutErrors += entry.errorCount;
				break;
			default:
				break;
		}

		if (entry.transportType > 0 && entry.transportTypeSpecificInfo > 0)
		{
			summary.fabricWarnings += entry.errorCount;
		}
		if (entry.lba > 0 && (statusCode == NVME_STATUS_MEDIA_ERROR
					|| statusCode == NVME_STATUS_UNRECOVERED_READ))
		{
			summary.sparseErrors += entry.errorCount;
		}
		if (entry.vendorSpecific > 0)
		{
			summary.changeNotifications += entry.errorCount;
		}
	}
	return summary;
}
