/*
 * Disk health service.
 *
 * Copyright (c) 2024 Dianomic Systems
 *
 * Released under the Apache 2.0 Licence
 *
 * Author: Mark Riddoch
 */
#include <smart_attributes.h>
#include <string_utils.h>
#include <mutex>

using namespace std;

typedef struct {
	SmartAttributeKey	key;
	const char		*name;
	const char		*description;
	const char		*unit;
} AttributeDefinition;

/**
 * The canonical attribute catalog
 */
static const AttributeDefinition definitions[] = {
	{ SmartAttributeKey::AIRFLOW_TEMPERATURE_CEL, "airflow_temperature_cel", "Airflow Temperature in Celsius", "Celsius" },
	{ SmartAttributeKey::COMMAND_TIMEOUT, "command_timeout", "Command Timeout", "ms" },
	{ SmartAttributeKey::CURRENT_PENDING_SECTOR, "current_pending_sector", "Current Pending Sector", "count" },
	{ SmartAttributeKey::END_TO_END_ERROR, "end_to_end_error", "End-to-End Error", "count" },
	{ SmartAttributeKey::ERASE_FAIL_COUNT, "erase_fail_count", "Erase Fail Count", "count" },
	{ SmartAttributeKey::G_SENSE_ERROR_RATE, "g_sense_error_rate", "G-sense Error Rate", "count" },
	{ SmartAttributeKey::HARDWARE_ECC_RECOVERED, "hardware_ecc_recovered", "Hardware ECC Recovered", "count" },
	{ SmartAttributeKey::HOST_READS_MIB, "host_reads_mib", "Host Reads in MiB", "MiB" },
	{ SmartAttributeKey::HOST_READS_32MIB, "host_reads_32mib", "Host Reads in 32 MiB", "32 MiB" },
	{ SmartAttributeKey::HOST_WRITES_MIB, "host_writes_mib", "Host Writes in MiB", "MiB" },
	{ SmartAttributeKey::HOST_WRITES_32MIB, "host_writes_32mib", "Host Writes in 32 MiB", "32 MiB" },
	{ SmartAttributeKey::LOAD_CYCLE_COUNT, "load_cycle_count", "Load Cycle Count", "count" },
	{ SmartAttributeKey::HELIUM_LEVEL, "helium_level", "Helium Level", "percent" },
	{ SmartAttributeKey::MEDIA_WEAROUT_INDICATOR, "media_wearout_indicator", "Media Wearout Indicator", "percent" },
	{ SmartAttributeKey::MULTI_ZONE_ERROR_RATE, "multi_zone_error_rate", "Multi-Zone Error Rate", "count" },
	{ SmartAttributeKey::WEAR_LEVELING_COUNT, "wear_leveling_count", "Wear Leveling Count", "count" },
	{ SmartAttributeKey::NAND_WRITES_1GIB, "nand_writes_1gib", "NAND Writes in 1 GiB", "GiB" },
	{ SmartAttributeKey::OFFLINE_UNCORRECTABLE, "offline_uncorrectable", "Offline Uncorrectable", "count" },
	{ SmartAttributeKey::PERCENT_LIFE_REMAINING, "percent_life_remaining", "Percent Life Remaining", "percent" },
	{ SmartAttributeKey::PERCENT_LIFETIME_REMAIN, "percent_lifetime_remain", "Percent Lifetime Remaining", "percent" },
	{ SmartAttributeKey::PERCENTAGE_USED, "percentage_used", "Percentage Used", "percent" },
	{ SmartAttributeKey::POWER_CYCLE_COUNT, "power_cycle_count", "Power Cycle Count", "count" },
	{ SmartAttributeKey::POWER_OFF_RETRACT_COUNT, "power_off_retract_count", "Power Off Retract Count", "count" },
	{ SmartAttributeKey::POWER_ON_HOURS, "power_on_hours", "Power-On Hours", "hours" },
	{ SmartAttributeKey::PROGRAM_FAIL_COUNT, "program_fail_count", "Program Fail Count", "count" },
	{ SmartAttributeKey::RAW_READ_ERROR_RATE, "raw_read_error_rate", "Raw Read Error Rate", "count" },
	{ SmartAttributeKey::REALLOCATED_EVENT_COUNT, "reallocated_event_count", "Reallocated Event Count", "count" },
	{ SmartAttributeKey::REALLOCATED_SECTOR_CT, "reallocated_sector_ct", "Reallocated Sector Count", "count" },
	{ SmartAttributeKey::REALLOCATE_NAND_BLK_CNT, "reallocate_nand_blk_cnt", "Reallocate NAND Block Count", "count" },
	{ SmartAttributeKey::REPORTED_UNCORRECT, "reported_uncorrect", "Reported Uncorrectable Errors", "count" },
	{ SmartAttributeKey::SATA_DOWNSHIFT_COUNT, "sata_downshift_count", "SATA Downshift Count", "count" },
	{ SmartAttributeKey::SEEK_ERROR_RATE, "seek_error_rate", "Seek Error Rate", "count" },
	{ SmartAttributeKey::SPIN_RETRY_COUNT, "spin_retry_count", "Spin Retry Count", "count" },
	{ SmartAttributeKey::SPIN_UP_TIME, "spin_up_time", "Spin-Up Time", "ms" },
	{ SmartAttributeKey::START_STOP_COUNT, "start_stop_count", "Start/Stop Count", "count" },
	{ SmartAttributeKey::TEMPERATURE_CASE, "temperature_case", "Case Temperature", "Celsius" },
	{ SmartAttributeKey::TEMPERATURE_CELSIUS, "temperature_celsius", "Temperature in Celsius", "Celsius" },
	{ SmartAttributeKey::TEMPERATURE_INTERNAL, "temperature_internal", "Internal Temperature", "Celsius" },
	{ SmartAttributeKey::TOTAL_LBAS_READ, "total_lbas_read", "Total LBAs Read", "sectors" },
	{ SmartAttributeKey::TOTAL_LBAS_WRITTEN, "total_lbas_written", "Total LBAs Written", "sectors" },
	{ SmartAttributeKey::TOTAL_HOST_SECTOR_WRITE, "total_host_sector_write", "Total Host Sector Writes", "sectors" },
	{ SmartAttributeKey::UDMA_CRC_ERROR_COUNT, "udma_crc_error_count", "UDMA CRC Error Count", "count" },
	{ SmartAttributeKey::UNSAFE_SHUTDOWN_COUNT, "unsafe_shutdown_count", "Unsafe Shutdown Count", "count" },
	{ SmartAttributeKey::WORKLD_HOST_READS_PERC, "workld_host_reads_perc", "Workload Host Reads Percentage", "percent" },
	{ SmartAttributeKey::WORKLD_MEDIA_WEAR_INDIC, "workld_media_wear_indic", "Workload Media Wear Indicator", "percent" },
	{ SmartAttributeKey::WORKLOAD_MINUTES, "workload_minutes", "Workload Minutes", "minutes" },
	{ SmartAttributeKey::READ_ERRORS_CORRECTED, "read_errors_corrected", "Read Errors Corrected", "count" },
	{ SmartAttributeKey::WRITE_ERRORS_CORRECTED, "write_errors_corrected", "Write Errors Corrected", "count" },
	{ SmartAttributeKey::VERIFY_ERRORS_CORRECTED, "verify_errors_corrected", "Verify Errors Corrected", "count" },
	{ SmartAttributeKey::READ_GIGABYTES_PROCESSED, "read_gigabytes_processed", "Read Gigabytes Processed", "GiB" },
	{ SmartAttributeKey::WRITE_GIGABYTES_PROCESSED, "write_gigabytes_processed", "Write Gigabytes Processed", "GiB" },
	{ SmartAttributeKey::VERIFY_GIGABYTES_PROCESSED, "verify_gigabytes_processed", "Verify Gigabytes Processed", "GiB" },
	{ SmartAttributeKey::TOTAL_UNCORRECTED_READ_ERRORS, "total_uncorrected_read_errors", "Total Uncorrected Read Errors", "count" },
	{ SmartAttributeKey::TOTAL_UNCORRECTED_WRITE_ERRORS, "total_uncorrected_write_errors", "Total Uncorrected Write Errors", "count" },
	{ SmartAttributeKey::TOTAL_UNCORRECTED_VERIFY_ERRORS, "total_uncorrected_verify_errors", "Total Uncorrected Verify Errors", "count" },
	{ SmartAttributeKey::GROWN_DEFECTS_COUNT, "grown_defects_count", "Grown Defects Count", "count" },
	{ SmartAttributeKey::UNSAFE_SHUTDOWNS, "unsafe_shutdowns", "Unsafe Shutdowns", "count" },
	{ SmartAttributeKey::HOST_READ_COMMANDS, "host_read_commands", "Host Read Commands", "commands" },
	{ SmartAttributeKey::HOST_WRITE_COMMANDS, "host_write_commands", "Host Write Commands", "commands" },
	{ SmartAttributeKey::CONTROLLER_BUSY_TIME, "controller_busy_time", "Controller Busy Time", "minutes" },
	{ SmartAttributeKey::ERROR_INFORMATION_LOG_ENTRIES, "error_information_log_entries", "Error Information Log Entries", "count" },
	{ SmartAttributeKey::AVAILABLE_SPARE, "available_spare", "Available Spare", "percent" },
	{ SmartAttributeKey::AVAILABLE_SPARE_THRESHOLD, "available_spare_threshold", "Available Spare Threshold", "percent" },
	{ SmartAttributeKey::MEDIA_AND_DATA_INTEGRITY_ERRORS, "media_and_data_integrity_errors", "Media and Data Integrity Errors", "count" },
	{ SmartAttributeKey::NVME_ERROR_LOG_ENTRIES, "nvme_error_log_entries", "NVMe Error Log Entries", "count" },
	{ SmartAttributeKey::NVME_MEDIA_ERRORS, "nvme_media_errors", "NVMe Media Errors", "count" },
	{ SmartAttributeKey::NVME_ABORTED_COMMANDS, "nvme_aborted_commands", "NVMe Aborted Commands", "count" },
	{ SmartAttributeKey::NVME_TIMEOUT_ERRORS, "nvme_timeout_errors", "NVMe Timeout Errors", "count" },
	{ SmartAttributeKey::NVME_FABRIC_WARNINGS, "nvme_fabric_warnings", "NVMe Fabric Warnings", "count" },
	{ SmartAttributeKey::NVME_SPARSE_ERRORS, "nvme_sparse_errors", "NVMe Sparse Errors", "count" },
	{ SmartAttributeKey::NVME_CHANGE_NOTIFICATIONS, "nvme_change_notifications", "NVMe Change Notifications", "count" },
	{ SmartAttributeKey::NVME_VENDOR_ID, "nvme_vendor_id", "NVMe PCI Vendor ID", "id" },
	{ SmartAttributeKey::NVME_SUBSYSTEM_VENDOR_ID, "nvme_subsystem_vendor_id", "NVMe PCI Subsystem Vendor ID", "id" },
	{ SmartAttributeKey::NVME_IEEE_OUI, "nvme_ieee_oui", "NVMe IEEE OUI Identifier", "id" }
};

#define N_DEFINITIONS	(sizeof(definitions) / sizeof(definitions[0]))

/**
 * Alternative spellings of catalog names
 */
static const map<string, string> aliases = {
	{ "current_drive_temperature", "temperature_celsius" }
};

bool CanonicalAttribute::isUnset() const
{
	return !threshold && !value && !worst && !rawValue;
}

/**
 * Return the lower snake case name of a canonical key
 */
const string& attributeName(SmartAttributeKey key)
{
	static map<SmartAttributeKey, string> names;
	static once_flag initialised;
	call_once(initialised, []() {
		for (size_t i = 0; i < N_DEFINITIONS; i++)
			names.insert(pair<SmartAttributeKey, string>(definitions[i].key, definitions[i].name));
	});
	return names.at(key);
}

/**
 * Resolve a vendor attribute name to a canonical key. The match is
 * case insensitive and goes through the alias table first.
 *
 * @param name	The attribute name as reported by the device
 * @param key	Set to the canonical key on success
 * @return	True if the name is in the catalog
 */
bool lookupAttributeKey(const string& name, SmartAttributeKey& key)
{
	string lower = StringToLower(StringTrim(name));
	auto alias = aliases.find(lower);
	if (alias != aliases.end())
	{
		lower = alias->second;
	}
	for (size_t i = 0; i < N_DEFINITIONS; i++)
	{
		if (lower.compare(definitions[i].name) == 0)
		{
			key = definitions[i].key;
			return true;
		}
	}
	return false;
}

const vector<SmartAttributeKey>& allAttributeKeys()
{
	static vector<SmartAttributeKey> keys;
	static once_flag initialised;
	call_once(initialised, []() {
		for (size_t i = 0; i < N_DEFINITIONS; i++)
			keys.push_back(definitions[i].key);
	});
	return keys;
}

/**
 * Create an attribute set seeded with every catalog entry, all unset
 */
AttributeSet newAttributeSet()
{
	AttributeSet attributes;
	for (size_t i = 0; i < N_DEFINITIONS; i++)
	{
		attributes.insert(pair<SmartAttributeKey, CanonicalAttribute>(definitions[i].key,
				CanonicalAttribute(definitions[i].description, definitions[i].unit)));
	}
	return attributes;
}

/**
 * Remove the attributes for which the device reported nothing.
 * An attribute with any one of its four fields set is retained.
 */
void cleanupSmartAttributes(AttributeSet& attributes)
{
	for (auto it = attributes.begin(); it != attributes.end(); )
	{
		if (it->second.isUnset())
			it = attributes.erase(it);
		else
			++it;
	}
}

/**
 * The attributes whose device convention is percentage of life
 * remaining. The normalizer stores them as percentage used.
 */
bool isWearAttribute(SmartAttributeKey key)
{
	return key == SmartAttributeKey::MEDIA_WEAROUT_INDICATOR
		|| key == SmartAttributeKey::PERCENT_LIFE_REMAINING
		|| key == SmartAttributeKey::PERCENT_LIFETIME_REMAIN;
}

/**
 * Return the SSD life used percentage of a normalized attribute set.
 * The ATA wear attributes have already been converted to percentage
 * used by the normalizer so no conversion is done here.
 *
 * @param attributes	The normalized attributes
 * @return		The percentage used, if the device reports one
 */
boost::optional<long long> wearUsedPercentage(const AttributeSet& attributes)
{
	static const SmartAttributeKey order[] = {
		SmartAttributeKey::MEDIA_WEAROUT_INDICATOR,
		SmartAttributeKey::PERCENT_LIFE_REMAINING,
		SmartAttributeKey::PERCENT_LIFETIME_REMAIN,
		SmartAttributeKey::PERCENTAGE_USED
	};
	for (size_t i = 0; i < sizeof(order) / sizeof(order[0]); i++)
	{
		auto it = attributes.find(order[i]);
		if (it != attributes.end() && it->second.value)
		{
			return it->second.value;
		}
	}
	return boost::none;
}

/**
 * The attributes that are cumulative error counters on the device
 */
const vector<SmartAttributeKey>& errorCounterKeys()
{
	static const vector<SmartAttributeKey> keys = {
		SmartAttributeKey::UDMA_CRC_ERROR_COUNT,
		SmartAttributeKey::REPORTED_UNCORRECT,
		SmartAttributeKey::COMMAND_TIMEOUT,
		SmartAttributeKey::OFFLINE_UNCORRECTABLE,
		SmartAttributeKey::END_TO_END_ERROR,
		SmartAttributeKey::TOTAL_UNCORRECTED_READ_ERRORS,
		SmartAttributeKey::TOTAL_UNCORRECTED_WRITE_ERRORS,
		SmartAttributeKey::TOTAL_UNCORRECTED_VERIFY_ERRORS,
		SmartAttributeKey::MEDIA_AND_DATA_INTEGRITY_ERRORS,
		SmartAttributeKey::ERROR_INFORMATION_LOG_ENTRIES,
		SmartAttributeKey::NVME_ERROR_LOG_ENTRIES,
		SmartAttributeKey::NVME_MEDIA_ERRORS,
		SmartAttributeKey::NVME_ABORTED_COMMANDS,
		SmartAttributeKey::NVME_TIMEOUT_ERRORS,
		SmartAttributeKey::NVME_FABRIC_WARNINGS,
		SmartAttributeKey::NVME_SPARSE_ERRORS,
		SmartAttributeKey::NVME_CHANGE_NOTIFICATIONS
	};
	return keys;
}
