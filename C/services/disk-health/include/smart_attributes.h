#ifndef _SMART_ATTRIBUTES_H
#define _SMART_ATTRIBUTES_H
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
#include <map>
#include <vector>
#include <boost/optional.hpp>

/**
 * The closed set of canonical attribute keys. Vendor and protocol
 * specific names are mapped onto these and nothing else.
 */
enum class SmartAttributeKey
{
	AIRFLOW_TEMPERATURE_CEL,
	COMMAND_TIMEOUT,
	CURRENT_PENDING_SECTOR,
	END_TO_END_ERROR,
	ERASE_FAIL_COUNT,
	G_SENSE_ERROR_RATE,
	HARDWARE_ECC_RECOVERED,
	HOST_READS_MIB,
	HOST_READS_32MIB,
	HOST_WRITES_MIB,
	HOST_WRITES_32MIB,
	LOAD_CYCLE_COUNT,
	HELIUM_LEVEL,
	MEDIA_WEAROUT_INDICATOR,
	MULTI_ZONE_ERROR_RATE,
	WEAR_LEVELING_COUNT,
	NAND_WRITES_1GIB,
	OFFLINE_UNCORRECTABLE,
	PERCENT_LIFE_REMAINING,
	PERCENT_LIFETIME_REMAIN,
	PERCENTAGE_USED,
	POWER_CYCLE_COUNT,
	POWER_OFF_RETRACT_COUNT,
	POWER_ON_HOURS,
	PROGRAM_FAIL_COUNT,
	RAW_READ_ERROR_RATE,
	REALLOCATED_EVENT_COUNT,
	REALLOCATED_SECTOR_CT,
	REALLOCATE_NAND_BLK_CNT,
	REPORTED_UNCORRECT,
	SATA_DOWNSHIFT_COUNT,
	SEEK_ERROR_RATE,
	SPIN_RETRY_COUNT,
	SPIN_UP_TIME,
	START_STOP_COUNT,
	TEMPERATURE_CASE,
	TEMPERATURE_CELSIUS,
	TEMPERATURE_INTERNAL,
	TOTAL_LBAS_READ,
	TOTAL_LBAS_WRITTEN,
	TOTAL_HOST_SECTOR_WRITE,
	UDMA_CRC_ERROR_COUNT,
	UNSAFE_SHUTDOWN_COUNT,
	WORKLD_HOST_READS_PERC,
	WORKLD_MEDIA_WEAR_INDIC,
	WORKLOAD_MINUTES,
	// SCSI error counter log
	READ_ERRORS_CORRECTED,
	WRITE_ERRORS_CORRECTED,
	VERIFY_ERRORS_CORRECTED,
	READ_GIGABYTES_PROCESSED,
	WRITE_GIGABYTES_PROCESSED,
	VERIFY_GIGABYTES_PROCESSED,
	TOTAL_UNCORRECTED_READ_ERRORS,
	TOTAL_UNCORRECTED_WRITE_ERRORS,
	TOTAL_UNCORRECTED_VERIFY_ERRORS,
	GROWN_DEFECTS_COUNT,
	// NVMe health information log
	UNSAFE_SHUTDOWNS,
	HOST_READ_COMMANDS,
	HOST_WRITE_COMMANDS,
	CONTROLLER_BUSY_TIME,
	ERROR_INFORMATION_LOG_ENTRIES,
	AVAILABLE_SPARE,
	AVAILABLE_SPARE_THRESHOLD,
	MEDIA_AND_DATA_INTEGRITY_ERRORS,
	// Derived from nvme-cli
	NVME_ERROR_LOG_ENTRIES,
	NVME_MEDIA_ERRORS,
	NVME_ABORTED_COMMANDS,
	NVME_TIMEOUT_ERRORS,
	NVME_FABRIC_WARNINGS,
	NVME_SPARSE_ERRORS,
	NVME_CHANGE_NOTIFICATIONS,
	NVME_VENDOR_ID,
	NVME_SUBSYSTEM_VENDOR_ID,
	NVME_IEEE_OUI
};

/**
 * A canonical attribute. The four numeric fields are unset until
 * the device reports them.
 */
class CanonicalAttribute
{
	public:
		CanonicalAttribute(const std::string& description, const std::string& unit) :
				description(description), unit(unit) {};

		bool				isUnset() const;

		std::string			description;
		std::string			unit;
		boost::optional<long long>	threshold;
		boost::optional<long long>	value;
		boost::optional<long long>	worst;
		boost::optional<long long>	rawValue;
};

typedef std::map<SmartAttributeKey, CanonicalAttribute>	AttributeSet;

const std::string&		attributeName(SmartAttributeKey key);
bool				lookupAttributeKey(const std::string& name, SmartAttributeKey& key);
const std::vector<SmartAttributeKey>&
				allAttributeKeys();
AttributeSet			newAttributeSet();
void				cleanupSmartAttributes(AttributeSet& attributes);
boost::optional<long long>	wearUsedPercentage(const AttributeSet& attributes);
bool				isWearAttribute(SmartAttributeKey key);
const std::vector<SmartAttributeKey>&
				errorCounterKeys();

#endif
