/*
 * Disk health service.
 *
 * Copyright (c) 2024 Dianomic Systems
 *
 * Released under the Apache 2.0 Licence
 *
 * Author: Mark Riddoch
 */
#include <device_info.h>
#include <string_utils.h>
#include <logger.h>
#include <regex>
#include <stdio.h>

using namespace std;

#define BYTES_PER_GIB	(1024.0 * 1024.0 * 1024.0)

/**
 * A row of the model table. A NULL rename keeps the reported model.
 * A zero DWPD or RPM leaves the derived value in place.
 */
typedef struct {
	const char	*model;
	const char	*rename;
	const char	*product;
	double		capacity;
	const char	*vendor;
	const char	*media;
	const char	*formFactor;
	double		dwpd;
	long long	rpm;
} ModelRule;

/**
 * The drives deployed across the fleet. The same drive is labelled
 * differently by different systems and by the smartmontools drive
 * database, so the product, capacity and vendor are fixed here.
 *
 * A leading '*' matches any model ending in the rest of the pattern,
 * a trailing '*' any model starting with it.
 */
static const ModelRule modelRules[] = {
	// Intel SATA and NVMe
	{ "INTEL SSDSC2BX200G4R", "SSDSC2BX200G4R", "S3610", 200, "Intel", "ssd", "sff", 3.0, 0 },
	{ "*SSDSC2KG480G8R", NULL, "S4610", 480, "Intel", "ssd", "sff", 3.0, 0 },
	{ "SSDSC2KG240G8R", NULL, "S4610", 240, "Intel", "ssd", "sff", 3.0, 0 },
	{ "INTEL SSDSC2BB240G4", "SSDSC2BB240G4", "S3500", 240, "Intel", "ssd", "sff", 0.3, 0 },
	{ "*SSDSC2BB800G7", "SSDSC2BB800G7", "S3520", 800, "Intel", "ssd", "sff", 1.0, 0 },
	{ "Dell Express Flash NVMe P4610 1.6TB SFF", "P4610", "P4610-Dell", 1600, "Intel", "ssd", "u2", 3.0, 0 },
	{ "Dell Express Flash NVMe P4610 3.2TB SFF", "P4610", "P4610-Dell", 3200, "Intel", "ssd", "u2", 3.0, 0 },
	{ "Dell Express Flash NVMe P4600 3.2TB SFF", "P4600", "P4600-Dell", 3200, "Intel", "ssd", "u2", 3.0, 0 },
	{ "Dell Express Flash NVMe P4500 2.0TB*", "P4500", "P4500-Dell", 2000, "Intel", "ssd", "u2", 1.0, 0 },
	{ "Dell Ent NVMe P5600 MU U.2 3.2TB", "P5600", "P5600-Dell", 3200, "Intel", "ssd", "u2", 3.0, 0 },
	{ "Dell Ent NVMe P5600 MU U.2 1.6TB", "P5600", "P5600-Dell", 1600, "Intel", "ssd", "u2", 3.0, 0 },
	{ "*SSDSC2BB800G4", "S3500", "S3500", 800, "Intel", "ssd", "sff", 0.3, 0 },
	{ "INTEL SSDPE2KE016T8", "SSDPE2KE016T8", "P4610-Generic", 1600, "Intel", "ssd", "u2", 3.0, 0 },
	{ "INTEL SSDSC2KG019T8", "SSDSC2KG019T8", "S4610-Generic", 1600, "Intel", "ssd", "u2", 3.0, 0 },
	{ "INTEL SSDSC2BX800G4", "SSDSC2BX800G4", "S3610", 800, "Intel", "ssd", "sff", 3.0, 0 },
	{ "*SSDSC2BB160G4", "SSDSC2BB160G4", "S3500", 160, "Intel", "ssd", "sff", 0.3, 0 },
	{ "*SSDSC2BB240G6", "SSDSC2BB240G6", "S3510", 240, "Intel", "ssd", "sff", 0.3, 0 },
	{ "SSDSC2BB120G7R", NULL, "S3520", 120, "Intel", "ssd", "sff", 1.0, 0 },
	{ "SSDSC2KG240G7R", NULL, "S4600", 240, "Intel", "ssd", "sff", 1.0, 0 },
	{ "SSDSC2KG480GZR", NULL, "S4620", 480, "Intel", "ssd", "sff", 3.0, 0 },
	{ "SSDSC2KB240G8R", NULL, "S4510", 240, "Intel", "ssd", "sff", 2.0, 0 },
	{ "SSDSC2KB480G8R", NULL, "S4510", 480, "Intel", "ssd", "sff", 1.3, 0 },
	{ "INTEL SSDSA2CW120G3", "SSDSA2CW120G3", "320", 120, "Intel", "ssd", "sff", 1.0, 0 },
	{ "INTEL SSDSC2CW120A3", "SSDSC2CW120A3", "520", 120, "Intel", "ssd", "sff", 2.0, 0 },
	{ "INTEL SSDPE2KX020T7T", "SSDPE2KX020T7T", "S4500", 1920, "Intel", "ssd", "sff", 1.0, 0 },
	{ "INTEL SSDSC2KG240G8", "SSDSC2KG240G8", "S4610", 240, "Intel", "ssd", "sff", 3.0, 0 },
	// Western Digital and HGST
	{ "WDC WD8004FRYZ-01VAEB0", "WD8004FRYZ", "Gold", 8000, "WesternDigital", "hdd", "lff", 0, 7200 },
	{ "HUS722T2TALA600", NULL, "Ultrastar7k2", 2000, "WesternDigital", "hdd", "lff", 0, 7200 },
	{ "HUS728T8TAL5200", NULL, "UltrastarDC", 8000, "WesternDigital", "hdd", "lff", 0, 7200 },
	{ "WDC WD2005FBYZ-01YCBB2", "WD2005FBYZ-01YCBB2", "Gold", 2000, "WesternDigital", "hdd", "lff", 0, 7200 },
	{ "*HUS726040ALA614", "HUS726040ALA614", "Ultrastar7K6000", 4000, "WesternDigital", "hdd", "lff", 0, 7200 },
	{ "WD1004FBYZ", NULL, "Re", 1000, "WesternDigital", "hdd", "lff", 0, 7200 },
	{ "WDC WD10JFCX-68N6GN0", "WD10JFCX-68N6GN0", "RedPlus", 1000, "WesternDigital", "hdd", "sff", 0, 5400 },
	{ "WDC WD8002FRYZ-01FF2B0", NULL, "Gold", 8000, "WesternDigital", "hdd", "lff", 0, 7200 },
	{ "WDC WD121KRYZ-01W0RB0", "WD121KRYZ-01W0RB0", "Gold", 12000, "WesternDigital", "hdd", "lff", 0, 7200 },
	{ "WDC WD101KRYZ-01JPDB1", NULL, "Gold", 10000, "WesternDigital", "hdd", "lff", 0, 7200 },
	{ "WDC WD8003FRYZ-01JPDB1", NULL, "Gold", 8000, "WesternDigital", "hdd", "lff", 0, 7200 },
	{ "WDC WD102KRYZ-01A5AB0", "WD102KRYZ-01A5AB0", "Gold", 10000, "WesternDigital", "hdd", "lff", 0, 7200 },
	{ "WDC WD40EFRX-68WT0N0", "WD40EFRX-68WT0N0", "Red", 4000, "WesternDigital", "hdd", "lff", 0, 5400 },
	{ "WDC WD60EFRX-68L0BN1", "WD60EFRX-68L0BN1", "RedPlus", 6000, "WesternDigital", "hdd", "lff", 0, 5400 },
	{ "WDC WD60EFRX-68MYMN1", "WD60EFRX-68MYMN1", "RedPlus", 6000, "WesternDigital", "hdd", "lff", 0, 5400 },
	{ "HUS722T1TALA600", NULL, "Ultrastar7k2", 6000, "WesternDigital", "hdd", "lff", 0, 7200 },
	{ "HUH721010AL5200", NULL, "UltrastarHe10", 10000, "WesternDigital", "hdd", "lff", 0, 7200 },
	{ "HGST HUS722T1TALA604", "HUS722T1TALA604", "Ultrastar7K2", 1000, "WesternDigital", "hdd", "lff", 0, 7200 },
	{ "HGST HUS726060ALE610", "HUS726060ALE610", "Ultrastar7k6", 6000, "WesternDigital", "hdd", "lff", 0, 7200 },
	{ "*HUS726T4TALA6L0", "HUS726T4TALA6L0", "UltrastarHC310", 4000, "WesternDigital", "hdd", "lff", 0, 7200 },
	{ "WDC WD5000BHTZ-04JCPV1", "WD5000BHTZ-04JCPV1", "VelociRaptor", 500, "WesternDigital", "hdd", "sff", 0, 10000 },
	{ "WDC WD20EFRX-68EUZN0", "WD20EFRX-68EUZN0", "RedPlus", 2000, "WesternDigital", "hdd", "lff", 0, 5400 },
	{ "WDC WD5000BHTZ-04JCPV0", "WD5000BHTZ-04JCPV0", "VelociRaptor", 500, "WesternDigital", "hdd", "sff", 0, 10000 },
	// Seagate
	{ "ST8000NM014A", NULL, "Exos7E10", 8000, "Seagate", "hdd", "lff", 0, 7200 },
	{ "ST1000NM0055-1V410C", NULL, "Exos7E8", 1000, "Seagate", "hdd", "lff", 0, 7200 },
	{ "ST300MP0026", NULL, "EntPerf", 300, "Seagate", "hdd", "sff", 0, 15000 },
	{ "ST2000NM0155", NULL, "Exos7E8", 2000, "Seagate", "hdd", "lff", 0, 7200 },
	{ "ST1000NM0033-9ZM173", NULL, "ConstellationES.3", 1000, "Seagate", "hdd", "lff", 0, 7200 },
	{ "ST2000NM012A-2MP130", NULL, "Exos7E8", 2000, "Seagate", "hdd", "lff", 0, 7200 },
	{ "ST10000NM0096", NULL, "ExosX10", 10000, "Seagate", "hdd", "lff", 0, 7200 },
	{ "ST1000NX0473", NULL, "Exos7E2000", 1000, "Seagate", "hdd", "sff", 0, 7200 },
	{ "ST1000NX0443", NULL, "Exos7E2000", 1000, "Seagate", "hdd", "sff", 0, 7200 },
	{ "ST2000NM013A", NULL, "Exos7E8", 2000, "Seagate", "hdd", "lff", 0, 7200 },
	{ "DL2400MM0159", NULL, "Exos10E2400", 2400, "Seagate", "hdd", "sff", 0, 10000 },
	{ "ST4000NM018B-2TF130", NULL, "Exos7E10", 4000, "Seagate", "hdd", "lff", 0, 7200 },
	// Toshiba
	{ "TOSHIBA MG03ACA100", "MG03ACA100", "MG03", 3000, "Toshiba", "hdd", "lff", 0, 7200 },
	{ "TOSHIBA MG04ACA200NY", "MG04ACA200NY", "MG04", 2000, "Toshiba", "hdd", "lff", 0, 7200 },
	{ "TOSHIBA MG04ACA400N", "MG04ACA400N", "MG04", 4000, "Toshiba", "hdd", "lff", 0, 7200 },
	{ "TOSHIBA MG08ADA400NY", "MG08ADA400NY", "MG08-D", 4000, "Toshiba", "hdd", "lff", 0, 7200 },
	{ "MG06SCA800EY", NULL, "MG06", 8000, "Toshiba", "hdd", "lff", 0, 7200 },
	{ "MG04SCA20ENY", NULL, "MG04", 2000, "Toshiba", "hdd", "lff", 0, 7200 },
	{ "TOSHIBA MG04ACA100NY", "MG04ACA100NY", "MGA04", 1000, "Toshiba", "hdd", "lff", 0, 7200 },
	// Hynix, Samsung and Micron
	{ "HFS480G32FEH-BA10A", NULL, "HFS", 480, "Hynix", "ssd", "sff", 3.0, 0 },
	{ "MZ7LH480HBHQ0D3", NULL, "PM883a", 480, "Samsung", "ssd", "sff", 3.6, 0 },
	{ "MZ7KH480HAHQ0D3", NULL, "SM883", 480, "Samsung", "ssd", "sff", 3.0, 0 },
	{ "MTFDDAV240TDU", NULL, "5300", 240, "Micron", "ssd", "sff", 1.0, 0 },
	{ "MTFDDAK960TDN", NULL, "5200MAX", 960, "Micron", "ssd", "sff", 5.0, 0 },
	{ "MTFDDAK480TDC", NULL, "5200ECO", 480, "Micron", "ssd", "sff", 0.8, 0 }
};

/**
 * Model and family patterns used to infer the vendor, in priority order
 */
static const struct {
	const char	*pattern;
	const char	*vendor;
} vendorPatterns[] = {
	{ "^DL2400", "Seagate" },
	{ "TOSHIBA", "Toshiba" },
	{ "^MG0[345678]", "Toshiba" },
	{ "INTEL", "Intel" },
	{ "KIOXIA", "Kioxia" },
	{ "WESTERN", "WesternDigital" },
	{ "WDC", "WesternDigital" },
	{ "^WD100", "WesternDigital" },
	{ "SEAGATE", "Seagate" },
	{ "^ST[12][0-9]", "Seagate" },
	{ "HGST", "HGST" },
	{ "^HU[HS]", "HGST" },
	{ "MICRON", "Micron" },
	{ "MTFDD", "Micron" },
	{ "SANDISK", "SanDisk" },
	{ "SAMSUNG", "Samsung" },
	{ "^MZ7", "Samsung" }
};

/**
 * Convert a capacity in bytes to GiB
 */
static double toGiB(long long bytes)
{
	if (bytes <= 0)
		return 0;
	return (double)bytes / BYTES_PER_GIB;
}

static bool contains(const string& haystack, const char *needle)
{
	return haystack.find(needle) != string::npos;
}

/**
 * Build the device description from the raw record. The handling of
 * vendor, product, capacity and media depends on the protocol.
 *
 * @param raw		The smartctl record
 * @param attributes	The normalized attributes, used to recognise
 *			SSDs that report themselves as ATA devices
 * @return		The device description
 */
DeviceInfo fillDeviceInfo(const RawDeviceRecord& raw, const AttributeSet& attributes)
{
	DeviceInfo info;
	info.modelFamily = raw.modelFamily;
	info.deviceModel = raw.deviceModel;
	info.serialNumber = raw.serialNumber;
	info.firmwareVersion = raw.firmwareVersion;
	info.vendor = raw.vendor;
	info.product = raw.product;
	info.lunId = raw.logicalUnitId;
	info.formFactor = raw.formFactor;
	if (raw.userCapacityBytes)
		info.capacityGB = toGiB(*raw.userCapacityBytes);

	switch (raw.protocol)
	{
		case DeviceProtocol::ATA:
			// ATA does not report a vendor, use a placeholder to be inferred later
			info.vendor = "ATA";
			info.product = raw.deviceModel;
			info.media = "hdd";
			if (raw.rotationRate > 0)
			{
				info.rpm = raw.rotationRate;
			}
			else if (raw.rotationRate == 0 && raw.hasAtaAttributes)
			{
				for (auto it = attributes.cbegin(); it != attributes.cend(); ++it)
				{
					if (isWearAttribute(it->first))
					{
						info.media = "ssd";
						break;
					}
				}
			}
			break;
		case DeviceProtocol::SCSI:
			info.deviceModel = raw.scsiModelName;
			info.vendor = raw.scsiVendor;
			info.product = raw.scsiProduct;
			info.media = "hdd";
			if (StringToLower(raw.deviceType).find("ssd") != string::npos)
			{
				info.media = "ssd";
			}
			if (raw.rotationRate > 0)
				info.rpm = raw.rotationRate;
			break;
		case DeviceProtocol::NVME:
			if (raw.nvmePciVendorId)
			{
				long long id = *raw.nvmePciVendorId;
				long long subsystem = raw.nvmePciSubsystemId ? *raw.nvmePciSubsystemId : 0;
				char buf[80];
				snprintf(buf, sizeof(buf), "Vendor ID: 0x%04llX, Subsystem ID: 0x%04llX", id, subsystem);
				info.vendor = buf;
				snprintf(buf, sizeof(buf), "0x%04llX", id);
				info.vendorId = buf;
				snprintf(buf, sizeof(buf), "0x%04llX", subsystem);
				info.subsystemVendorId = buf;
			}
			if (!raw.product.empty())
				info.product = raw.product;
			else
				info.product = raw.deviceModel;
			info.media = "nvme";
			if (raw.nvmeTotalCapacity > 0)
				info.capacityGB = toGiB(raw.nvmeTotalCapacity);
			info.rpm = 0;
			break;
		default:
			info.media = "unknown";
			break;
	}

	info.healthStatus = raw.smartPassed ? *raw.smartPassed : false;
	return info;
}

/**
 * Match a model against a table pattern
 */
static bool modelMatches(const string& pattern, const string& model)
{
	if (pattern.empty() || model.empty())
		return false;
	if (pattern[0] == '*')
	{
		string suffix = pattern.substr(1);
		return model.size() >= suffix.size()
			&& model.compare(model.size() - suffix.size(), suffix.size(), suffix) == 0;
	}
	if (pattern[pattern.size() - 1] == '*')
	{
		return StringStartsWith(model, pattern.substr(0, pattern.size() - 1));
	}
	return pattern.compare(model) == 0;
}

/**
 * Apply the model table to a device description
 *
 * @param info	The device description
 * @return	True if the model was found in the table
 */
bool normalizeDeviceInfo(DeviceInfo& info)
{
	for (size_t i = 0; i < sizeof(modelRules) / sizeof(modelRules[0]); i++)
	{
		const ModelRule& rule = modelRules[i];
		if (!modelMatches(rule.model, info.deviceModel))
			continue;

		if (rule.rename)
			info.deviceModel = rule.rename;
		info.product = rule.product;
		info.capacityGB = rule.capacity;
		info.vendor = rule.vendor;
		info.media = rule.media;
		info.formFactor = rule.formFactor;
		if (rule.dwpd > 0)
			info.dwpd = rule.dwpd;
		if (rule.rpm > 0)
			info.rpm = rule.rpm;
		return true;
	}
	return false;
}

/**
 * Infer the vendor from the model or model family when the device
 * did not report one. Devices with no known pattern are logged.
 *
 * @param info	The device description
 */
void normalizeVendor(DeviceInfo& info)
{
	if (!info.vendor.empty() && info.vendor.compare("ATA") != 0)
		return;

	for (size_t i = 0; i < sizeof(vendorPatterns) / sizeof(vendorPatterns[0]); i++)
	{
		regex re(vendorPatterns[i].pattern, regex::icase);
		if (regex_search(info.deviceModel, re) || regex_search(info.modelFamily, re))
		{
			info.vendor = vendorPatterns[i].vendor;
			return;
		}
	}
	Logger::getLogger()->warn("Unknown vendor for device model '%s'", info.deviceModel.c_str());
}

/**
 * Detect a drive that has been rebadged by a server vendor.
 *
 * @param vendor	The reported vendor
 * @param model		The reported model
 * @param product	The reported product
 * @return		A label such as "Dell (Seagate OEM)" or an empty string
 */
string detectOEMRelationship(const string& vendor, const string& model, const string& product)
{
	string v = StringToLower(vendor);
	string m = StringToLower(model);
	string p = StringToLower(product);

	if (contains(v, "lenovo"))
	{
		if (contains(m, "toshiba") || contains(p, "toshiba"))
			return "Lenovo (Toshiba OEM)";
		if (contains(m, "seagate") || contains(p, "seagate"))
			return "Lenovo (Seagate OEM)";
		if (contains(m, "hgst") || contains(p, "hgst"))
			return "Lenovo (HGST OEM)";
	}

	if (contains(v, "dell"))
	{
		if (contains(m, "seagate") || contains(p, "seagate"))
			return "Dell (Seagate OEM)";
		if (contains(m, "western digital") || contains(p, "western digital") || contains(p, "wd"))
			return "Dell (WD OEM)";
		if (contains(m, "toshiba") || contains(p, "toshiba"))
			return "Dell (Toshiba OEM)";
	}

	if (contains(v, "hp"))
	{
		if (contains(m, "western digital") || contains(p, "western digital") || contains(p, "wd"))
			return "HP (WD OEM)";
		if (contains(m, "seagate") || contains(p, "seagate"))
			return "HP (Seagate OEM)";
		if (contains(m, "toshiba") || contains(p, "toshiba"))
			return "HP (Toshiba OEM)";
	}

	if (contains(v, "supermicro"))
	{
		if (contains(m, "intel") || contains(p, "intel"))
			return "Supermicro (Intel OEM)";
		if (contains(m, "samsung") || contains(p, "samsung"))
			return "Supermicro (Samsung OEM)";
	}

	// The product field sometimes names the real manufacturer
	static const struct {
		const char	*match;
		const char	*vendorMatch;
		const char	*label;
	} generic[] = {
		{ "seagate", "seagate", "Seagate" },
		{ "western digital", "western digital", "WD" },
		{ "wd", "western digital", "WD" },
		{ "toshiba", "toshiba", "Toshiba" },
		{ "hgst", "hgst", "HGST" },
		{ "samsung", "samsung", "Samsung" },
		{ "intel", "intel", "Intel" }
	};
	for (size_t i = 0; i < sizeof(generic) / sizeof(generic[0]); i++)
	{
		if (contains(p, generic[i].match) && !contains(v, generic[i].vendorMatch))
		{
			return StringTitleCase(v) + " (" + generic[i].label + " OEM)";
		}
	}
	return "";
}

/**
 * Record any OEM relationship in the model family. An explicit
 * model family is never overwritten.
 */
void enhanceDeviceInfo(DeviceInfo& info)
{
	if (!info.modelFamily.empty())
		return;
	string oem = detectOEMRelationship(info.vendor, info.deviceModel, info.product);
	if (!oem.empty())
	{
		info.modelFamily = oem;
		Logger::getLogger()->debug("Detected OEM relationship %s for %s",
				oem.c_str(), info.deviceModel.c_str());
	}
}
