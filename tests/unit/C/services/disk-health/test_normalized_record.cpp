#include <gtest/gtest.h>
#include <normalized_record.h>
#include <attribute_normalizer.h>
#include <rapidjson/document.h>
#include "fixtures.h"
#include <string>

using namespace std;
using namespace rapidjson;

static NormalizedRecord buildRecord(const string& scenario, const string& device,
				    const string& unitId = "")
{
	AttributeNormalizer normalizer;
	RawDeviceRecord raw = loadRecord(scenario, device);
	return buildNormalizedRecord(raw, normalizer.normalize(raw), "node1", "ceph-a", unitId);
}

TEST(NormalizedRecordTest, AtaScalars)
{
	NormalizedRecord record = buildRecord("healthy", "sda", "3");

	ASSERT_EQ(record.nodeName, "node1");
	ASSERT_EQ(record.instanceId, "ceph-a");
	ASSERT_EQ(record.device, "/dev/sda");
	ASSERT_EQ(record.storageUnitId, "3");
	ASSERT_EQ(record.capacityGB, 2000.0);
	ASSERT_TRUE(record.healthStatus && *record.healthStatus);
	ASSERT_EQ(*record.temperatureCelsius, 34);
	ASSERT_EQ(*record.reallocatedSectors, 2);
	ASSERT_EQ(*record.pendingSectors, 0);
	ASSERT_EQ(*record.powerOnHours, 33620);
	ASSERT_FALSE(record.ssdLifeUsed);
}

TEST(NormalizedRecordTest, AtaErrorCounts)
{
	NormalizedRecord record = buildRecord("healthy", "sda");

	ASSERT_EQ(record.errorCounts.size(), 2U);
	ASSERT_EQ(record.errorCounts["udma_crc_error_count"], 1);
	ASSERT_EQ(record.errorCounts["reported_uncorrect"], 0);
}

TEST(NormalizedRecordTest, AtaTemperatureIsCelsius)
{
	// The normalized Temperature_Celsius value is 150 on this drive
	NormalizedRecord record = buildRecord("hot", "sdd");
	ASSERT_EQ(*record.temperatureCelsius, 33);
}

TEST(NormalizedRecordTest, AtaTemperatureFromPackedRawValue)
{
	AttributeNormalizer normalizer;
	RawDeviceRecord raw = loadRecord("hot", "sdd");
	raw.temperature = boost::none;
	NormalizedDevice normalized = normalizer.normalize(raw);
	// 33 (Min/Max 20/45)
	normalized.attributes.at(SmartAttributeKey::TEMPERATURE_CELSIUS).rawValue = 193274839073LL;

	NormalizedRecord record = buildNormalizedRecord(raw, normalized, "node1", "ceph-a", "");
	ASSERT_EQ(*record.temperatureCelsius, 33);
}

TEST(NormalizedRecordTest, SsdWear)
{
	NormalizedRecord record = buildRecord("worn", "sdc");

	ASSERT_EQ(*record.ssdLifeUsed, 85);
	ASSERT_EQ(*record.reallocatedSectors, 12);
	ASSERT_EQ(*record.pendingSectors, 5);
	ASSERT_EQ(*record.powerOnHours, 52110);
	// No Temperature_Celsius attribute, the device temperature is used
	ASSERT_EQ(*record.temperatureCelsius, 27);
}

TEST(NormalizedRecordTest, ScsiErrorCounts)
{
	NormalizedRecord record = buildRecord("healthy", "sdb");

	ASSERT_FALSE(record.reallocatedSectors);
	ASSERT_FALSE(record.pendingSectors);
	ASSERT_EQ(*record.powerOnHours, 41002);
	ASSERT_EQ(*record.temperatureCelsius, 31);
	ASSERT_EQ(record.errorCounts["total_uncorrected_read_errors"], 0);
	ASSERT_EQ(record.errorCounts["total_uncorrected_write_errors"], 0);
	ASSERT_EQ(record.errorCounts["total_uncorrected_verify_errors"], 1);
}

TEST(NormalizedRecordTest, AttributeReading)
{
	AttributeSet attributes = newAttributeSet();
	ASSERT_FALSE(attributeReading(attributes, SmartAttributeKey::SPIN_RETRY_COUNT));

	attributes.at(SmartAttributeKey::SPIN_RETRY_COUNT).value = 100;
	ASSERT_EQ(*attributeReading(attributes, SmartAttributeKey::SPIN_RETRY_COUNT), 100);

	attributes.at(SmartAttributeKey::SPIN_RETRY_COUNT).rawValue = 0;
	ASSERT_EQ(*attributeReading(attributes, SmartAttributeKey::SPIN_RETRY_COUNT), 0);

	attributes.erase(SmartAttributeKey::SPIN_RETRY_COUNT);
	ASSERT_FALSE(attributeReading(attributes, SmartAttributeKey::SPIN_RETRY_COUNT));
}

TEST(NormalizedRecordTest, JSON)
{
	NormalizedRecord record = buildRecord("healthy", "sda");
	Document doc;
	doc.Parse(record.toJSON().c_str());
	ASSERT_FALSE(doc.HasParseError());
	ASSERT_TRUE(doc.IsObject());

	ASSERT_STREQ(doc["node_name"].GetString(), "node1");
	ASSERT_STREQ(doc["device"].GetString(), "/dev/sda");
	// Unmapped devices still carry the storage unit field
	ASSERT_TRUE(doc["osd_id"].IsString());
	ASSERT_STREQ(doc["osd_id"].GetString(), "");
	ASSERT_EQ(doc["temperature_celsius"].GetInt64(), 34);
	ASSERT_TRUE(doc["ssd_life_used"].IsNull());
	ASSERT_TRUE(doc["health_status"].GetBool());

	const Value& info = doc["device_info"];
	ASSERT_STREQ(info["vendor"].GetString(), "Seagate");
	ASSERT_STREQ(info["product"].GetString(), "Exos7E8");
	ASSERT_EQ(info["rpm"].GetInt64(), 7200);
	ASSERT_FALSE(info.HasMember("vendor_id"));

	const Value& attrs = doc["attributes"];
	ASSERT_TRUE(attrs.HasMember("reallocated_sector_ct"));
	ASSERT_FALSE(attrs.HasMember("head_flying_hours"));
	const Value& realloc = attrs["reallocated_sector_ct"];
	ASSERT_EQ(realloc["value"].GetInt64(), 100);
	ASSERT_EQ(realloc["threshold"].GetInt64(), 10);
	ASSERT_EQ(realloc["raw_value"].GetInt64(), 2);
	ASSERT_STREQ(realloc["unit"].GetString(), "count");

	ASSERT_EQ(doc["error_counts"]["udma_crc_error_count"].GetInt64(), 1);
}

TEST(NormalizedRecordTest, NVMeVendorIds)
{
	NormalizedRecord record = buildRecord("healthy", "nvme0n1");
	Document doc;
	doc.Parse(record.toJSON().c_str());
	ASSERT_FALSE(doc.HasParseError());
	const Value& info = doc["device_info"];
	ASSERT_STREQ(info["vendor_id"].GetString(), "0x8086");
	ASSERT_STREQ(info["subsystem_vendor_id"].GetString(), "0x1028");
}

TEST(NormalizedRecordTest, RecordsArray)
{
	vector<NormalizedRecord> records;
	ASSERT_EQ(recordsToJSON(records), "[]");

	records.push_back(buildRecord("healthy", "sda", "0"));
	records.push_back(buildRecord("healthy", "sdb", "1"));
	string json = recordsToJSON(records);
	ASSERT_EQ(json.find('\n'), string::npos);

	Document doc;
	doc.Parse(json.c_str());
	ASSERT_FALSE(doc.HasParseError());
	ASSERT_TRUE(doc.IsArray());
	ASSERT_EQ(doc.Size(), 2U);
	ASSERT_STREQ(doc[0]["osd_id"].GetString(), "0");
	ASSERT_STREQ(doc[1]["device"].GetString(), "/dev/sdb");
}
