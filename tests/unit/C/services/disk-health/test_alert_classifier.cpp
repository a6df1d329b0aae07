#include <gtest/gtest.h>
#include <alert_classifier.h>
#include <attribute_normalizer.h>
#include <rapidjson/document.h>
#include "fixtures.h"
#include <string>

using namespace std;
using namespace rapidjson;

static NormalizedRecord buildRecord(const string& scenario, const string& device)
{
	AttributeNormalizer normalizer;
	RawDeviceRecord raw = loadRecord(scenario, device);
	return buildNormalizedRecord(raw, normalizer.normalize(raw), "node1", "ceph-a", "");
}

/**
 * A record with only the scalar fields set
 */
static NormalizedRecord scalarRecord(long long reallocated, long long pending)
{
	NormalizedRecord record;
	record.device = "/dev/sdq";
	record.attributes = newAttributeSet();
	record.attributes.at(SmartAttributeKey::REALLOCATED_SECTOR_CT).rawValue = reallocated;
	record.attributes.at(SmartAttributeKey::CURRENT_PENDING_SECTOR).rawValue = pending;
	cleanupSmartAttributes(record.attributes);
	record.reallocatedSectors = reallocated;
	record.pendingSectors = pending;
	return record;
}

TEST(AlertEventTest, Escalate)
{
	AlertEvent event;
	ASSERT_EQ(event.severityName(), "info");
	ASSERT_EQ(event.eventType, "health");

	event.escalate(AlertEvent::Severity::CRITICAL, "lifetime_alert");
	event.escalate(AlertEvent::Severity::WARNING, "health_alert");
	ASSERT_EQ(event.severityName(), "critical");
	ASSERT_EQ(event.eventType, "lifetime_alert");

	AlertEvent equal;
	equal.escalate(AlertEvent::Severity::WARNING, "health_alert");
	equal.escalate(AlertEvent::Severity::WARNING, "other_alert");
	ASSERT_EQ(equal.severityName(), "warning");
	ASSERT_EQ(equal.eventType, "other_alert");
}

TEST(AlertClassifierTest, Healthy)
{
	AlertClassifier classifier((AlertThresholds()));
	AlertEvent event = classifier.classify(buildRecord("healthy", "sda"));

	ASSERT_EQ(event.severity, AlertEvent::Severity::INFO);
	ASSERT_EQ(event.eventType, "health");
	ASSERT_EQ(event.message, "SMART data collected successfully.");
	ASSERT_EQ(event.device, "/dev/sda");
	ASSERT_EQ(event.nodeName, "node1");
	ASSERT_EQ(event.instanceId, "ceph-a");
	ASSERT_EQ(event.details["ReallocatedSectors"], "2");
	ASSERT_EQ(event.details["PendingSectors"], "0");
	ASSERT_EQ(event.details["TemperatureCelsius"], "34");
	ASSERT_EQ(event.details["PowerOnHours"], "33620");
	ASSERT_EQ(event.details.count("SSDLifeUsed"), 0U);
	ASSERT_EQ(event.details.count("GrownDefects"), 0U);
	ASSERT_EQ(event.details["udma_crc_error_count"], "1");
	ASSERT_EQ(event.details["power_on_hours"], "33620");
}

TEST(AlertClassifierTest, ReallocatedSectors)
{
	AlertClassifier classifier((AlertThresholds()));
	AlertEvent event = classifier.classify(buildRecord("reallocated", "sda"));

	ASSERT_EQ(event.severity, AlertEvent::Severity::WARNING);
	ASSERT_EQ(event.eventType, "health_alert");
	ASSERT_EQ(event.message, "SMART data indicates potential drive issues (reallocated sectors).");
	ASSERT_EQ(event.details["ReallocatedSectors"], "15 (Warning: Exceeds threshold of 10)");
}

TEST(AlertClassifierTest, AtThresholdIsNotBreach)
{
	AlertClassifier classifier((AlertThresholds()));
	AlertEvent event = classifier.classify(scalarRecord(10, 3));

	ASSERT_EQ(event.severity, AlertEvent::Severity::INFO);
	ASSERT_EQ(event.details["ReallocatedSectors"], "10");
	ASSERT_EQ(event.details["PendingSectors"], "3");
}

TEST(AlertClassifierTest, PendingBeforeReallocated)
{
	AlertClassifier classifier((AlertThresholds()));
	AlertEvent event = classifier.classify(scalarRecord(11, 4));

	ASSERT_EQ(event.severity, AlertEvent::Severity::WARNING);
	ASSERT_EQ(event.message, "SMART data indicates potential drive issues (pending sectors).");
	ASSERT_EQ(event.details["PendingSectors"], "4 (Warning: Exceeds threshold of 3)");
	ASSERT_EQ(event.details["ReallocatedSectors"], "11 (Warning: Exceeds threshold of 10)");
}

TEST(AlertClassifierTest, GrownDefects)
{
	NormalizedRecord record = buildRecord("healthy", "sdb");
	AlertThresholds thresholds;
	AlertClassifier quiet(thresholds);
	AlertEvent event = quiet.classify(record);
	ASSERT_EQ(event.severity, AlertEvent::Severity::INFO);
	ASSERT_EQ(event.details.count("GrownDefects"), 0U);
	ASSERT_EQ(event.details["grown_defects_count"], "4");

	thresholds.grownDefects = 3;
	AlertClassifier strict(thresholds);
	event = strict.classify(record);
	ASSERT_EQ(event.severity, AlertEvent::Severity::WARNING);
	ASSERT_EQ(event.eventType, "health_alert");
	ASSERT_EQ(event.message, "SMART data indicates potential drive issues (grown defects).");
	ASSERT_EQ(event.details["GrownDefects"], "4 (Warning: Exceeds threshold of 3)");
}

TEST(AlertClassifierTest, LifetimeIsCritical)
{
	AlertClassifier classifier((AlertThresholds()));
	AlertEvent event = classifier.classify(buildRecord("worn", "sdc"));

	// Sector breaches are also present, the lifetime breach wins
	ASSERT_EQ(event.severity, AlertEvent::Severity::CRITICAL);
	ASSERT_EQ(event.eventType, "lifetime_alert");
	ASSERT_EQ(event.message, "SMART data indicates SSD nearing end of life.");
	ASSERT_EQ(event.details["SSDLifeUsed"], "85% (Warning: Exceeds threshold of 80%)");
	ASSERT_EQ(event.details["SSDWearPercentage"], "85");
	ASSERT_EQ(event.details["PendingSectors"], "5 (Warning: Exceeds threshold of 3)");
	ASSERT_EQ(event.details["ReallocatedSectors"], "12 (Warning: Exceeds threshold of 10)");
}

TEST(AlertClassifierTest, LifetimeThreshold)
{
	AlertThresholds thresholds;
	thresholds.lifetimeUsed = 90;
	AlertClassifier classifier(thresholds);
	AlertEvent event = classifier.classify(buildRecord("worn", "sdc"));

	ASSERT_EQ(event.severity, AlertEvent::Severity::WARNING);
	ASSERT_EQ(event.details["SSDLifeUsed"], "85");
}

TEST(AlertClassifierTest, EventJSON)
{
	AlertClassifier classifier((AlertThresholds()));
	AlertEvent event = classifier.classify(buildRecord("reallocated", "sda"));

	Document doc;
	doc.Parse(event.toJSON().c_str());
	ASSERT_FALSE(doc.HasParseError());
	ASSERT_STREQ(doc["node_name"].GetString(), "node1");
	ASSERT_STREQ(doc["device"].GetString(), "/dev/sda");
	ASSERT_STREQ(doc["severity"].GetString(), "warning");
	ASSERT_STREQ(doc["event_type"].GetString(), "health_alert");
	ASSERT_TRUE(doc["details"].IsObject());
	ASSERT_STREQ(doc["details"]["ReallocatedSectors"].GetString(), "15 (Warning: Exceeds threshold of 10)");
	ASSERT_STREQ(doc["details"]["reallocated_sector_ct"].GetString(), "15");
}
