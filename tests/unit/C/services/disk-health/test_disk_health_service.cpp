#include <gtest/gtest.h>
#include <disk_health_service.h>
#include <rapidjson/document.h>
#include "fixtures.h"
#include <sstream>
#include <algorithm>
#include <thread>
#include <chrono>
#include <regex>

using namespace std;
using namespace rapidjson;

static DiskHealthConfig testConfig(const string& scenario, const vector<string>& disks)
{
	DiskHealthConfig config;
	config.testMode = true;
	config.testDataPath = DISK_HEALTH_TEST_DATA;
	config.testScenario = scenario;
	config.disks = disks;
	config.nodeName = "node1";
	config.instanceId = "ceph-a";
	config.once = true;
	return config;
}

static CommandAdapter *fixtureAdapter(const DiskHealthConfig& config)
{
	return new FixtureCommandAdapter(config.testDataPath, config.testScenario, config.testDevices);
}

/**
 * Replays the fixtures but fails one device with an error that is
 * not a collection failure
 */
class FaultyFixtureAdapter : public FixtureCommandAdapter
{
	public:
		FaultyFixtureAdapter(const DiskHealthConfig& config, const string& faulty) :
			FixtureCommandAdapter(config.testDataPath, config.testScenario, config.testDevices),
			m_faulty(faulty)
		{
		}
		RawDeviceRecord collect(const string& device)
		{
			if (device == m_faulty)
				throw regex_error(regex_constants::error_brack);
			return FixtureCommandAdapter::collect(device);
		}

	private:
		string	m_faulty;
};

TEST(DiskHealthServiceTest, HealthyScanAll)
{
	DiskHealthConfig config = testConfig("healthy", {"*"});
	ostringstream out;
	DiskHealthService service(config, fixtureAdapter(config), out);

	ASSERT_TRUE(service.initialise());
	ASSERT_EQ(service.devices().size(), 3U);

	vector<NormalizedRecord> records = service.runCycle();
	ASSERT_EQ(records.size(), 3U);
	ASSERT_EQ(service.lastEvents().size(), 3U);
	for (auto& event : service.lastEvents())
	{
		ASSERT_EQ(event.severity, AlertEvent::Severity::INFO) << event.device;
		ASSERT_EQ(event.nodeName, "node1");
	}

	// One JSON array per cycle on the output stream
	Document doc;
	doc.Parse(out.str().c_str());
	ASSERT_FALSE(doc.HasParseError());
	ASSERT_TRUE(doc.IsArray());
	ASSERT_EQ(doc.Size(), 3U);
	ASSERT_STREQ(doc[0]["device"].GetString(), "/dev/nvme0n1");
	ASSERT_STREQ(doc[0]["device_info"]["product"].GetString(), "P5600-Dell");
	ASSERT_STREQ(doc[1]["instance_id"].GetString(), "ceph-a");
}

TEST(DiskHealthServiceTest, ConfiguredDevices)
{
	DiskHealthConfig config = testConfig("healthy", {"/dev/sdb"});
	ostringstream out;
	DiskHealthService service(config, fixtureAdapter(config), out);

	ASSERT_TRUE(service.initialise());
	ASSERT_EQ(service.devices().size(), 1U);
	vector<NormalizedRecord> records = service.runCycle();
	ASSERT_EQ(records.size(), 1U);
	ASSERT_EQ(records[0].device, "/dev/sdb");
	ASSERT_EQ(records[0].deviceInfo.vendor, "SEAGATE");
}

TEST(DiskHealthServiceTest, TestDevicesOverrideDisks)
{
	DiskHealthConfig config = testConfig("healthy", {"/dev/sdb"});
	config.testDevices = {"/dev/sda", "/dev/nvme0n1"};
	ostringstream out;
	DiskHealthService service(config, fixtureAdapter(config), out);

	ASSERT_TRUE(service.initialise());
	ASSERT_EQ(service.devices().size(), 2U);
	ASSERT_EQ(service.devices()[0], "/dev/sda");
}

TEST(DiskHealthServiceTest, Warning)
{
	DiskHealthConfig config = testConfig("reallocated", {"/dev/sda"});
	ostringstream out;
	DiskHealthService service(config, fixtureAdapter(config), out);

	ASSERT_TRUE(service.initialise());
	service.runCycle();
	ASSERT_EQ(service.lastEvents().size(), 1U);
	const AlertEvent& event = service.lastEvents()[0];
	ASSERT_EQ(event.severity, AlertEvent::Severity::WARNING);
	ASSERT_EQ(event.eventType, "health_alert");
	ASSERT_EQ(event.details.at("ReallocatedSectors"), "15 (Warning: Exceeds threshold of 10)");
}

TEST(DiskHealthServiceTest, CustomThreshold)
{
	DiskHealthConfig config = testConfig("reallocated", {"/dev/sda"});
	config.thresholds.reallocatedSectors = 20;
	ostringstream out;
	DiskHealthService service(config, fixtureAdapter(config), out);

	ASSERT_TRUE(service.initialise());
	service.runCycle();
	ASSERT_EQ(service.lastEvents()[0].severity, AlertEvent::Severity::INFO);
}

TEST(DiskHealthServiceTest, FailedDeviceSkipped)
{
	DiskHealthConfig config = testConfig("failed", {"/dev/sdx", "/dev/sdb", "/dev/sdq"});
	ostringstream out;
	DiskHealthService service(config, fixtureAdapter(config), out);

	ASSERT_TRUE(service.initialise());
	vector<NormalizedRecord> records = service.runCycle();
	ASSERT_EQ(records.size(), 1U);
	ASSERT_EQ(records[0].device, "/dev/sdb");
	ASSERT_EQ(service.lastEvents().size(), 1U);

	Document doc;
	doc.Parse(out.str().c_str());
	ASSERT_FALSE(doc.HasParseError());
	ASSERT_EQ(doc.Size(), 1U);
}

TEST(DiskHealthServiceTest, MetricsPublished)
{
	DiskHealthConfig config = testConfig("worn", {"/dev/sdc"});
	config.prometheus = true;
	ostringstream out;
	DiskHealthService service(config, fixtureAdapter(config), out);

	// The cycle resolves the devices itself, no endpoint is started
	service.runCycle();
	service.runCycle();

	MetricLabels labels;
	labels.push_back(make_pair(string("disk"), string("/dev/sdc")));
	labels.push_back(make_pair(string("node"), string("node1")));
	labels.push_back(make_pair(string("instance"), string("ceph-a")));
	labels.push_back(make_pair(string("osd_id"), string("")));
	double value;
	ASSERT_TRUE(service.registry().getValue(METRIC_SSD_LIFE_USED, labels, value));
	ASSERT_EQ(value, 85.0);
	ASSERT_TRUE(service.registry().getValue(METRIC_POWER_ON_HOURS, labels, value));
	ASSERT_EQ(value, 52110.0);
	ASSERT_EQ(service.lastEvents()[0].severity, AlertEvent::Severity::CRITICAL);
}

TEST(DiskHealthServiceTest, MissingScenario)
{
	DiskHealthConfig config = testConfig("no-such-scenario", {"/dev/sda"});
	ostringstream out;
	DiskHealthService service(config, fixtureAdapter(config), out);
	ASSERT_FALSE(service.initialise());
}

TEST(DiskHealthServiceTest, NatsUnreachable)
{
	DiskHealthConfig config = testConfig("healthy", {"/dev/sda"});
	unsigned short port;
	{
		boost::asio::io_context ctx;
		boost::asio::ip::tcp::acceptor acceptor(ctx,
			boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
		port = acceptor.local_endpoint().port();
	}
	config.natsUrl = "nats://127.0.0.1:" + to_string(port);
	ostringstream out;
	DiskHealthService service(config, fixtureAdapter(config), out);
	ASSERT_FALSE(service.initialise());
}

TEST(DiskHealthServiceTest, SingleCycle)
{
	DiskHealthConfig config = testConfig("healthy", {"/dev/sda"});
	ostringstream out;
	DiskHealthService service(config, fixtureAdapter(config), out);
	ASSERT_TRUE(service.initialise());
	service.start();

	string output = out.str();
	ASSERT_EQ(count(output.begin(), output.end(), '\n'), 1);
}

TEST(DiskHealthServiceTest, LoopStops)
{
	DiskHealthConfig config = testConfig("healthy", {"/dev/sda"});
	config.once = false;
	config.interval = 1;
	ostringstream out;
	DiskHealthService service(config, fixtureAdapter(config), out);
	ASSERT_TRUE(service.initialise());

	thread stopper([&service]() {
		this_thread::sleep_for(chrono::milliseconds(1500));
		service.stop();
	});
	service.start();
	stopper.join();

	string output = out.str();
	ASSERT_GE(count(output.begin(), output.end(), '\n'), 2);
}

TEST(DiskHealthServiceTest, UnexpectedFailureSkipsDevice)
{
	DiskHealthConfig config = testConfig("healthy", {"/dev/sda", "/dev/sdb"});
	ostringstream out;
	DiskHealthService service(config, new FaultyFixtureAdapter(config, "/dev/sda"), out);

	ASSERT_TRUE(service.initialise());
	vector<NormalizedRecord> records;
	ASSERT_NO_THROW(records = service.runCycle());
	ASSERT_EQ(records.size(), 1U);
	ASSERT_EQ(records[0].device, "/dev/sdb");
	ASSERT_EQ(service.lastEvents().size(), 1U);
}

TEST(DiskHealthServiceTest, CorruptNVMeCompanionStillReported)
{
	DiskHealthConfig config = testConfig("corrupt", {"*"});
	ostringstream out;
	DiskHealthService service(config, fixtureAdapter(config), out);

	ASSERT_TRUE(service.initialise());
	ASSERT_EQ(service.devices().size(), 1U);
	vector<NormalizedRecord> records = service.runCycle();
	ASSERT_EQ(records.size(), 1U);
	ASSERT_EQ(records[0].device, "/dev/nvme0n1");
	ASSERT_EQ(records[0].deviceInfo.serialNumber, "PHAB012345671P6DGN");
}
