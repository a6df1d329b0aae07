#include <gtest/gtest.h>
#include <disk_health_config.h>
#include <disk_health_exceptions.h>
#include <string>
#include <vector>
#include <stdlib.h>

using namespace std;

static const char *variables[] = {
	"DISKS", "INTERVAL", "PROMETHEUS", "PROMETHEUS_PORT", "NATS_URL", "NATS_SUBJECT",
	"NODE_NAME", "INSTANCE_ID", "GROWN_DEFECTS_THRESHOLD", "PENDING_SECTORS_THRESHOLD",
	"REALLOCATED_SECTORS_THRESHOLD", "LIFETIME_USED_THRESHOLD", "CEPH_OSD_BASE_PATH",
	"COMMAND_TIMEOUT", "TEST_MODE", "TEST_DATA_PATH", "TEST_SCENARIO", "TEST_DEVICES"
};

class DiskHealthConfigTest : public ::testing::Test {
	protected:
		void SetUp()
		{
			clearEnvironment();
		}
		void TearDown()
		{
			clearEnvironment();
		}
		void clearEnvironment()
		{
			for (size_t i = 0; i < sizeof(variables) / sizeof(variables[0]); i++)
				unsetenv(variables[i]);
		}
		void parse(vector<string> args)
		{
			vector<char *> argv;
			args.insert(args.begin(), "disk-health");
			for (auto& arg : args)
				argv.push_back(&arg[0]);
			config.parseArguments((int)argv.size(), argv.data());
		}

		DiskHealthConfig	config;
};

TEST_F(DiskHealthConfigTest, Defaults)
{
	config.mergeEnvironment();
	ASSERT_EQ(config.disks.size(), 2U);
	ASSERT_EQ(config.disks[0], "/dev/sda");
	ASSERT_EQ(config.disks[1], "/dev/sdb");
	ASSERT_EQ(config.interval, 10);
	ASSERT_FALSE(config.prometheus);
	ASSERT_EQ(config.prometheusPort, 8080);
	ASSERT_FALSE(config.natsEnabled());
	ASSERT_EQ(config.natsSubject, "osd.disk.health");
	ASSERT_EQ(config.instanceId, "");
	ASSERT_EQ(config.osdBasePath, "");
	ASSERT_EQ(config.commandTimeout, 30);
	ASSERT_FALSE(config.testMode);
	ASSERT_EQ(config.testDataPath, "./testdata");
	ASSERT_EQ(config.testScenario, "healthy");
	ASSERT_EQ(config.thresholds.grownDefects, 10);
	ASSERT_EQ(config.thresholds.pendingSectors, 3);
	ASSERT_EQ(config.thresholds.reallocatedSectors, 10);
	ASSERT_EQ(config.thresholds.lifetimeUsed, 80);
	ASSERT_FALSE(config.scanAllDisks());
	ASSERT_NO_THROW(config.validate());
}

TEST_F(DiskHealthConfigTest, Environment)
{
	setenv("DISKS", " /dev/sdc , ,/dev/nvme0 ", 1);
	setenv("INTERVAL", "60", 1);
	setenv("PROMETHEUS", "yes", 1);
	setenv("PROMETHEUS_PORT", "9100", 1);
	setenv("NATS_URL", "nats://bus:4222", 1);
	setenv("NODE_NAME", "storage-07", 1);
	setenv("INSTANCE_ID", "ceph-prod", 1);
	setenv("PENDING_SECTORS_THRESHOLD", "0", 1);
	setenv("LIFETIME_USED_THRESHOLD", "95", 1);
	setenv("CEPH_OSD_BASE_PATH", "/var/lib/ceph/osd", 1);
	config.mergeEnvironment();

	ASSERT_EQ(config.disks.size(), 2U);
	ASSERT_EQ(config.disks[0], "/dev/sdc");
	ASSERT_EQ(config.disks[1], "/dev/nvme0");
	ASSERT_EQ(config.interval, 60);
	ASSERT_TRUE(config.prometheus);
	ASSERT_EQ(config.prometheusPort, 9100);
	ASSERT_TRUE(config.natsEnabled());
	ASSERT_EQ(config.nodeName, "storage-07");
	ASSERT_EQ(config.instanceId, "ceph-prod");
	ASSERT_EQ(config.thresholds.pendingSectors, 0);
	ASSERT_EQ(config.thresholds.lifetimeUsed, 95);
	ASSERT_EQ(config.osdBasePath, "/var/lib/ceph/osd");
	ASSERT_NO_THROW(config.validate());
}

TEST_F(DiskHealthConfigTest, EmptyValuesKeepDefaults)
{
	config.nodeName = "host";
	setenv("NATS_SUBJECT", "", 1);
	setenv("NODE_NAME", "", 1);
	setenv("TEST_SCENARIO", "", 1);
	config.mergeEnvironment();
	ASSERT_EQ(config.natsSubject, "osd.disk.health");
	ASSERT_EQ(config.nodeName, "host");
	ASSERT_EQ(config.testScenario, "healthy");
}

TEST_F(DiskHealthConfigTest, Arguments)
{
	parse({"-d", "--once", "--disks=/dev/sdx", "--interval=5", "--prometheus",
	       "--prometheus-port=9200", "--reallocated-sectors-threshold=20",
	       "--grown-defects-threshold=2", "--test-mode", "--test-scenario=worn",
	       "--test-devices=/dev/sdc", "--logLevel=debug", "--unknown"});

	ASSERT_TRUE(config.foreground);
	ASSERT_TRUE(config.once);
	ASSERT_EQ(config.disks.size(), 1U);
	ASSERT_EQ(config.disks[0], "/dev/sdx");
	ASSERT_EQ(config.interval, 5);
	ASSERT_TRUE(config.prometheus);
	ASSERT_EQ(config.prometheusPort, 9200);
	ASSERT_EQ(config.thresholds.reallocatedSectors, 20);
	ASSERT_EQ(config.thresholds.grownDefects, 2);
	ASSERT_TRUE(config.testMode);
	ASSERT_EQ(config.testScenario, "worn");
	ASSERT_EQ(config.testDevices.size(), 1U);
	ASSERT_EQ(config.logLevel, "debug");
}

TEST_F(DiskHealthConfigTest, EnvironmentOverridesArguments)
{
	parse({"--interval=5", "--disks=/dev/sdx"});
	setenv("INTERVAL", "15", 1);
	config.mergeEnvironment();
	ASSERT_EQ(config.interval, 15);
	ASSERT_EQ(config.disks[0], "/dev/sdx");
}

TEST_F(DiskHealthConfigTest, ScanAll)
{
	setenv("DISKS", "*", 1);
	config.mergeEnvironment();
	ASSERT_TRUE(config.scanAllDisks());
}

TEST_F(DiskHealthConfigTest, MalformedValues)
{
	setenv("INTERVAL", "ten", 1);
	ASSERT_THROW(config.mergeEnvironment(), ConfigurationException);

	unsetenv("INTERVAL");
	setenv("PROMETHEUS", "maybe", 1);
	ASSERT_THROW(config.mergeEnvironment(), ConfigurationException);

	unsetenv("PROMETHEUS");
	setenv("PROMETHEUS_PORT", "70000", 1);
	ASSERT_THROW(config.mergeEnvironment(), ConfigurationException);

	ASSERT_THROW(parse({"--command-timeout=5s"}), ConfigurationException);
}

TEST_F(DiskHealthConfigTest, ParseHelpers)
{
	ASSERT_TRUE(DiskHealthConfig::parseBool("x", "TRUE"));
	ASSERT_TRUE(DiskHealthConfig::parseBool("x", "1"));
	ASSERT_FALSE(DiskHealthConfig::parseBool("x", "no"));
	ASSERT_FALSE(DiskHealthConfig::parseBool("x", ""));
	ASSERT_EQ(DiskHealthConfig::parseInteger("x", " 42 "), 42);
	ASSERT_EQ(DiskHealthConfig::parseInteger("x", "-1"), -1);
	ASSERT_THROW(DiskHealthConfig::parseInteger("x", ""), ConfigurationException);
	ASSERT_THROW(DiskHealthConfig::parseInteger("x", "1.5"), ConfigurationException);
	ASSERT_TRUE(DiskHealthConfig::parseList(" , ").empty());
}

TEST_F(DiskHealthConfigTest, Validation)
{
	DiskHealthConfig noDisks;
	noDisks.disks.clear();
	ASSERT_THROW(noDisks.validate(), ConfigurationException);

	DiskHealthConfig interval;
	interval.interval = 0;
	ASSERT_THROW(interval.validate(), ConfigurationException);

	DiskHealthConfig timeout;
	timeout.commandTimeout = -1;
	ASSERT_THROW(timeout.validate(), ConfigurationException);

	DiskHealthConfig lifetime;
	lifetime.thresholds.lifetimeUsed = 101;
	ASSERT_THROW(lifetime.validate(), ConfigurationException);

	DiskHealthConfig sectors;
	sectors.thresholds.pendingSectors = -1;
	ASSERT_THROW(sectors.validate(), ConfigurationException);

	DiskHealthConfig subject;
	subject.natsUrl = "nats://localhost";
	subject.natsSubject = "";
	ASSERT_THROW(subject.validate(), ConfigurationException);
}
