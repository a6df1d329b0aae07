#include <gtest/gtest.h>
#include <logger.h>
#include <stdexcept>
#include <string>

using namespace std;

TEST(LoggerTest, Singleton)
{
	Logger *logger = Logger::getLogger();
	ASSERT_TRUE(logger != NULL);
	ASSERT_EQ(Logger::getLogger(), logger);
	ASSERT_THROW(new Logger("second"), runtime_error);
	ASSERT_EQ(Logger::getLogger(), logger);
}

TEST(LoggerTest, MinLevel)
{
	Logger *logger = Logger::getLogger();
	string original = logger->getMinLevel();

	logger->setMinLevel("debug");
	ASSERT_EQ(logger->getMinLevel(), "debug");
	logger->setMinLevel("verbose");
	ASSERT_EQ(logger->getMinLevel(), "debug");
	logger->setMinLevel("error");
	ASSERT_EQ(logger->getMinLevel(), "error");

	ASSERT_NO_THROW(logger->debug("Suppressed %s %d", "message", 1));
	ASSERT_NO_THROW(logger->error("Logged %s %d", "message", 2));
	logger->setMinLevel(original);
}

TEST(LoggerTest, Foreground)
{
	Logger *logger = Logger::getLogger();
	logger->setForeground(true);
	testing::internal::CaptureStderr();
	logger->error("Device %s failed", "/dev/sdq");
	string output = testing::internal::GetCapturedStderr();
	logger->setForeground(false);
	ASSERT_NE(output.find("Device /dev/sdq failed"), string::npos);
}
