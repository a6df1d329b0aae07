/*
 * Disk health service.
 *
 * Copyright (c) 2017-2018 OSisoft, LLC
 *
 * Released under the Apache 2.0 Licence
 *
 * Author: Mark Riddoch, Massimiliano Pinto
 */
#include <logger.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <syslog.h>
#include <string.h>
#include <stdexcept>
#include <sys/socket.h>
#include <arpa/inet.h>

using namespace std;

const char * DEFAULT_LOG_IP = "127.0.0.1";
const int DEFAULT_LOG_PORT = 5140;

/**
 * The singleton pointer
 */
Logger *Logger::instance = 0;

/**
 * Constructor for the Logger class.
 *
 * @param application	The application name
 */
Logger::Logger(const string& application) : m_foreground(false)
{
	static char ident[80];

	if (instance)
	{
		instance->error("Attempt to create second singleton instance, original application name %s, current attempt made by %s", ident, application.c_str());
		throw runtime_error("Attempt to create second Logger instance");
	}
	/* Prepend "DiskHealth " in all cases other than the service itself
	 */
	if (application.compare("DiskHealth") != 0)
	{
		snprintf(ident, sizeof(ident), "DiskHealth %s", application.c_str());
	}
	else
	{
		strncpy(ident, application.c_str(), sizeof(ident) - 1);
	}

	const char* udpEnabledEnv = getenv("SYSLOG_UDP_ENABLED");
	m_SyslogUdpEnabled = (udpEnabledEnv != NULL && string(udpEnabledEnv) == "true");

	if (m_SyslogUdpEnabled)
	{
		const char* logIpEnv = getenv("LOG_IP");
		const char* logPortEnv = getenv("LOG_PORT");

		string logIp = logIpEnv ? logIpEnv : DEFAULT_LOG_IP;
		int logPort = logPortEnv ? atoi(logPortEnv) : DEFAULT_LOG_PORT;
		m_UdpSockFD = socket(AF_INET, SOCK_DGRAM, 0);
		if (m_UdpSockFD >= 0)
		{
			memset(&m_UdpServerAddr, 0, sizeof(m_UdpServerAddr));
			m_UdpServerAddr.sin_family = AF_INET;
			m_UdpServerAddr.sin_port = htons(logPort);
			if (inet_pton(AF_INET, logIp.c_str(), &m_UdpServerAddr.sin_addr) <= 0)
			{
				close(m_UdpSockFD);
				m_UdpSockFD = -1;
				throw runtime_error("Invalid LOG_IP address");
			}
		}
		else
		{
			throw runtime_error("Failed to create UDP socket");
		}
	}
	else
	{
		openlog(ident, LOG_PID|LOG_CONS, LOG_USER);
	}

	instance = this;
	levelString = "warning";
	m_level = LOG_WARNING;
}

/**
 * Destructor for the logger class.
 */
Logger::~Logger()
{
	// Stop the getLogger() call returning a deleted instance
	if (instance == this)
		instance = NULL;
	else if (!instance)
		return;	// Already destroyed

	if (!m_SyslogUdpEnabled)
	{
		closelog();
	}
	else if (m_UdpSockFD >= 0)
	{
		close(m_UdpSockFD);
		m_UdpSockFD = -1;
	}
}

/**
 * Send a message to the UDP sink if enabled
 *
 * @param msg		The message to send
 */
void Logger::sendToUdpSink(const std::string& msg)
{
	if (m_UdpSockFD >= 0)
	{
		sendto(m_UdpSockFD, msg.c_str(), msg.size(), 0, (struct sockaddr*)&m_UdpServerAddr, sizeof(m_UdpServerAddr));
	}
}

/**
 * Return the singleton instance of the logger class.
 */
Logger *Logger::getLogger()
{
	if (!instance)
	{
		// The service should have already created the logger
		// for itself. If not then create the default logger
		// and clearly identify this.
		instance = new Logger("(default)");
	}

	return instance;
}

/**
 * Set the minimum level of logging to write to syslog.
 *
 * @param level	The minimum, inclusive, level of logging to write
 */
void Logger::setMinLevel(const string& level)
{
	if (level.compare("info") == 0)
	{
		setlogmask(LOG_UPTO(LOG_INFO));
		levelString = level;
		m_level = LOG_INFO;
	} else if (level.compare("warning") == 0)
	{
		setlogmask(LOG_UPTO(LOG_WARNING));
		levelString = level;
		m_level = LOG_WARNING;
	} else if (level.compare("debug") == 0)
	{
		setlogmask(LOG_UPTO(LOG_DEBUG));
		levelString = level;
		m_level = LOG_DEBUG;
	} else if (level.compare("error") == 0)
	{
		setlogmask(LOG_UPTO(LOG_ERR));
		levelString = level;
		m_level = LOG_ERR;
	} else
	{
		error("Request to set unsupported log level %s", level.c_str());
	}
}

/**
 * Log a message at the level debug
 *
 * @param msg		A printf format string
 * @param ...		The variable arguments required by the printf format
 */
void Logger::debug(const string& msg, ...)
{
	va_list args;
	va_start(args, msg);
	log(LOG_DEBUG, "DEBUG", msg, args);
	va_end(args);
}

/**
 * Log a message at the level info
 *
 * @param msg		A printf format string
 * @param ...		The variable arguments required by the printf format
 */
void Logger::info(const std::string& msg, ...)
{
	va_list args;
	va_start(args, msg);
	log(LOG_INFO, "INFO", msg, args);
	va_end(args);
}

/**
 * Log a message at the level warn
 *
 * @param msg		A printf format string
 * @param ...		The variable arguments required by the printf format
 */
void Logger::warn(const string& msg, ...)
{
	va_list args;
	va_start(args, msg);
	log(LOG_WARNING, "WARNING", msg, args);
	va_end(args);
}

/**
 * Log a message at the level error
 *
 * @param msg		A printf format string
 * @param ...		The variable arguments required by the printf format
 */
void Logger::error(const string& msg, ...)
{
	va_list args;
	va_start(args, msg);
	log(LOG_ERR, "ERROR", msg, args);
	va_end(args);
}

/**
 * Log a message at the level fatal
 *
 * @param msg		A printf format string
 * @param ...		The variable arguments required by the printf format
 */
void Logger::fatal(const string& msg, ...)
{
	va_list args;
	va_start(args, msg);
	log(LOG_CRIT, "FATAL", msg, args);
	va_end(args);
}

/**
 * Log a message at the specified level
 *
 * @param sysLogLvl	The syslog level to use
 * @param lvlName	The name of the log level
 * @param msg		A printf format string
 * @param args		The variable arguments required by the printf format
 */
void Logger::log(int sysLogLvl, const char * lvlName, const std::string& msg, va_list args)
{
	if (m_level < sysLogLvl)
	{
		return;
	}

	constexpr size_t MAX_BUFFER_SIZE = 1024;
	char buffer[MAX_BUFFER_SIZE];

	int copied = snprintf(buffer, sizeof(buffer), "%s: ", lvlName);
	vsnprintf(buffer + copied, sizeof(buffer) - copied, msg.c_str(), args);

	if (m_SyslogUdpEnabled)
	{
		sendToUdpSink(buffer);
	}
	else
	{
		syslog(sysLogLvl, "%s", buffer);
	}

	if (m_foreground)
	{
		lock_guard<mutex> guard(m_stderrMutex);
		fprintf(stderr, "%s\n", buffer);
	}
}
