#ifndef _LOGGER_H
#define _LOGGER_H
/*
 * Disk health service.
 *
 * Copyright (c) 2017-2018 OSisoft, LLC
 *
 * Released under the Apache 2.0 Licence
 *
 * Author: Mark Riddoch, Massimiliano Pinto
 */

#include <string>
#include <mutex>
#include <stdarg.h>
#include <sys/socket.h>
#include <arpa/inet.h>

/**
 * Disk health Logger class used to log to syslog
 *
 * At startup this class should be constructed
 * using the standard constructor. To log a message
 * call debug, info, warn etc. using the instance
 * of the class.
 *
 * To obtain that singleton instance call the static
 * method getLogger.
 *
 * When the service runs in the foreground every line
 * is also echoed to stderr so that it can be followed
 * from a terminal or a container log.
 */
class Logger {
	public:
		Logger(const std::string& application);
		~Logger();
		static Logger *getLogger();
		void debug(const std::string& msg, ...);
		void info(const std::string& msg, ...);
		void warn(const std::string& msg, ...);
		void error(const std::string& msg, ...);
		void fatal(const std::string& msg, ...);
		void setMinLevel(const std::string& level);
		std::string& getMinLevel() { return levelString; }
		void setForeground(bool foreground) { m_foreground = foreground; }

	private:
		static Logger   *instance;
		std::string     levelString;
		int		m_level;
		bool		m_foreground;
		std::mutex	m_stderrMutex;

		void log(int sysLogLvl, const char * lvlName, const std::string& msg, va_list args);
		void sendToUdpSink(const std::string& msg);
		int m_UdpSockFD = -1;
		struct sockaddr_in m_UdpServerAddr;
		bool m_SyslogUdpEnabled = false;
};

#endif
