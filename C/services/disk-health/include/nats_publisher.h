#ifndef _NATS_PUBLISHER_H
#define _NATS_PUBLISHER_H
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
#include <boost/asio.hpp>

#define NATS_DEFAULT_PORT	"4222"

/**
 * The parts of a nats:// server URL
 */
struct NatsServerAddress
{
	std::string	host;
	std::string	port;
	std::string	user;
	std::string	password;
};

/**
 * A minimal publish only client of the NATS text protocol.
 * The connection is made once and held for the life of the
 * service, a broken connection is reopened on the next publish.
 * Server PINGs that arrive between cycles are answered on that
 * publish too.
 */
class NatsPublisher
{
	public:
		NatsPublisher(const std::string& url, const std::string& clientName,
			      int timeoutSeconds = 10);
		~NatsPublisher();

		void				connect();
		void				publish(const std::string& subject, const std::string& payload);
		void				flush();
		void				close();
		bool				isConnected() const { return m_connected; };

		static NatsServerAddress	parseUrl(const std::string& url);
		static std::string		connectCommand(const NatsServerAddress& address,
							       const std::string& clientName);

	private:
		void				servicePending();
		bool				bufferedLine() const;
		std::string			readLine();
		void				writeAll(const std::string& data);

		NatsServerAddress		m_address;
		std::string			m_clientName;
		int				m_timeout;
		bool				m_connected;
		boost::asio::io_context		m_ioContext;
		boost::asio::ip::tcp::socket	m_socket;
		boost::asio::streambuf		m_buffer;
};

#endif
