/*
 * Disk health service.
 *
 * Copyright (c) 2024 Dianomic Systems
 *
 * Released under the Apache 2.0 Licence
 *
 * Author: Mark Riddoch
 */
#include <nats_publisher.h>
#include <disk_health_exceptions.h>
#include <string_utils.h>
#include <json_utils.h>
#include <logger.h>
#include <istream>
#include <sys/socket.h>
#include <sys/time.h>

using namespace std;
using boost::asio::ip::tcp;

/**
 * Construct a publisher for a NATS server
 *
 * @param url			The server URL, nats://[user:password@]host[:port]
 * @param clientName		The name the client announces to the server
 * @param timeoutSeconds	The deadline for each read and write
 * @throws ConfigurationException if the URL is malformed
 */
NatsPublisher::NatsPublisher(const string& url, const string& clientName, int timeoutSeconds) :
	m_clientName(clientName), m_timeout(timeoutSeconds), m_connected(false), m_socket(m_ioContext)
{
	m_address = parseUrl(url);
}

NatsPublisher::~NatsPublisher()
{
	close();
}

/**
 * Split a NATS URL into its parts. Only the first server of a
 * comma separated list is used.
 */
NatsServerAddress NatsPublisher::parseUrl(const string& url)
{
	NatsServerAddress address;
	string rest = StringTrim(url);
	string::size_type comma = rest.find(',');
	if (comma != string::npos)
		rest = rest.substr(0, comma);

	string::size_type scheme = rest.find("://");
	if (scheme != string::npos)
	{
		string protocol = StringToLower(rest.substr(0, scheme));
		if (protocol.compare("nats") != 0)
		{
			throw ConfigurationException("Unsupported NATS URL scheme " + protocol);
		}
		rest = rest.substr(scheme + 3);
	}
	string::size_type slash = rest.find('/');
	if (slash != string::npos)
		rest = rest.substr(0, slash);

	string::size_type at = rest.rfind('@');
	if (at != string::npos)
	{
		string credentials = rest.substr(0, at);
		rest = rest.substr(at + 1);
		string::size_type colon = credentials.find(':');
		if (colon != string::npos)
		{
			address.user = credentials.substr(0, colon);
			address.password = credentials.substr(colon + 1);
		}
		else
		{
			address.user = credentials;
		}
	}

	string::size_type colon = rest.rfind(':');
	if (colon != string::npos)
	{
		address.host = rest.substr(0, colon);
		address.port = rest.substr(colon + 1);
		if (!StringIsDigits(address.port))
		{
			throw ConfigurationException("Invalid port in NATS URL " + url);
		}
	}
	else
	{
		address.host = rest;
		address.port = NATS_DEFAULT_PORT;
	}
	if (address.host.empty())
	{
		throw ConfigurationException("No host in NATS URL " + url);
	}
	return address;
}

/**
 * Build the CONNECT command sent after the server INFO
 */
string NatsPublisher::connectCommand(const NatsServerAddress& address, const string& clientName)
{
	string command = "CONNECT {\"verbose\":false,\"pedantic\":false,\"lang\":\"cpp\",\"version\":\"1.0\"";
	command += ",\"name\":\"" + JSONescape(clientName) + "\"";
	if (!address.user.empty())
	{
		command += ",\"user\":\"" + JSONescape(address.user) + "\"";
		command += ",\"pass\":\"" + JSONescape(address.password) + "\"";
	}
	command += "}\r\n";
	return command;
}

/**
 * Connect to the server and complete the handshake
 *
 * @throws PublishException if the server cannot be reached or
 *	rejects the connection
 */
void NatsPublisher::connect()
{
	close();
	try {
		tcp::resolver resolver(m_ioContext);
		boost::asio::connect(m_socket, resolver.resolve(m_address.host, m_address.port));

		struct timeval tv;
		tv.tv_sec = m_timeout;
		tv.tv_usec = 0;
		setsockopt(m_socket.native_handle(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
		setsockopt(m_socket.native_handle(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

		string info = readLine();
		if (!StringStartsWith(info, "INFO"))
		{
			throw PublishException("Unexpected greeting from NATS server: " + info);
		}
		writeAll(connectCommand(m_address, m_clientName));
		m_connected = true;
		flush();
	} catch (boost::system::system_error& e) {
		m_connected = false;
		throw PublishException("Unable to connect to NATS server " + m_address.host + ":"
				+ m_address.port + ": " + e.what());
	} catch (PublishException& e) {
		close();
		throw;
	}
	Logger::getLogger()->info("Connected to NATS server %s:%s", m_address.host.c_str(), m_address.port.c_str());
}

/**
 * Publish a message. A broken connection is reopened first.
 *
 * @param subject	The subject to publish on
 * @param payload	The message
 * @throws PublishException if the message could not be sent
 */
void NatsPublisher::publish(const string& subject, const string& payload)
{
	if (!m_connected)
	{
		connect();
	}
	else
	{
		servicePending();
	}
	try {
		writeAll("PUB " + subject + " " + to_string(payload.size()) + "\r\n" + payload + "\r\n");
	} catch (boost::system::system_error& e) {
		m_connected = false;
		throw PublishException("Failed to publish on " + subject + ": " + e.what());
	}
}

/**
 * Round trip a PING to the server. Any error the server reports
 * for the preceding messages is raised here.
 *
 * @throws PublishException on a server error or a lost connection
 */
void NatsPublisher::flush()
{
	try {
		writeAll("PING\r\n");
		while (true)
		{
			string line = readLine();
			if (StringStartsWith(line, "PONG"))
			{
				return;
			}
			else if (StringStartsWith(line, "PING"))
			{
				writeAll("PONG\r\n");
			}
			else if (StringStartsWith(line, "-ERR"))
			{
				m_connected = false;
				throw PublishException("NATS server error: " + line);
			}
			// +OK and INFO updates need no action
		}
	} catch (boost::system::system_error& e) {
		m_connected = false;
		throw PublishException(string("Lost connection to NATS server: ") + e.what());
	}
}

/**
 * Handle whatever the server sent since the last exchange without
 * blocking. Server PINGs are answered so that an idle connection is
 * not dropped as stale. A connection the server has closed is reopened.
 *
 * @throws PublishException if the connection cannot be reopened
 */
void NatsPublisher::servicePending()
{
	boost::system::error_code ec;
	m_socket.non_blocking(true, ec);
	while (!ec)
	{
		size_t n = m_socket.read_some(m_buffer.prepare(512), ec);
		m_buffer.commit(n);
	}
	boost::system::error_code restore;
	m_socket.non_blocking(false, restore);

	bool stale = (ec != boost::asio::error::would_block && ec != boost::asio::error::try_again);
	try {
		while (!stale && bufferedLine())
		{
			string line = readLine();
			if (StringStartsWith(line, "PING"))
			{
				writeAll("PONG\r\n");
			}
			else if (StringStartsWith(line, "-ERR"))
			{
				Logger::getLogger()->warn("NATS server error: %s", line.c_str());
				stale = true;
			}
		}
	} catch (boost::system::system_error& e) {
		ec = e.code();
		stale = true;
	}
	if (stale)
	{
		Logger::getLogger()->warn("NATS connection to %s:%s lost (%s), reconnecting",
				m_address.host.c_str(), m_address.port.c_str(), ec.message().c_str());
		connect();
	}
}

/**
 * Is there a complete protocol line in the receive buffer
 */
bool NatsPublisher::bufferedLine() const
{
	string pending(boost::asio::buffers_begin(m_buffer.data()),
		       boost::asio::buffers_end(m_buffer.data()));
	return pending.find("\r\n") != string::npos;
}

void NatsPublisher::close()
{
	m_connected = false;
	if (m_socket.is_open())
	{
		boost::system::error_code ec;
		m_socket.shutdown(tcp::socket::shutdown_both, ec);
		m_socket.close(ec);
	}
	m_buffer.consume(m_buffer.size());
}

/**
 * Read one CRLF terminated protocol line
 */
string NatsPublisher::readLine()
{
	boost::asio::read_until(m_socket, m_buffer, "\r\n");
	istream in(&m_buffer);
	string line;
	getline(in, line);
	return StringTrim(line);
}

void NatsPublisher::writeAll(const string& data)
{
	boost::asio::write(m_socket, boost::asio::buffer(data));
}
