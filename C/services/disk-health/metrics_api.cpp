/*
 * Disk health service.
 *
 * Copyright (c) 2024 Dianomic Systems
 *
 * Released under the Apache 2.0 Licence
 *
 * Author: Mark Riddoch
 */
#include <metrics_api.h>
#include <logger.h>

using namespace std;
using HttpServer = SimpleWeb::Server<SimpleWeb::HTTP>;

MetricsApi *MetricsApi::m_instance = 0;

/**
 * Wrapper for the metrics method
 */
void metricsWrapper(shared_ptr<HttpServer::Response> response, shared_ptr<HttpServer::Request> request)
{
	MetricsApi *api = MetricsApi::getInstance();
	api->metrics(response, request);
}

/**
 * Construct the metrics endpoint
 *
 * @param registry	The registry to serve
 * @param port		The port to listen on
 */
MetricsApi::MetricsApi(MetricsRegistry& registry, const unsigned short port) :
	m_registry(registry), m_thread(0)
{
	m_server = new HttpServer();
	m_logger = Logger::getLogger();
	m_server->config.port = port;
	m_server->resource[METRICS_PATH]["GET"] = metricsWrapper;

	m_instance = this;

	m_logger->info("Starting metrics endpoint on port %d.", port);
}

/**
 * Start HTTP server for the metrics endpoint
 */
static void startService()
{
	MetricsApi::getInstance()->startServer();
}

void MetricsApi::start()
{
	m_thread = new thread(startService);
}

void MetricsApi::startServer()
{
	m_server->start();
}

void MetricsApi::stop()
{
	m_server->stop();
	if (m_thread)
	{
		m_thread->join();
		delete m_thread;
		m_thread = 0;
	}
}

/**
 * Return the singleton instance of the metrics endpoint
 */
MetricsApi *MetricsApi::getInstance()
{
	return m_instance;
}

MetricsApi::~MetricsApi()
{
	if (m_thread)
	{
		stop();
	}
	delete m_server;
	m_instance = 0;
}

/**
 * Serve a scrape request
 */
void MetricsApi::metrics(shared_ptr<HttpServer::Response> response, shared_ptr<HttpServer::Request> request)
{
	(void)request;	// Unused argument
	respond(response, m_registry.exposition());
}

void MetricsApi::respond(shared_ptr<HttpServer::Response> response, const string& payload)
{
	*response << "HTTP/1.1 200 OK\r\nContent-Length: " << payload.length() << "\r\n"
		 << "Content-type: text/plain; version=0.0.4\r\n\r\n" << payload;
}
