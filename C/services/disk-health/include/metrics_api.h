#ifndef _METRICS_API_H
#define _METRICS_API_H
/*
 * Disk health service.
 *
 * Copyright (c) 2024 Dianomic Systems
 *
 * Released under the Apache 2.0 Licence
 *
 * Author: Mark Riddoch
 */
#include <server_http.hpp>
#include <metrics_registry.h>
#include <logger.h>
#include <string>
#include <thread>

#define METRICS_PATH	"^/metrics$"

using HttpServer = SimpleWeb::Server<SimpleWeb::HTTP>;

/**
 * The pull endpoint that serves the metrics registry to a
 * Prometheus scraper
 */
class MetricsApi {
	public:
		MetricsApi(MetricsRegistry& registry, const unsigned short port);
		~MetricsApi();
		static MetricsApi *getInstance();
		void start();
		void startServer();
		void stop();
		void metrics(std::shared_ptr<HttpServer::Response> response, std::shared_ptr<HttpServer::Request> request);

	protected:
		static MetricsApi *m_instance;
		MetricsRegistry&	m_registry;
		Logger			*m_logger;
		HttpServer		*m_server;
		std::thread		*m_thread;
	private:
		void			respond(std::shared_ptr<HttpServer::Response>, const std::string&);
};
#endif
