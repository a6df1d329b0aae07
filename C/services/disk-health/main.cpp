/*
 * Disk health service.
 *
 * Copyright (c) 2024 Dianomic Systems
 *
 * Released under the Apache 2.0 Licence
 *
 * Author: Mark Riddoch
 */
#include <disk_health_service.h>
#include <disk_health_config.h>
#include <disk_health_exceptions.h>
#include <command_adapter.h>
#include <logger.h>
#include <iostream>
#include <signal.h>
#include <execinfo.h>
#include <dlfcn.h>
#include <cxxabi.h>
#include <fcntl.h>
#include <syslog.h>
#include <unistd.h>
#include <string.h>
#include <stdlib.h>

extern int makeDaemon(void);
extern void handler(int sig);

using namespace std;

static DiskHealthService *service = NULL;

/**
 * SIGINT and SIGTERM ask the loop to finish the current cycle and exit
 */
static void shutdownHandler(int sig)
{
	(void)sig;
	if (service)
		service->stop();
}

/**
 * Disk health service main entry point
 */
int main(int argc, char *argv[])
{
	signal(SIGSEGV, handler);
	signal(SIGILL, handler);
	signal(SIGBUS, handler);
	signal(SIGFPE, handler);
	signal(SIGABRT, handler);

	// No SA_RESTART so that the timer read is interrupted
	struct sigaction action;
	memset(&action, 0, sizeof(action));
	action.sa_handler = shutdownHandler;
	sigemptyset(&action.sa_mask);
	sigaction(SIGINT, &action, NULL);
	sigaction(SIGTERM, &action, NULL);

	Logger *logger = new Logger(SERVICE_NAME);

	DiskHealthConfig config;
	try {
		config.parseArguments(argc, argv);
		config.mergeEnvironment();
		config.validate();
	} catch (ConfigurationException& e) {
		logger->fatal("Invalid configuration: %s", e.what());
		cerr << "Invalid configuration: " << e.what() << endl;
		delete logger;
		return 1;
	}
	logger->setMinLevel(config.logLevel);
	logger->setForeground(config.foreground);

	if (!config.foreground && !config.once && makeDaemon() == -1)
	{
		// Failed to run in daemon mode
		cout << "Failed to run as deamon - proceeding in interactive mode." << endl;
	}

	CommandAdapter *adapter;
	if (config.testMode)
	{
		adapter = new FixtureCommandAdapter(config.testDataPath, config.testScenario, config.testDevices);
	}
	else
	{
		adapter = new SmartctlCommandAdapter(config.commandTimeout);
	}

	service = new DiskHealthService(config, adapter);
	int rval = 0;
	if (service->initialise())
	{
		// Only returns when the service is shutdown
		service->start();
	}
	else
	{
		rval = 1;
	}
	DiskHealthService *s = service;
	service = NULL;
	delete s;
	delete logger;
	return rval;
}

/**
 * Detach the process from the terminal and run in the background.
 */
int makeDaemon()
{
pid_t pid;

	/* Make the child process inherit the log level */
	int logmask = setlogmask(0);
	/* create new process */
	if ((pid = fork()  ) == -1)
	{
		return -1;
	}
	else if (pid != 0)
	{
		exit (EXIT_SUCCESS);
	}
	setlogmask(logmask);

	// If we got here we are a child process

	// create new session and process group
	if (setsid() == -1)
	{
		return -1;
	}

	// Close stdin, stdout and stderr
	close(0);
	close(1);
	close(2);
	// redirect fd's 0,1,2 to /dev/null
	(void)open("/dev/null", O_RDWR);  	// stdin
	if (dup(0) == -1) {}			// stdout	Workaround for GCC bug 66425 produces warning
	if (dup(0) == -1) {} 			// stderr	WOrkaround for GCC bug 66425 produces warning
 	return 0;
}

void handler(int sig)
{
Logger	*logger = Logger::getLogger();
void	*array[20];
char	buf[1024];
int	size;

	// get void*'s for all entries on the stack
	size = backtrace(array, 20);

	// print out all the frames to stderr
	logger->fatal("Signal %d (%s) trapped:\n", sig, strsignal(sig));
	char **messages = backtrace_symbols(array, size);
	for (int i = 0; i < size; i++)
	{
		Dl_info info;
		if (dladdr(array[i], &info) && info.dli_sname)
		{
		    char *demangled = NULL;
		    int status = -1;
		    if (info.dli_sname[0] == '_')
		        demangled = abi::__cxa_demangle(info.dli_sname, NULL, 0, &status);
		    snprintf(buf, sizeof(buf), "%-3d %*p %s + %zd---------",
		             i, int(2 + sizeof(void*) * 2), array[i],
		             status == 0 ? demangled :
		             info.dli_sname == 0 ? messages[i] : info.dli_sname,
		             (char *)array[i] - (char *)info.dli_saddr);
		    free(demangled);
		}
		else
		{
		    snprintf(buf, sizeof(buf), "%-3d %*p %s---------",
		             i, int(2 + sizeof(void*) * 2), array[i], messages[i]);
		}
		logger->fatal("(%d) %s", i, buf);
	}
	free(messages);
	exit(1);
}
