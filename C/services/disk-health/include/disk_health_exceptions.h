#ifndef _DISK_HEALTH_EXCEPTIONS_H
#define _DISK_HEALTH_EXCEPTIONS_H
/*
 * Disk health service.
 *
 * Copyright (c) 2024 Dianomic Systems
 *
 * Released under the Apache 2.0 Licence
 *
 * Author: Mark Riddoch
 */
#include <exception>
#include <string>

/**
 * Base class of the exceptions raised by the disk health service.
 */
class DiskHealthException : public std::exception {
public:
	DiskHealthException(const std::string& error) : errorMessage(error)
	{
	}

	// Compatibility with std::exception.
	const char * what() const noexcept
	{
		return errorMessage.c_str();
	}

private:
	std::string errorMessage;
};

/**
 * Raised when SMART data for a single device cannot be collected
 * or parsed. The device is skipped for the current cycle.
 */
class CollectionException : public DiskHealthException {
public:
	CollectionException(const std::string& error) : DiskHealthException(error)
	{
	}
};

/**
 * Raised for an invalid configuration value.
 */
class ConfigurationException : public DiskHealthException {
public:
	ConfigurationException(const std::string& error) : DiskHealthException(error)
	{
	}
};

/**
 * Raised when the message bus cannot be reached or a
 * message cannot be published.
 */
class PublishException : public DiskHealthException {
public:
	PublishException(const std::string& error) : DiskHealthException(error)
	{
	}
};

#endif
