#ifndef _ATTRIBUTE_NORMALIZER_H
#define _ATTRIBUTE_NORMALIZER_H
/*
 * Disk health service.
 *
 * Copyright (c) 2024 Dianomic Systems
 *
 * Released under the Apache 2.0 Licence
 *
 * Author: Mark Riddoch
 */
#include <smartctl_output.h>
#include <smart_attributes.h>
#include <device_info.h>

/**
 * The result of normalizing one raw device record
 */
class NormalizedDevice
{
	public:
		DeviceInfo	info;
		AttributeSet	attributes;
};

/**
 * Maps the ATA, SCSI and NVMe representations of a smartctl
 * record onto the canonical attribute catalog and device
 * description.
 */
class AttributeNormalizer
{
	public:
		AttributeNormalizer() {};
		~AttributeNormalizer() {};

		NormalizedDevice	normalize(const RawDeviceRecord& raw) const;

		void			processAta(const RawDeviceRecord& raw, AttributeSet& attributes) const;
		void			processScsi(const RawDeviceRecord& raw, AttributeSet& attributes) const;
		void			processNVMe(const RawDeviceRecord& raw, AttributeSet& attributes) const;
		void			processNVMeEnrichment(const RawDeviceRecord& raw,
							AttributeSet& attributes) const;

	private:
		void			setReading(AttributeSet& attributes, SmartAttributeKey key,
							long long reading) const;
};

long long parseGigabytes(const std::string& value);

#endif
