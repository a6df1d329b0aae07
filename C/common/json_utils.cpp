/*
 * Disk health utilities functions for handling JSON document
 *
 * Copyright (c) 2018 Dianomic Systems
 *
 * Released under the Apache 2.0 Licence
 *
 * Author: Stefano Simonelli
 */

#include <string>
#include <stdlib.h>
#include <stdint.h>
#include <limits.h>
#include "json_utils.h"

using namespace std;
using namespace rapidjson;

/**
 * Fetch an integer member of a JSON object.
 *
 * Tools such as smartctl and nvme-cli are not consistent in the
 * way they print large counters, so signed, unsigned, floating point
 * and numeric string representations are all accepted.
 *
 * @param object	The JSON object
 * @param name		The member name
 * @param value		Set to the member value when found
 * @return		True if the member exists and is numeric
 */
bool JSONHasInt64(const Value& object, const char *name, long long& value)
{
	if (!object.IsObject())
		return false;

	Value::ConstMemberIterator itr = object.FindMember(name);
	if (itr == object.MemberEnd())
		return false;

	const Value& member = itr->value;
	if (member.IsInt64())
	{
		value = member.GetInt64();
		return true;
	}
	if (member.IsUint64())
	{
		uint64_t u = member.GetUint64();
		value = u > (uint64_t)LLONG_MAX ? LLONG_MAX : (long long)u;
		return true;
	}
	if (member.IsDouble())
	{
		double d = member.GetDouble();
		value = d >= 9.2e18 ? LLONG_MAX : (long long)d;
		return true;
	}
	if (member.IsString())
	{
		const char *str = member.GetString();
		char *end = NULL;
		long long parsed = strtoll(str, &end, 0);
		if (end != str && *end == '\0')
		{
			value = parsed;
			return true;
		}
	}
	return false;
}

/**
 * Fetch an integer member of a JSON object or return a default
 *
 * @param object	The JSON object
 * @param name		The member name
 * @param defaultValue	The value to return if the member is missing
 */
long long JSONGetInt64(const Value& object, const char *name, long long defaultValue)
{
	long long value;
	if (JSONHasInt64(object, name, value))
		return value;
	return defaultValue;
}

/**
 * Fetch a string member of a JSON object or return a default
 */
string JSONGetString(const Value& object, const char *name, const string& defaultValue)
{
	if (!object.IsObject())
		return defaultValue;

	Value::ConstMemberIterator itr = object.FindMember(name);
	if (itr == object.MemberEnd() || !itr->value.IsString())
		return defaultValue;
	return string(itr->value.GetString(), itr->value.GetStringLength());
}

/**
 * Fetch a boolean member of a JSON object or return a default
 */
bool JSONGetBool(const Value& object, const char *name, bool defaultValue)
{
	if (!object.IsObject())
		return defaultValue;

	Value::ConstMemberIterator itr = object.FindMember(name);
	if (itr == object.MemberEnd() || !itr->value.IsBool())
		return defaultValue;
	return itr->value.GetBool();
}

/**
 * Return a pointer to an object member, or NULL if the member
 * is missing or is not an object
 */
const Value *JSONGetObject(const Value& object, const char *name)
{
	if (!object.IsObject())
		return NULL;

	Value::ConstMemberIterator itr = object.FindMember(name);
	if (itr == object.MemberEnd() || !itr->value.IsObject())
		return NULL;
	return &itr->value;
}

/**
 * Return a pointer to an array member, or NULL if the member
 * is missing or is not an array
 */
const Value *JSONGetArray(const Value& object, const char *name)
{
	if (!object.IsObject())
		return NULL;

	Value::ConstMemberIterator itr = object.FindMember(name);
	if (itr == object.MemberEnd() || !itr->value.IsArray())
		return NULL;
	return &itr->value;
}

/**
 * Escape a string so that it can be placed inside double quotes.
 * This is also the escaping used for Prometheus label values.
 */
string JSONescape(const std::string& subject)
{
	string escaped;
	escaped.reserve(subject.length());

	for (size_t i = 0; i < subject.length(); i++)
	{
		char c = subject[i];
		switch (c)
		{
			case '"':
				escaped += "\\\"";
				break;
			case '\\':
				escaped += "\\\\";
				break;
			case '\n':
				escaped += "\\n";
				break;
			default:
				escaped += c;
				break;
		}
	}
	return escaped;
}
