#ifndef _JSON_UTILS_H
#define _JSON_UTILS_H
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
#include <rapidjson/document.h>

bool JSONHasInt64(const rapidjson::Value& object, const char *name, long long& value);
long long JSONGetInt64(const rapidjson::Value& object, const char *name, long long defaultValue);
std::string JSONGetString(const rapidjson::Value& object, const char *name,
			  const std::string& defaultValue = "");
bool JSONGetBool(const rapidjson::Value& object, const char *name, bool defaultValue);
const rapidjson::Value *JSONGetObject(const rapidjson::Value& object, const char *name);
const rapidjson::Value *JSONGetArray(const rapidjson::Value& object, const char *name);

std::string JSONescape(const std::string& subject);

#endif
