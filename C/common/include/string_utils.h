#ifndef _STRING_UTILS_H
#define _STRING_UTILS_H
/*
 * Disk health utilities functions for handling strings
 *
 * Copyright (c) 2019 Dianomic Systems
 *
 * Released under the Apache 2.0 Licence
 *
 * Author: Stefano Simonelli, Massimiliano Pinto
 */

#include <string>
#include <vector>

void StringReplaceAll(std::string& StringToManage,
		      const std::string& StringToSearch,
		      const std::string& StringReplacement);

std::string StringLTrim(const std::string& str);
std::string StringRTrim(const std::string& str);
std::string StringTrim(const std::string& str);

std::string StringToLower(const std::string& str);
std::string StringTitleCase(const std::string& str);
bool StringStartsWith(const std::string& str, const std::string& prefix);
bool StringIsDigits(const std::string& str);

std::vector<std::string> StringSplit(const std::string& str, char separator);

#endif
