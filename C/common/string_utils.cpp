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
#include <ctype.h>
#include "string_utils.h"

using namespace std;

static const char *WHITESPACE = " \t\r\n";

/**
 * Search and replace all the occurrences of a string
 *
 * The search resumes after each replacement so a replacement
 * that contains the search string does not loop.
 *
 * @param out StringToManage    string in which apply the search and replacement
 * @param     StringToSearch    string to search and replace
 * @param     StringReplacement substitution string
 */
void StringReplaceAll(std::string& StringToManage,
		      const std::string& StringToSearch,
		      const std::string& StringReplacement)
{
	if (StringToSearch.empty())
		return;

	string::size_type pos = 0;
	while ((pos = StringToManage.find(StringToSearch, pos)) != string::npos)
	{
		StringToManage.replace(pos, StringToSearch.length(), StringReplacement);
		pos += StringReplacement.length();
	}
}

/**
 * Remove white space at the left side of a string
 */
std::string StringLTrim(const std::string& str)
{
	string output;
	size_t pos = str.find_first_not_of(WHITESPACE);

	if (pos == std::string::npos)
		output = "";
	else
		output = str.substr(pos);

	return (output);
}

/**
 * Remove white space at the right side of a string
 */
std::string StringRTrim(const std::string& str)
{
	string output;
	size_t pos = str.find_last_not_of(WHITESPACE);

	if (pos == std::string::npos)
		output =  "";
	else
		output = str.substr(0, pos + 1);

	return (output);
}

/**
 * Remove white space at both ends of a string
 */
std::string StringTrim(const std::string& str)
{
	return StringRTrim(StringLTrim(str));
}

/**
 * Return a lower case copy of a string
 */
std::string StringToLower(const std::string& str)
{
	string output = str;
	for (size_t i = 0; i < output.length(); i++)
	{
		output[i] = tolower((unsigned char)output[i]);
	}
	return output;
}

/**
 * Upper case the first letter of every word, lower case the rest
 *
 * @param str	The string to convert, e.g. "hewlett packard"
 * @return	The converted string, e.g. "Hewlett Packard"
 */
std::string StringTitleCase(const std::string& str)
{
	string output = str;
	bool startOfWord = true;
	for (size_t i = 0; i < output.length(); i++)
	{
		unsigned char c = output[i];
		if (isalpha(c))
		{
			output[i] = startOfWord ? toupper(c) : tolower(c);
			startOfWord = false;
		}
		else
		{
			startOfWord = !isdigit(c);
		}
	}
	return output;
}

/**
 * Check if a string begins with a given prefix
 */
bool StringStartsWith(const std::string& str, const std::string& prefix)
{
	return str.compare(0, prefix.length(), prefix) == 0;
}

/**
 * Check if a string is non-empty and made only of decimal digits
 */
bool StringIsDigits(const std::string& str)
{
	if (str.empty())
		return false;
	for (size_t i = 0; i < str.length(); i++)
	{
		if (!isdigit((unsigned char)str[i]))
			return false;
	}
	return true;
}

/**
 * Split a string on a separator character. Each element is
 * trimmed and empty elements are dropped.
 *
 * @param str		The string to split, e.g. "/dev/sda, /dev/sdb"
 * @param separator	The separator character
 * @return		The non-empty elements
 */
std::vector<std::string> StringSplit(const std::string& str, char separator)
{
	vector<string> elements;
	string::size_type start = 0;

	while (start <= str.length())
	{
		string::size_type end = str.find(separator, start);
		if (end == string::npos)
			end = str.length();
		string element = StringTrim(str.substr(start, end - start));
		if (!element.empty())
			elements.push_back(element);
		start = end + 1;
	}
	return elements;
}
