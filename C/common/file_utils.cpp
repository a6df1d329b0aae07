/*
 * Disk health utilities functions for handling files and directories
 *
 * Copyright (c) 2024 Dianomic Systems
 *
 * Released under the Apache 2.0 Licence
 *
 * Author: Ray Verhoeff
 */

#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <fcntl.h>
#include <ftw.h>
#include <glob.h>
#include <dirent.h>
#include <limits.h>
#include <sys/stat.h>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include "file_utils.h"
#include "string_utils.h"

using namespace std;

/**
 * Callback for Linux file walk routine 'nftw'
 *
 * @param filePath	File full path
 * @param sb		struct stat to hold file information
 * @param typeflag	File type flag: FTW_F = file, FTW_D = directory
 * @param ftwbuf	struct FTW to hold name offset and file depth
 * @return			Zero if successful
 */
static int fileDeleteCallback(const char *filePath, const struct stat *sb, int typeflag, struct FTW *ftwbuf)
{
    return remove(filePath);
}

/**
 * Create a single directory.
 * This routine cannot create a directory tree from a full path.
 * This routine throws a std::runtime_error exception if the directory cannot be created.
 *
 * @param directoryName		Full path of the directory to create
 */
void createDirectory(const std::string &directoryName)
{
	const char *path = directoryName.c_str();
	struct stat sb;
	if (stat(path, &sb) != 0)
	{
		int retcode;
		if ((retcode = mkdir(path, S_IRWXU | S_IRWXG)) != 0)
		{
			std::string exceptionMessage = "Unable to create directory " + directoryName + ": error: " + std::to_string(retcode);
			throw std::runtime_error(exceptionMessage.c_str());
		}
	}
	else if (!S_ISDIR(sb.st_mode))
	{
		throw std::runtime_error("Path exists but is not a directory: " + directoryName);
	}
}

/**
 * Remove a directory with all subdirectories and files
 *
 * @param path		Full path of the directory
 * @return			Zero if successful
 */
int removeDirectory(const char *path)
{
    return nftw(path, fileDeleteCallback, 64, FTW_DEPTH | FTW_PHYS);
}

/**
 * Check if a path exists, following symbolic links
 */
bool pathExists(const std::string& path)
{
	struct stat sb;
	return stat(path.c_str(), &sb) == 0;
}

/**
 * Check if a path is a directory, following symbolic links
 */
bool isDirectory(const std::string& path)
{
	struct stat sb;
	if (stat(path.c_str(), &sb) != 0)
		return false;
	return S_ISDIR(sb.st_mode);
}

/**
 * Read the whole content of a file
 *
 * @param path		Full path of the file
 * @param contents	Set to the content of the file
 * @return		True if the file could be read
 */
bool readFileContents(const std::string& path, std::string& contents)
{
	ifstream in(path.c_str(), ios::in | ios::binary);
	if (!in)
		return false;
	ostringstream buffer;
	buffer << in.rdbuf();
	if (in.bad())
		return false;
	contents = buffer.str();
	return true;
}

/**
 * Read the first line of a file with surrounding white space
 * removed. Used for the single value files found in sysfs and
 * in the storage unit directories.
 *
 * @param path	Full path of the file
 * @return	The trimmed first line, empty if the file is unreadable
 */
std::string readFirstLine(const std::string& path)
{
	ifstream in(path.c_str());
	string line;
	if (!in || !getline(in, line))
		return "";
	return StringTrim(line);
}

/**
 * Resolve all symbolic links in a path. If the path cannot be
 * resolved the original path is returned unchanged.
 */
std::string canonicalPath(const std::string& path)
{
	char resolved[PATH_MAX];
	if (realpath(path.c_str(), resolved) == NULL)
		return path;
	return string(resolved);
}

/**
 * Read one level of a symbolic link. A relative link target is
 * returned relative to the directory holding the link.
 *
 * @param path		The symbolic link
 * @param target	Set to the absolute target of the link
 * @return		True if path is a readable symbolic link
 */
bool readSymlink(const std::string& path, std::string& target)
{
	char buf[PATH_MAX];
	ssize_t len = readlink(path.c_str(), buf, sizeof(buf) - 1);
	if (len < 0)
		return false;
	buf[len] = '\0';
	target = buf;
	if (!target.empty() && target[0] != '/')
	{
		target = pathDirname(path) + "/" + target;
	}
	return true;
}

/**
 * Return the sorted entry names of a directory, excluding "." and ".."
 *
 * @param path			The directory to list
 * @param skipDirectories	Leave out entries that are real directories
 */
std::vector<std::string> listDirectory(const std::string& path, bool skipDirectories)
{
	vector<string> entries;
	DIR *dir = opendir(path.c_str());
	if (!dir)
		return entries;

	struct dirent *entry;
	while ((entry = readdir(dir)) != NULL)
	{
		string name = entry->d_name;
		if (name == "." || name == "..")
			continue;
		if (skipDirectories)
		{
			struct stat sb;
			string full = path + "/" + name;
			if (lstat(full.c_str(), &sb) == 0 && S_ISDIR(sb.st_mode))
				continue;
		}
		entries.push_back(name);
	}
	closedir(dir);
	sort(entries.begin(), entries.end());
	return entries;
}

/**
 * Expand a shell wildcard pattern
 *
 * @param pattern	The pattern, e.g. /dev/nvme1n*
 * @return		The sorted matching paths
 */
std::vector<std::string> globPaths(const std::string& pattern)
{
	vector<string> matches;
	glob_t globbuf;

	int rc = glob(pattern.c_str(), 0, NULL, &globbuf);
	if (rc == 0)
	{
		for (size_t i = 0; i < globbuf.gl_pathc; i++)
		{
			matches.push_back(globbuf.gl_pathv[i]);
		}
	}
	globfree(&globbuf);
	return matches;
}

/**
 * Search the PATH environment variable for an executable
 *
 * @param name	The program name
 * @return	The full path of the program or an empty string
 */
std::string findExecutable(const std::string& name)
{
	if (name.find('/') != string::npos)
	{
		return access(name.c_str(), X_OK) == 0 ? name : "";
	}

	const char *envPath = getenv("PATH");
	string searchPath = envPath ? envPath : "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";
	vector<string> dirs = StringSplit(searchPath, ':');
	for (size_t i = 0; i < dirs.size(); i++)
	{
		string candidate = dirs[i] + "/" + name;
		if (access(candidate.c_str(), X_OK) == 0 && !isDirectory(candidate))
			return candidate;
	}
	return "";
}

/**
 * Return the last component of a path
 */
std::string pathBasename(const std::string& path)
{
	string::size_type pos = path.find_last_of('/');
	if (pos == string::npos)
		return path;
	return path.substr(pos + 1);
}

/**
 * Return a path with its last component removed
 */
std::string pathDirname(const std::string& path)
{
	string::size_type pos = path.find_last_of('/');
	if (pos == string::npos)
		return ".";
	if (pos == 0)
		return "/";
	return path.substr(0, pos);
}
