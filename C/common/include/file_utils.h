/*
 * Disk health utilities functions for handling files and directories
 *
 * Copyright (c) 2024 Dianomic Systems
 *
 * Released under the Apache 2.0 Licence
 *
 * Author: Ray Verhoeff
 */

#pragma once
#include <string>
#include <vector>

void createDirectory(const std::string &directoryName);
int removeDirectory(const char *path);

bool pathExists(const std::string& path);
bool isDirectory(const std::string& path);
bool readFileContents(const std::string& path, std::string& contents);
std::string readFirstLine(const std::string& path);
std::string canonicalPath(const std::string& path);
bool readSymlink(const std::string& path, std::string& target);
std::vector<std::string> listDirectory(const std::string& path, bool skipDirectories = false);
std::vector<std::string> globPaths(const std::string& pattern);
std::string findExecutable(const std::string& name);
std::string pathBasename(const std::string& path);
std::string pathDirname(const std::string& path);
