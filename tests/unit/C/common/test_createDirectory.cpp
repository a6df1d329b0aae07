/*
 * unit tests - directory and path helpers
 *
 * Copyright (c) 2025 Dianomic Systems, Inc.
 *
 * Released under the Apache 2.0 Licence
 *
 * Author: Devki Nandan Ghildiyal
 */

#include <gtest/gtest.h>
#include <file_utils.h>
#include <exception>
#include <fstream>
#include <unistd.h>
#include <sys/stat.h>

using namespace std;

TEST(TEST_DIRECTORY, PATH_NOT_DIRECTORY)
{
    std::string fileName = "/tmp/testCreateDirFile";
    ofstream(fileName) << "x";
    try {
        createDirectory(fileName);
        FAIL() << "Expected std::runtime_error";
    }
    catch(std::runtime_error const & err) {
        EXPECT_EQ(err.what(),std::string("Path exists but is not a directory: /tmp/testCreateDirFile"));
    }
    unlink(fileName.c_str());
}

TEST(TEST_DIRECTORY, DIRECTORY_EXISTS_OR_CREATED)
{
    std::string directoryName = "/tmp/testCreateDirFunc";

    createDirectory(directoryName);
    struct stat sb;
    if (stat(directoryName.c_str(), &sb) != 0)
    {
        FAIL() << "Directory " << directoryName << " could not be created";
    }
    // A second call on an existing directory is not an error
    createDirectory(directoryName);
    EXPECT_TRUE(isDirectory(directoryName));
    EXPECT_EQ(removeDirectory(directoryName.c_str()), 0);
    EXPECT_FALSE(pathExists(directoryName));
}

TEST(TEST_PATHS, BASENAME_DIRNAME)
{
    EXPECT_EQ(pathBasename("/dev/sda"), "sda");
    EXPECT_EQ(pathBasename("sda"), "sda");
    EXPECT_EQ(pathDirname("/dev/mapper/vg-lv"), "/dev/mapper");
}

TEST(TEST_PATHS, READ_FILE_AND_SYMLINK)
{
    std::string dir = "/tmp/testFileUtilsRead";
    removeDirectory(dir.c_str());
    createDirectory(dir);
    ofstream(dir + "/whoami") << "12\n";
    ASSERT_EQ(symlink((dir + "/whoami").c_str(), (dir + "/link").c_str()), 0);

    std::string contents;
    EXPECT_TRUE(readFileContents(dir + "/whoami", contents));
    EXPECT_EQ(contents, "12\n");
    EXPECT_EQ(readFirstLine(dir + "/whoami"), "12");

    std::string target;
    EXPECT_TRUE(readSymlink(dir + "/link", target));
    EXPECT_EQ(target, dir + "/whoami");
    EXPECT_EQ(canonicalPath(dir + "/link"), canonicalPath(dir + "/whoami"));
    EXPECT_FALSE(readFileContents(dir + "/missing", contents));

    std::vector<std::string> entries = listDirectory(dir);
    ASSERT_EQ(entries.size(), 2U);
    EXPECT_EQ(entries[0], "link");
    EXPECT_EQ(entries[1], "whoami");

    removeDirectory(dir.c_str());
}

TEST(TEST_PATHS, FIND_EXECUTABLE)
{
    EXPECT_FALSE(findExecutable("sh").empty());
    EXPECT_TRUE(findExecutable("no-such-tool-anywhere").empty());
}
