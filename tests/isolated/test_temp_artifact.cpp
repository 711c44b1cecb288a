/*
 * test_temp_artifact.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include "isolated/temp_artifact.hpp"

#include <fstream>
#include <sstream>

using namespace sandrun::isolated;
namespace fs = std::filesystem;

namespace {

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

}  // namespace

TEST(TemporaryArtifactTest, CreateWritesSourceVerbatim) {
    std::string source = "print('hi')\n# caf\xC3\xA9\n";
    auto artifact = TemporaryArtifact::create(source);
    ASSERT_TRUE(artifact.has_value());

    EXPECT_TRUE(fs::is_directory(artifact->directory()));
    EXPECT_TRUE(fs::is_regular_file(artifact->sourcePath()));
    EXPECT_EQ(artifact->sourcePath().filename().string(), "snippet.py");
    EXPECT_EQ(artifact->sourcePath().parent_path(), artifact->directory());
    EXPECT_EQ(readFile(artifact->sourcePath()), source);
}

TEST(TemporaryArtifactTest, CustomFileName) {
    auto artifact = TemporaryArtifact::create("", "main.py");
    ASSERT_TRUE(artifact.has_value());
    EXPECT_EQ(artifact->sourcePath().filename().string(), "main.py");
    EXPECT_EQ(fs::file_size(artifact->sourcePath()), 0u);
}

TEST(TemporaryArtifactTest, DirectoriesAreUnique) {
    auto first = TemporaryArtifact::create("a = 1\n");
    auto second = TemporaryArtifact::create("a = 1\n");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(first->directory(), second->directory());
}

TEST(TemporaryArtifactTest, RemoveDeletesDirectory) {
    auto artifact = TemporaryArtifact::create("x = 1\n");
    ASSERT_TRUE(artifact.has_value());
    auto directory = artifact->directory();

    EXPECT_TRUE(artifact->remove());
    EXPECT_FALSE(fs::exists(directory));
    EXPECT_TRUE(artifact->directory().empty());
    EXPECT_TRUE(artifact->remove());
}

TEST(TemporaryArtifactTest, DestructorDeletesDirectory) {
    fs::path directory;
    {
        auto artifact = TemporaryArtifact::create("x = 1\n");
        ASSERT_TRUE(artifact.has_value());
        directory = artifact->directory();
        std::ofstream(directory / "extra.txt") << "written by the child";
        ASSERT_TRUE(fs::exists(directory));
    }
    EXPECT_FALSE(fs::exists(directory));
}

TEST(TemporaryArtifactTest, MoveTransfersOwnership) {
    auto artifact = TemporaryArtifact::create("x = 1\n");
    ASSERT_TRUE(artifact.has_value());
    auto directory = artifact->directory();

    TemporaryArtifact moved = std::move(*artifact);
    EXPECT_EQ(moved.directory(), directory);
    EXPECT_TRUE(artifact->directory().empty());
    EXPECT_TRUE(fs::exists(directory));

    EXPECT_TRUE(moved.remove());
    EXPECT_FALSE(fs::exists(directory));
}
