/*
 * temp_artifact.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "temp_artifact.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#ifdef _WIN32
#include <random>
#else
#include <cerrno>
#include <cstdlib>
#include <cstring>
#endif

namespace sandrun::isolated {

namespace fs = std::filesystem;

namespace {

Result<fs::path> makeUniqueDirectory() {
    std::error_code ec;
    auto base = fs::temp_directory_path(ec);
    if (ec) {
        spdlog::error("No temporary directory available: {}", ec.message());
        return std::unexpected(RunnerError::ArtifactCreationFailed);
    }

#ifdef _WIN32
    std::random_device device;
    std::mt19937_64 engine(device());
    for (int attempt = 0; attempt < 16; ++attempt) {
        auto candidate = base / ("sandrun-" + std::to_string(engine()));
        if (fs::create_directory(candidate, ec)) {
            return candidate;
        }
    }
    spdlog::error("Failed to create a unique directory under {}", base.string());
    return std::unexpected(RunnerError::ArtifactCreationFailed);
#else
    auto pattern = (base / "sandrun-XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (::mkdtemp(buffer.data()) == nullptr) {
        spdlog::error("mkdtemp failed under {}: {}", base.string(),
                      std::strerror(errno));
        return std::unexpected(RunnerError::ArtifactCreationFailed);
    }
    return fs::path(buffer.data());
#endif
}

}  // namespace

TemporaryArtifact::TemporaryArtifact(fs::path directory, fs::path sourcePath)
    : directory_(std::move(directory)), sourcePath_(std::move(sourcePath)) {}

Result<TemporaryArtifact> TemporaryArtifact::create(std::string_view sourceText,
                                                    std::string_view fileName) {
    auto directory = makeUniqueDirectory();
    if (!directory) {
        return std::unexpected(directory.error());
    }

    TemporaryArtifact artifact(*directory, *directory / fs::path(fileName));

    std::ofstream file(artifact.sourcePath_, std::ios::binary | std::ios::trunc);
    if (!file) {
        spdlog::error("Cannot open {} for writing", artifact.sourcePath_.string());
        return std::unexpected(RunnerError::ArtifactCreationFailed);
    }
    file.write(sourceText.data(), static_cast<std::streamsize>(sourceText.size()));
    file.close();
    if (!file) {
        spdlog::error("Failed to write source to {}", artifact.sourcePath_.string());
        return std::unexpected(RunnerError::ArtifactCreationFailed);
    }

    spdlog::debug("Created temporary artifact {}", artifact.sourcePath_.string());
    return artifact;
}

TemporaryArtifact::~TemporaryArtifact() {
    remove();
}

TemporaryArtifact::TemporaryArtifact(TemporaryArtifact&& other) noexcept
    : directory_(std::move(other.directory_)),
      sourcePath_(std::move(other.sourcePath_)) {
    other.directory_.clear();
    other.sourcePath_.clear();
}

TemporaryArtifact& TemporaryArtifact::operator=(TemporaryArtifact&& other) noexcept {
    if (this != &other) {
        remove();
        directory_ = std::move(other.directory_);
        sourcePath_ = std::move(other.sourcePath_);
        other.directory_.clear();
        other.sourcePath_.clear();
    }
    return *this;
}

bool TemporaryArtifact::remove() noexcept {
    if (directory_.empty()) {
        return true;
    }

    std::error_code ec;
    fs::remove_all(directory_, ec);
    if (ec) {
        spdlog::warn("Failed to remove temporary artifact {}: {}",
                     directory_.string(), ec.message());
        return false;
    }

    spdlog::debug("Removed temporary artifact {}", directory_.string());
    directory_.clear();
    sourcePath_.clear();
    return true;
}

}  // namespace sandrun::isolated
