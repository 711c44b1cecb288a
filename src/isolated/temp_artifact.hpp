/*
 * temp_artifact.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file temp_artifact.hpp
 * @brief Scoped temporary source artifact for one isolated run
 * @date 2024
 * @version 1.0.0
 */

#ifndef SANDRUN_ISOLATED_TEMP_ARTIFACT_HPP
#define SANDRUN_ISOLATED_TEMP_ARTIFACT_HPP

#include "types.hpp"

#include <filesystem>
#include <string_view>

namespace sandrun::isolated {

/**
 * @brief Uniquely named private directory holding the source file
 *
 * The directory doubles as the child's working directory. It is removed
 * with everything inside it when the owner goes out of scope.
 */
class TemporaryArtifact {
public:
    static constexpr std::string_view DEFAULT_FILE_NAME = "snippet.py";

    /**
     * @brief Creates the directory and writes the source into it
     * @param sourceText Content of the source file
     * @param fileName Name of the source file inside the directory
     * @return Artifact, or ArtifactCreationFailed
     */
    [[nodiscard]] static Result<TemporaryArtifact> create(
        std::string_view sourceText,
        std::string_view fileName = DEFAULT_FILE_NAME);

    ~TemporaryArtifact();

    TemporaryArtifact(const TemporaryArtifact&) = delete;
    TemporaryArtifact& operator=(const TemporaryArtifact&) = delete;

    TemporaryArtifact(TemporaryArtifact&& other) noexcept;
    TemporaryArtifact& operator=(TemporaryArtifact&& other) noexcept;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept {
        return directory_;
    }

    [[nodiscard]] const std::filesystem::path& sourcePath() const noexcept {
        return sourcePath_;
    }

    /**
     * @brief Removes the artifact now instead of at destruction
     * @return true if nothing remains on disk
     */
    bool remove() noexcept;

private:
    TemporaryArtifact(std::filesystem::path directory,
                      std::filesystem::path sourcePath);

    std::filesystem::path directory_;
    std::filesystem::path sourcePath_;
};

}  // namespace sandrun::isolated

#endif  // SANDRUN_ISOLATED_TEMP_ARTIFACT_HPP
