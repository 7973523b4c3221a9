#pragma once

/// @file artifact_file.h
/// @brief Collision-free, all-or-nothing publishing of report artifacts

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>

namespace driftscope::drift {

/// @brief Local wall-clock time at second resolution, "YYYYmmdd_HHMMSS"
std::string FormatArtifactTimestamp(std::chrono::system_clock::time_point time);

/// @brief Write content to <directory>/<prefix><timestamp>[_N]<extension>
///
/// The content is written and closed in a temporary file in the same
/// directory, then hard-linked to the first free name: no suffix, then _1,
/// _2, ... Linking fails if the name is taken, so concurrent writers that
/// share a timestamp never replace each other's files and readers never
/// observe a partial artifact. The temporary file is removed on every path.
///
/// Where the filesystem refuses hard links the file is published with
/// RenameOntoFreeName instead. Names stay unique there too, but a reader can
/// briefly see an empty file under the published name.
///
/// @return Path of the published file, or kWriteFailure
absl::StatusOr<std::filesystem::path> PublishArtifact(
    const std::filesystem::path& directory,
    std::string_view prefix,
    std::chrono::system_clock::time_point created_at,
    std::string_view extension,
    std::string_view content);

/// @brief Move source onto the first free <directory>/<stem>[_N]<extension>
///
/// Each candidate name is claimed with an exclusive create (O_EXCL) and
/// source is then renamed over that empty reservation, so an existing file is
/// never replaced. source must be in the same filesystem as directory.
///
/// @return Path of the published file, or kWriteFailure
absl::StatusOr<std::filesystem::path> RenameOntoFreeName(
    const std::filesystem::path& source,
    const std::filesystem::path& directory,
    std::string_view stem,
    std::string_view extension);

}  // namespace driftscope::drift
