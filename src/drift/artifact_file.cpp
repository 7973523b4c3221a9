#include "drift/artifact_file.h"

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <unistd.h>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace driftscope::drift {

namespace {

constexpr int kMaxNameAttempts = 10000;

std::atomic<uint64_t> g_temp_counter{0};

/// @brief Removes a temporary file when it goes out of scope
class TempFileGuard {
public:
    explicit TempFileGuard(std::filesystem::path path) : path_(std::move(path)) {}
    ~TempFileGuard() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

std::filesystem::path TempPathFor(const std::filesystem::path& directory,
                                  std::string_view prefix) {
    const uint64_t sequence = g_temp_counter.fetch_add(1, std::memory_order_relaxed);
    const size_t thread_hash = std::hash<std::thread::id>{}(std::this_thread::get_id());
    return directory / absl::StrCat(".", prefix, ::getpid(), "_", thread_hash, "_",
                                    sequence, ".tmp");
}

absl::Status WriteContent(const std::filesystem::path& path, std::string_view content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return WriteFailureError(absl::StrCat("Cannot create ", path.string()));
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    out.close();
    if (out.fail()) {
        return WriteFailureError(absl::StrCat("Failed to write ", path.string()));
    }
    return absl::OkStatus();
}

std::filesystem::path CandidateName(const std::filesystem::path& directory,
                                    std::string_view stem,
                                    std::string_view extension,
                                    int attempt) {
    return directory / (attempt == 0 ? absl::StrCat(stem, extension)
                                     : absl::StrCat(stem, "_", attempt, extension));
}

}  // namespace

std::string FormatArtifactTimestamp(std::chrono::system_clock::time_point time) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm local{};
    localtime_r(&seconds, &local);

    char buffer[32];
    const size_t length = std::strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &local);
    return std::string(buffer, length);
}

absl::StatusOr<std::filesystem::path> PublishArtifact(
    const std::filesystem::path& directory,
    std::string_view prefix,
    std::chrono::system_clock::time_point created_at,
    std::string_view extension,
    std::string_view content) {

    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        return WriteFailureError(absl::StrCat("Cannot create output directory ",
                                              directory.string(), ": ", ec.message()));
    }

    TempFileGuard temp(TempPathFor(directory, prefix));
    DRIFTSCOPE_RETURN_IF_ERROR(WriteContent(temp.path(), content));

    const std::string stem = absl::StrCat(prefix, FormatArtifactTimestamp(created_at));
    for (int attempt = 0; attempt < kMaxNameAttempts; ++attempt) {
        const std::filesystem::path target = CandidateName(directory, stem, extension, attempt);

        std::filesystem::create_hard_link(temp.path(), target, ec);
        if (!ec) {
            return target;
        }
        if (ec == std::errc::file_exists) {
            continue;
        }
        if (ec == std::errc::operation_not_permitted || ec == std::errc::not_supported) {
            DRIFTSCOPE_LOG_DEBUG("Hard links unsupported in {}, publishing by rename",
                                 directory.string());
            return RenameOntoFreeName(temp.path(), directory, stem, extension);
        }

        return WriteFailureError(absl::StrCat("Cannot publish ", target.string(), ": ",
                                              ec.message()));
    }

    return WriteFailureError(absl::StrCat("No free artifact name for ", stem, extension,
                                          " after ", kMaxNameAttempts, " attempts"));
}

absl::StatusOr<std::filesystem::path> RenameOntoFreeName(
    const std::filesystem::path& source,
    const std::filesystem::path& directory,
    std::string_view stem,
    std::string_view extension) {

    for (int attempt = 0; attempt < kMaxNameAttempts; ++attempt) {
        const std::filesystem::path target = CandidateName(directory, stem, extension, attempt);

        const int fd = ::open(target.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
        if (fd < 0) {
            if (errno == EEXIST) {
                continue;
            }
            return WriteFailureError(absl::StrCat("Cannot reserve ", target.string(), ": ",
                                                  std::generic_category().message(errno)));
        }
        ::close(fd);

        // The name is ours; replace the empty reservation with the content
        std::error_code ec;
        std::filesystem::rename(source, target, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove(target, ignored);
            return WriteFailureError(absl::StrCat("Cannot publish ", target.string(), ": ",
                                                  ec.message()));
        }
        return target;
    }

    return WriteFailureError(absl::StrCat("No free artifact name for ", stem, extension,
                                          " after ", kMaxNameAttempts, " attempts"));
}

}  // namespace driftscope::drift
