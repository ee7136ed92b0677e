/*
 * bunkget/src/downloader/disk_writer.cpp
 *
 * DiskWriter implementation:
 * - Staging file "<dest>.temp" beside the destination (same directory, same filesystem)
 * - Appends chunk by chunk; durability is deferred to sync()
 * - Promotion via link(2) + unlink(2): atomic and fails with EEXIST instead of replacing
 * - Filesystems without hard links fall back to an existence check + rename(2)
 *
 * POSIX only.
 */

#include <bunkget/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace bunkget::downloader {

namespace fs = std::filesystem;

// ---------- Helpers (platform-specific sync) ----------

static Expected<void> fsync_file(const fs::path& p) {
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open() failed for fsync: " + p.string()};
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync() failed for: " + p.string()};
    }
    ::close(fd);
    return Expected<void>{};
}

static Expected<void> fsync_dir(const fs::path& dir) {
    const auto target = dir.empty() ? fs::path(".") : dir;
    int fd = ::open(target.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open(O_DIRECTORY) failed for: " + target.string()};
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync(dir) failed for: " + target.string()};
    }
    ::close(fd);
    return Expected<void>{};
}

static std::string errno_text(int err) {
    return std::error_code(err, std::generic_category()).message();
}

// ---------- DiskWriter implementation ----------

class DiskWriter final : public IDiskWriter {
public:
    Expected<fs::path> createStagingFile(const fs::path& destination) override {
        auto stagingFile = stagingPathFor(destination);

        std::error_code ec;
        if (destination.has_parent_path()) {
            fs::create_directories(destination.parent_path(), ec);
            if (ec) {
                return Error{ErrorCode::IoError, "Failed to create directory: " +
                                                     destination.parent_path().string()};
            }
        }

        std::ofstream os(stagingFile, std::ios::binary | std::ios::out | std::ios::trunc);
        if (!os.good()) {
            return Error{ErrorCode::IoError,
                         "Failed to create staging file: " + stagingFile.string()};
        }
        return stagingFile;
    }

    Expected<void> append(const fs::path& stagingFile, std::span<const std::byte> data) override {
        if (data.empty())
            return Expected<void>{};

        std::ofstream os(stagingFile, std::ios::binary | std::ios::out | std::ios::app);
        if (!os.good()) {
            return Error{ErrorCode::IoError,
                         "Failed to open staging for write: " + stagingFile.string()};
        }
        os.write(reinterpret_cast<const char*>(data.data()),
                 static_cast<std::streamsize>(data.size()));
        if (!os.good()) {
            return Error{ErrorCode::IoError, "write failed on: " + stagingFile.string()};
        }
        return Expected<void>{};
    }

    Expected<void> sync(const fs::path& stagingFile) override {
        auto r = fsync_file(stagingFile);
        if (!r.ok())
            return r;
        return fsync_dir(stagingFile.parent_path());
    }

    Expected<void> promote(const fs::path& stagingFile, const fs::path& destination) override {
        if (::link(stagingFile.c_str(), destination.c_str()) == 0) {
            if (::unlink(stagingFile.c_str()) != 0) {
                spdlog::warn("Promoted {} but could not remove {}: {}", destination.string(),
                             stagingFile.string(), errno_text(errno));
            }
            return syncParent(destination);
        }

        const int err = errno;
        if (err == EEXIST) {
            return Error{ErrorCode::AlreadyExists,
                         "Destination already exists, not overwriting: " + destination.string()};
        }
        if (err != EPERM && err != ENOTSUP && err != EOPNOTSUPP && err != EMLINK) {
            return Error{ErrorCode::IoError, "link() failed (" + errno_text(err) + ") from " +
                                                 stagingFile.string() + " to " +
                                                 destination.string()};
        }

        // No hard links on this filesystem
        spdlog::debug("link() unsupported for {}, falling back to rename", destination.string());
        std::error_code ec;
        if (fs::exists(destination, ec)) {
            return Error{ErrorCode::AlreadyExists,
                         "Destination already exists, not overwriting: " + destination.string()};
        }
        fs::rename(stagingFile, destination, ec);
        if (ec) {
            return Error{ErrorCode::IoError, "rename() failed (" + ec.message() + ") from " +
                                                 stagingFile.string() + " to " +
                                                 destination.string()};
        }
        return syncParent(destination);
    }

private:
    static Expected<void> syncParent(const fs::path& destination) {
        auto rd = fsync_dir(destination.parent_path());
        if (!rd.ok()) {
            spdlog::debug("fsync on {} failed (continuing): {}",
                          destination.parent_path().string(), rd.error().message);
        }
        return Expected<void>{};
    }
};

std::unique_ptr<IDiskWriter> makeDiskWriter() {
    return std::make_unique<DiskWriter>();
}

} // namespace bunkget::downloader
