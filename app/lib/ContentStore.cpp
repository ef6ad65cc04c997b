#include "ContentStore.hpp"

#include "Errors.hpp"
#include "Library.hpp"
#include "Logger.hpp"
#include "Sha256Hasher.hpp"
#include "Utils.hpp"

#include <fmt/format.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kChunkSize = 1024 * 1024;

class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    int close()
    {
        const int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

private:
    int fd_;
};

// Removes the scratch file on scope exit unless released.
class ScratchGuard {
public:
    explicit ScratchGuard(fs::path path) : path_(std::move(path)) {}
    ~ScratchGuard() {
        if (!released_) {
            std::error_code ec;
            fs::remove(path_, ec);
        }
    }

    ScratchGuard(const ScratchGuard&) = delete;
    ScratchGuard& operator=(const ScratchGuard&) = delete;

    void release() { released_ = true; }

private:
    fs::path path_;
    bool released_ = false;
};

std::string errno_message()
{
    return std::strerror(errno);
}

void write_all(int fd, const char* data, std::size_t size, const fs::path& target)
{
    std::size_t offset = 0;
    while (offset < size) {
        const ssize_t written = ::write(fd, data + offset, size - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw StoreError(fmt::format("Failed to write scratch file '{}': {}", target.string(), errno_message()));
        }
        offset += static_cast<std::size_t>(written);
    }
}

} // namespace

ContentStore::ContentStore(const Library& library)
    : library(library) {}

bool ContentStore::contains(const std::string& digest) const
{
    std::error_code ec;
    return fs::exists(fs::symlink_status(library.vault_path_for_digest(digest), ec));
}

ContentStore::ScratchCopy ContentStore::copy_to_scratch_and_hash(const fs::path& source) const
{
    FileDescriptor in(::open(source.c_str(), O_RDONLY | O_CLOEXEC));
    if (!in.valid()) {
        throw StoreError(fmt::format("Cannot open source '{}': {}", source.string(), errno_message()));
    }

    const fs::path scratch_dir = library.tmp_dir();
    std::error_code ec;
    fs::create_directories(scratch_dir, ec);
    if (ec) {
        throw StoreError(fmt::format("Cannot create scratch directory '{}': {}", scratch_dir.string(), ec.message()));
    }

    ScratchCopy copy;
    copy.path = scratch_dir / (Utils::random_hex(32) + ".tmp");
    FileDescriptor out(::open(copy.path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644));
    if (!out.valid()) {
        throw StoreError(fmt::format("Cannot create scratch file '{}': {}", copy.path.string(), errno_message()));
    }
    ScratchGuard guard(copy.path);

    Sha256Hasher hasher;
    std::vector<char> buffer(kChunkSize);
    while (true) {
        const ssize_t n = ::read(in.get(), buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw StoreError(fmt::format("Failed to read source '{}': {}", source.string(), errno_message()));
        }
        if (n == 0) {
            break;
        }
        hasher.update(buffer.data(), static_cast<std::size_t>(n));
        write_all(out.get(), buffer.data(), static_cast<std::size_t>(n), copy.path);
        copy.bytes_written += n;
    }

    if (::fsync(out.get()) != 0) {
        throw StoreError(fmt::format("Failed to sync scratch file '{}': {}", copy.path.string(), errno_message()));
    }
    if (out.close() != 0) {
        throw StoreError(fmt::format("Failed to close scratch file '{}': {}", copy.path.string(), errno_message()));
    }

    copy.digest = hasher.finalize();
    guard.release();
    return copy;
}

void ContentStore::copy_timestamps(const fs::path& source, const fs::path& destination)
{
    struct stat st {};
    if (::stat(source.c_str(), &st) != 0) {
        return;
    }
    const struct timespec times[2] = {st.st_atim, st.st_mtim};
    if (::utimensat(AT_FDCWD, destination.c_str(), times, 0) != 0 ||
        ::chmod(destination.c_str(), st.st_mode & 07777) != 0) {
        if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
            logger->debug("Could not copy file attributes onto {}: {}", destination.string(), errno_message());
        }
    }
}

bool ContentStore::publish(const fs::path& scratch, const fs::path& destination)
{
    if (::link(scratch.c_str(), destination.c_str()) != 0) {
        if (errno == EEXIST) {
            return false;
        }
        throw StoreError(fmt::format("Cannot move '{}' into the vault at '{}': {}",
                                     scratch.string(), destination.string(), errno_message()));
    }
    std::error_code ec;
    fs::remove(scratch, ec);
    return true;
}

IngestResult ContentStore::ingest(const fs::path& source) const
{
    ScratchCopy copy = copy_to_scratch_and_hash(source);
    ScratchGuard guard(copy.path);

    IngestResult result;
    result.digest = copy.digest;
    result.bytes_written = copy.bytes_written;

    const fs::path destination = library.vault_path_for_digest(copy.digest);
    result.store_relative_path = library.relative_to_root(destination);

    std::error_code ec;
    if (fs::exists(fs::symlink_status(destination, ec))) {
        // Content already stored; the guard discards the scratch copy.
        result.was_new_copy = false;
        return result;
    }

    fs::create_directories(destination.parent_path(), ec);
    if (ec) {
        throw StoreError(fmt::format("Cannot create vault directory '{}': {}",
                                     destination.parent_path().string(), ec.message()));
    }

    if (!publish(copy.path, destination)) {
        result.was_new_copy = false;
        return result;
    }

    copy_timestamps(source, destination);
    result.was_new_copy = true;

    if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
        logger->debug("Stored {} ({} bytes) as {}", source.string(), result.bytes_written, result.store_relative_path);
    }
    return result;
}
