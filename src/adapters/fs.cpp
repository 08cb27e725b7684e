#include "fs.hpp"

#include <cerrno>
#include <cstring>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace rescuecp::adapters::fs {

namespace {

auto open_flags(OpenMode mode) -> int {
    switch (mode) {
        case OpenMode::ReadWrite:
            return O_RDWR | O_CLOEXEC;
        case OpenMode::Create:
            return O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC;
        case OpenMode::Read:
        default:
            return O_RDONLY | O_CLOEXEC;
    }
}

} // namespace

// =============== PosixFile ===============
auto PosixFile::open(const std::filesystem::path& path, OpenMode mode)
    -> infra::Result<std::unique_ptr<PosixFile>>
{
    const int fd = ::open(path.c_str(), open_flags(mode), 0644);
    if (fd == -1) {
        return std::unexpected(infra::make_errno_error(errno,
            fmt::format("Cannot open {}", path.string())));
    }
    return std::unique_ptr<PosixFile>(new PosixFile(path, fd));
}

PosixFile::~PosixFile() {
    if (fd_ != -1 && ::close(fd_) != 0) {
        spdlog::warn("Closing {} failed: {}", path_.string(), std::strerror(errno));
    }
}

auto PosixFile::length() const -> infra::Result<std::uint64_t> {
    // SEEK_END работает и для блочных устройств, где st_size == 0
    const off_t end = ::lseek(fd_, 0, SEEK_END);
    if (end < 0) {
        return std::unexpected(infra::make_errno_error(errno,
            fmt::format("Cannot determine length of {}", path_.string())));
    }
    return static_cast<std::uint64_t>(end);
}

// Returns the number of bytes really read.
// A count below buffer.size() without an error means EOF was reached.
auto PosixFile::read_at(std::uint64_t offset, std::span<char> buffer)
    -> infra::Result<std::size_t>
{
    if (::lseek(fd_, static_cast<off_t>(offset), SEEK_SET) < 0) {
        return std::unexpected(infra::make_errno_error(errno,
            fmt::format("Seek to {} in {} failed", offset, path_.string())));
    }

    std::size_t done = 0;
    while (done < buffer.size()) {
        const ssize_t n = ::read(fd_, buffer.data() + done, buffer.size() - done);
        if (n > 0) {
            done += static_cast<std::size_t>(n);
        } else if (n == 0) {
            break; // EOF
        } else if (errno != EINTR && errno != EAGAIN) {
            return std::unexpected(infra::make_errno_error(errno,
                fmt::format("Read of {} bytes at {} in {} failed",
                            buffer.size(), offset, path_.string())));
        }
    }
    return done;
}

auto PosixFile::write_at(std::uint64_t offset, std::span<const char> data)
    -> infra::VoidResult
{
    if (::lseek(fd_, static_cast<off_t>(offset), SEEK_SET) < 0) {
        return std::unexpected(infra::make_errno_error(errno,
            fmt::format("Seek to {} in {} failed", offset, path_.string())));
    }

    std::size_t done = 0;
    while (done < data.size()) {
        const ssize_t n = ::write(fd_, data.data() + done, data.size() - done);
        if (n > 0) {
            done += static_cast<std::size_t>(n);
        } else if (n < 0 && errno != EINTR && errno != EAGAIN) {
            // Ошибка записи никогда не считается сбоем носителя источника
            auto err = infra::make_errno_error(errno,
                fmt::format("Write of {} bytes at {} in {} failed",
                            data.size(), offset, path_.string()));
            err.code = infra::ErrorCode::StreamFailure;
            return std::unexpected(std::move(err));
        }
    }
    return {};
}

auto PosixFile::sync() -> infra::VoidResult {
    if (::fsync(fd_) != 0 && errno != EINVAL) {
        auto err = infra::make_errno_error(errno, fmt::format("fsync of {} failed", path_.string()));
        err.code = infra::ErrorCode::StreamFailure;
        return std::unexpected(std::move(err));
    }
    return {};
}

auto open_stream(const std::filesystem::path& path, OpenMode mode)
    -> infra::Result<StreamPtr>
{
    auto file = PosixFile::open(path, mode);
    if (!file) {
        return std::unexpected(std::move(file.error()));
    }
    return StreamPtr(std::move(*file));
}

// =============== Атрибуты ===============
auto file_length(const std::filesystem::path& path) -> infra::Result<std::uint64_t> {
    auto file = PosixFile::open(path, OpenMode::Read);
    if (!file) {
        return std::unexpected(std::move(file.error()));
    }
    return (*file)->length();
}

auto is_read_only(const std::filesystem::path& path) -> infra::Result<bool> {
    std::error_code ec;
    const auto mode = std::filesystem::status(path, ec).permissions();
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::FileNotFound,
            fmt::format("Cannot stat {}: {}", path.string(), ec.message())));
    }
    using std::filesystem::perms;
    return (mode & (perms::owner_write | perms::group_write | perms::others_write)) == perms::none;
}

auto set_read_only(const std::filesystem::path& path, bool read_only) -> infra::VoidResult {
    using std::filesystem::perms;
    using std::filesystem::perm_options;

    std::error_code ec;
    if (read_only) {
        std::filesystem::permissions(path,
            perms::owner_write | perms::group_write | perms::others_write,
            perm_options::remove, ec);
    } else {
        std::filesystem::permissions(path, perms::owner_write, perm_options::add, ec);
    }
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
            fmt::format("Cannot change write permission of {}: {}", path.string(), ec.message())));
    }
    return {};
}

auto copy_timestamps(const std::filesystem::path& src,
                     const std::filesystem::path& dst) -> infra::VoidResult
{
    struct stat sb;
    if (::stat(src.c_str(), &sb) != 0) {
        return std::unexpected(infra::make_errno_error(errno,
            fmt::format("Cannot stat {}", src.string())));
    }

    const timespec times[2] = {sb.st_atim, sb.st_mtim};
    if (::utimensat(AT_FDCWD, dst.c_str(), times, 0) != 0) {
        return std::unexpected(infra::make_errno_error(errno,
            fmt::format("Cannot set timestamps on {}", dst.string())));
    }
    return {};
}

} // namespace rescuecp::adapters::fs
