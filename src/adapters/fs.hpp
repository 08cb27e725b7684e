#pragma once

#include <filesystem>
#include <expected>
#include <functional>
#include <memory>
#include <span>
#include <cstddef>
#include <cstdint>
#include "../infra/error_handler/error.hpp"

namespace rescuecp::adapters::fs {

enum class OpenMode {
    Read,       // источник или частичная копия
    ReadWrite,  // существующая копия, чинится на месте
    Create      // новый файл назначения (O_CREAT | O_TRUNC)
};

/// Random-access byte stream. The engine only ever addresses it by absolute
/// offset, so a failed read never moves a cursor the next attempt depends on.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    [[nodiscard]] virtual auto path() const -> const std::filesystem::path& = 0;
    [[nodiscard]] virtual auto length() const -> infra::Result<std::uint64_t> = 0;

    /// Reads up to `buffer.size()` bytes at `offset`. A short count means EOF.
    /// Media errors come back as ErrorCode::MediaError, everything else as StreamFailure.
    [[nodiscard]] virtual auto read_at(std::uint64_t offset, std::span<char> buffer)
        -> infra::Result<std::size_t> = 0;

    [[nodiscard]] virtual auto write_at(std::uint64_t offset, std::span<const char> data)
        -> infra::VoidResult = 0;

    [[nodiscard]] virtual auto sync() -> infra::VoidResult = 0;
};

/// File descriptor backed stream. The descriptor is closed in the destructor.
class PosixFile final : public ByteStream {
public:
    [[nodiscard]] static auto open(const std::filesystem::path& path, OpenMode mode)
        -> infra::Result<std::unique_ptr<PosixFile>>;

    ~PosixFile() override;

    PosixFile(const PosixFile&) = delete;
    PosixFile& operator=(const PosixFile&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& override { return path_; }
    [[nodiscard]] auto length() const -> infra::Result<std::uint64_t> override;
    [[nodiscard]] auto read_at(std::uint64_t offset, std::span<char> buffer)
        -> infra::Result<std::size_t> override;
    [[nodiscard]] auto write_at(std::uint64_t offset, std::span<const char> data)
        -> infra::VoidResult override;
    [[nodiscard]] auto sync() -> infra::VoidResult override;

private:
    PosixFile(std::filesystem::path path, int fd) : path_(std::move(path)), fd_(fd) {}

    std::filesystem::path path_;
    int fd_ = -1;
};

using StreamPtr = std::unique_ptr<ByteStream>;

/// Factory the copy engine opens its streams through. Tests swap in
/// decorators here to inject read faults.
using StreamOpener = std::function<infra::Result<StreamPtr>(const std::filesystem::path&, OpenMode)>;

[[nodiscard]] auto open_stream(const std::filesystem::path& path, OpenMode mode)
    -> infra::Result<StreamPtr>;

// Вспомогательные функции для атрибутов файла
[[nodiscard]] auto file_length(const std::filesystem::path& path) -> infra::Result<std::uint64_t>;

[[nodiscard]] auto is_read_only(const std::filesystem::path& path) -> infra::Result<bool>;

[[nodiscard]] auto set_read_only(const std::filesystem::path& path, bool read_only)
    -> infra::VoidResult;

/// Access and modification times of `src` are applied to `dst` with nanosecond precision.
[[nodiscard]] auto copy_timestamps(const std::filesystem::path& src,
                                   const std::filesystem::path& dst) -> infra::VoidResult;

} // namespace rescuecp::adapters::fs
