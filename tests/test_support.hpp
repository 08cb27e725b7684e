#pragma once

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "adapters/fs.hpp"
#include "infra/error_handler/error.hpp"

namespace rescuecp::test_support {

/// Fresh directory under the system temp dir, removed with the fixture.
class TempDir {
public:
    TempDir() {
        auto pattern = (std::filesystem::temp_directory_path() / "rescuecp-test-XXXXXX").string();
        std::vector<char> buf(pattern.begin(), pattern.end());
        buf.push_back('\0');
        if (::mkdtemp(buf.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = buf.data();
    }

    ~TempDir() {
        std::error_code ec;
        // Файлы могли остаться "только для чтения" после copy_metadata
        for (const auto& entry : std::filesystem::recursive_directory_iterator(path_, ec)) {
            std::filesystem::permissions(entry.path(), std::filesystem::perms::owner_all,
                                         std::filesystem::perm_options::add, ec);
        }
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }
    [[nodiscard]] auto operator/(const std::string& name) const -> std::filesystem::path {
        return path_ / name;
    }

private:
    std::filesystem::path path_;
};

inline auto pattern_bytes(std::size_t size, unsigned seed = 1) -> std::vector<char> {
    std::vector<char> data(size);
    unsigned state = seed * 2654435761u + 1;
    for (auto& c : data) {
        state = state * 1103515245u + 12345u;
        // Никогда не ноль, чтобы заполнение нулями было видно
        c = static_cast<char>(((state >> 16) % 255) + 1);
    }
    return data;
}

inline void write_file(const std::filesystem::path& path, const std::vector<char>& data) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
}

inline auto read_file(const std::filesystem::path& path) -> std::vector<char> {
    std::ifstream ifs(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

inline auto slice(const std::vector<char>& data, std::size_t from, std::size_t to) -> std::vector<char> {
    return {data.begin() + static_cast<std::ptrdiff_t>(from), data.begin() + static_cast<std::ptrdiff_t>(to)};
}

inline auto all_zero(const std::vector<char>& data) -> bool {
    for (char c : data) {
        if (c != '\0') return false;
    }
    return true;
}

/// In-memory stream for reader-level tests.
class MemoryStream : public adapters::fs::ByteStream {
public:
    explicit MemoryStream(std::vector<char> data, std::filesystem::path path = "memory")
        : data_(std::move(data)), path_(std::move(path)) {}

    [[nodiscard]] auto path() const -> const std::filesystem::path& override { return path_; }
    [[nodiscard]] auto length() const -> infra::Result<std::uint64_t> override { return data_.size(); }

    [[nodiscard]] auto read_at(std::uint64_t offset, std::span<char> buffer)
        -> infra::Result<std::size_t> override
    {
        ++reads;
        if (offset >= data_.size()) return std::size_t{0};
        const auto n = std::min<std::size_t>(buffer.size(), data_.size() - offset);
        std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(offset), n, buffer.begin());
        return n;
    }

    [[nodiscard]] auto write_at(std::uint64_t offset, std::span<const char> data)
        -> infra::VoidResult override
    {
        if (offset + data.size() > data_.size()) data_.resize(offset + data.size());
        std::copy(data.begin(), data.end(), data_.begin() + static_cast<std::ptrdiff_t>(offset));
        return {};
    }

    [[nodiscard]] auto sync() -> infra::VoidResult override { return {}; }

    int reads = 0;

private:
    std::vector<char> data_;
    std::filesystem::path path_;
};

/// A read fault on [offset, offset + size). `failures < 0` fails forever.
struct Fault {
    std::uint64_t offset = 0;
    std::uint64_t size = 0;
    int failures = -1;
    infra::ErrorCode code = infra::ErrorCode::MediaError;
};

/// Decorator that fails reads touching a faulty range, then defers to the
/// wrapped stream once the fault's failure budget is spent.
class FaultInjectingStream : public adapters::fs::ByteStream {
public:
    FaultInjectingStream(adapters::fs::StreamPtr inner, std::vector<Fault> faults)
        : inner_(std::move(inner)), faults_(std::move(faults)) {}

    [[nodiscard]] auto path() const -> const std::filesystem::path& override { return inner_->path(); }
    [[nodiscard]] auto length() const -> infra::Result<std::uint64_t> override { return inner_->length(); }

    [[nodiscard]] auto read_at(std::uint64_t offset, std::span<char> buffer)
        -> infra::Result<std::size_t> override
    {
        ++reads;
        for (auto& fault : faults_) {
            const bool overlaps = offset < fault.offset + fault.size &&
                                  fault.offset < offset + buffer.size();
            if (!overlaps || fault.failures == 0) continue;
            if (fault.failures > 0) --fault.failures;
            ++failed_reads;
            return std::unexpected(infra::make_error(fault.code,
                "injected read fault at " + std::to_string(offset)));
        }
        return inner_->read_at(offset, buffer);
    }

    [[nodiscard]] auto write_at(std::uint64_t offset, std::span<const char> data)
        -> infra::VoidResult override
    {
        return inner_->write_at(offset, data);
    }

    [[nodiscard]] auto sync() -> infra::VoidResult override { return inner_->sync(); }

    int reads = 0;
    int failed_reads = 0;

private:
    adapters::fs::StreamPtr inner_;
    std::vector<Fault> faults_;
};

/// Opener that injects `faults` into reads of `faulty`; other paths open normally.
inline auto faulty_opener(std::filesystem::path faulty, std::vector<Fault> faults)
    -> adapters::fs::StreamOpener
{
    return [faulty = std::move(faulty), faults = std::move(faults)](
               const std::filesystem::path& path, adapters::fs::OpenMode mode)
        -> infra::Result<adapters::fs::StreamPtr>
    {
        auto stream = adapters::fs::open_stream(path, mode);
        if (!stream || path != faulty) {
            return stream;
        }
        return adapters::fs::StreamPtr(
            std::make_unique<FaultInjectingStream>(std::move(*stream), faults));
    };
}

} // namespace rescuecp::test_support
