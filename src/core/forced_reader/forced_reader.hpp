#pragma once

#include <cstdint>
#include <span>
#include <vector>
#include "../../adapters/fs.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/retry.hpp"

namespace rescuecp::core {

struct ReadOutcome {
    // Прочитано байт; при неудаче ожидаемая длина блока (буфер заполнен нулями)
    std::uint32_t bytes = 0;
    bool success = true;
    int failures = 0; // сколько попыток завершились ошибкой носителя
};

/// Reads one block, repeating the read while the medium reports I/O errors.
///
/// After `max_retries` extra attempts the block is given up on: the buffer is
/// zero-filled for min(block_size, length - offset) bytes and that length is
/// reported with `success == false`. Errors other than media errors are never
/// retried and come back as the error value.
class ForcedReader {
public:
    explicit ForcedReader(std::uint32_t block_size, infra::RetryPolicy pacing = {});

    [[nodiscard]] auto read(adapters::fs::ByteStream& stream,
                            std::uint64_t offset,
                            std::uint32_t block_size,
                            int max_retries) -> infra::Result<ReadOutcome>;

    /// Bytes of the last read, `outcome.bytes` long.
    [[nodiscard]] auto data(const ReadOutcome& outcome) const -> std::span<const char> {
        return {buffer_.data(), outcome.bytes};
    }

private:
    std::vector<char> buffer_;
    infra::RetryPolicy pacing_;
};

} // namespace rescuecp::core
