#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <span>
#include <vector>
#include "../../infra/error_handler/error.hpp"

namespace vaultup::core {

struct ChunkPayload {
    std::vector<char> data;
    std::uint64_t first_byte = 0; // включительно
    std::uint64_t last_byte = 0;  // включительно
    std::uint64_t index = 0;      // с единицы

    [[nodiscard]] auto size() const -> std::uint64_t { return data.size(); }
    [[nodiscard]] auto bytes() const -> std::span<const char> { return data; }
};

/// Reads a stream forward in fixed-size chunks.
///
/// The stream must already be positioned at `cursor`; `chunks_consumed`
/// chunks are assumed to precede that position. next() yields std::nullopt
/// once the stream is exhausted, and keeps doing so on later calls.
class ChunkReader {
public:
    ChunkReader(std::istream& in,
                std::uint64_t chunk_size,
                std::uint64_t cursor = 0,
                std::uint64_t chunks_consumed = 0);

    [[nodiscard]] auto next() -> infra::Result<std::optional<ChunkPayload>>;

    [[nodiscard]] auto cursor() const -> std::uint64_t { return cursor_; }
    [[nodiscard]] auto chunks_read() const -> std::uint64_t { return index_; }

private:
    std::istream& in_;
    const std::uint64_t chunk_size_;
    std::uint64_t cursor_;
    std::uint64_t index_;
    bool exhausted_ = false;
};

} // namespace vaultup::core
