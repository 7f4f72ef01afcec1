#include "chunk_reader.hpp"
#include <fmt/core.h>

namespace vaultup::core {

ChunkReader::ChunkReader(std::istream& in,
                         std::uint64_t chunk_size,
                         std::uint64_t cursor,
                         std::uint64_t chunks_consumed)
    : in_(in), chunk_size_(chunk_size), cursor_(cursor), index_(chunks_consumed) {}

auto ChunkReader::next() -> infra::Result<std::optional<ChunkPayload>>
{
    if (exhausted_) {
        return std::nullopt;
    }
    if (in_.bad() || (in_.fail() && !in_.eof())) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ReadFailed,
                               fmt::format("Stream unusable before offset {}", cursor_)));
    }

    // Конец потока определяется до выделения буфера под чанк
    if (in_.peek() == std::char_traits<char>::eof()) {
        if (in_.bad()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::ReadFailed,
                                   fmt::format("Read error at offset {}", cursor_)));
        }
        exhausted_ = true;
        return std::nullopt;
    }

    ChunkPayload chunk;
    chunk.data.resize(chunk_size_);
    in_.read(chunk.data.data(), static_cast<std::streamsize>(chunk_size_));
    const auto bytes_read = static_cast<std::uint64_t>(in_.gcount());

    if (in_.bad()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ReadFailed,
                               fmt::format("Read error at offset {}", cursor_)));
    }

    if (bytes_read == 0) {
        exhausted_ = true;
        return std::nullopt;
    }

    chunk.data.resize(bytes_read);
    chunk.first_byte = cursor_;
    chunk.last_byte = cursor_ + bytes_read - 1;
    chunk.index = ++index_;
    cursor_ += bytes_read;
    return chunk;
}

} // namespace vaultup::core
