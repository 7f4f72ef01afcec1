#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include "../adapters/remote_session.hpp"

namespace vaultup::core {

inline constexpr std::uint64_t BYTES_PER_MB = 1024 * 1024;

struct UploadJob {
    std::filesystem::path file_path;
    std::string description;
    std::uint64_t file_size = 0;
    std::uint64_t chunk_size_mb = 0;
    std::uint64_t chunk_size = 0;     // bytes
    std::uint64_t chunk_count = 0;    // ceil(file_size / chunk_size)

    // Только подтверждённые удалённой стороной чанки
    std::uint64_t cur_chunk = 0;
    std::uint64_t cur_byte = 0;

    adapters::SessionHandle session;

    // Ключи 1..cur_chunk, порядок обхода совпадает с порядком чанков
    std::map<std::uint64_t, std::string> part_checksums;
};

[[nodiscard]] inline auto chunk_count_for(std::uint64_t file_size, std::uint64_t chunk_size)
    -> std::uint64_t
{
    return chunk_size == 0 ? 0 : (file_size + chunk_size - 1) / chunk_size;
}

} // namespace vaultup::core
