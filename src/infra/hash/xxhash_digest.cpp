#include "xxhash_digest.hpp"
#include <fstream>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace vaultup::infra {

auto XXHashDigest::hash_file(const std::filesystem::path& path)
    -> Result<XXH64_hash_t>
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(make_error(ErrorCode::FileNotFound,
                                          fmt::format("Cannot open file for hashing: {}", path.string())));
    }

    XXH64_state_t* state = XXH64_createState();
    if (!state) {
        return std::unexpected(make_error(ErrorCode::Unknown, "Failed to create XXH64 state"));
    }

    XXH64_reset(state, 0); // seed = 0

    std::vector<char> buffer(BUFFER_SIZE);
    while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
        XXH64_update(state, buffer.data(), static_cast<size_t>(file.gcount()));
    }

    XXH64_hash_t hash = XXH64_digest(state);
    XXH64_freeState(state);

    if (file.bad()) {
        return std::unexpected(make_error(ErrorCode::ReadFailed,
                                          fmt::format("Error reading file: {}", path.string())));
    }

    spdlog::debug("xxh64({}) = {:016x}", path.string(), hash);
    return hash;
}

auto XXHashDigest::hash_buffer(std::span<const char> data) -> XXH64_hash_t {
    return XXH64(data.data(), data.size(), 0);
}

auto XXHashDigest::to_hex(XXH64_hash_t hash) -> std::string {
    return fmt::format("{:016x}", hash);
}

auto XXHashDigest::file_checksum(const std::filesystem::path& path)
    -> Result<std::string>
{
    auto hash = hash_file(path);
    if (!hash) {
        return std::unexpected(std::move(hash.error()));
    }
    return to_hex(*hash);
}

} // namespace vaultup::infra
