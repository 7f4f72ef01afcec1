#pragma once

#include <filesystem>
#include <expected>
#include <span>
#include <string>
#include "../error_handler/error.hpp"
#include <xxhash.h>

namespace vaultup::infra {

class XXHashDigest {
public:
    // xxHash64 всего файла, потоково
    static auto hash_file(const std::filesystem::path& path)
        -> Result<XXH64_hash_t>;

    static auto hash_buffer(std::span<const char> data) -> XXH64_hash_t;

    // 16 шестнадцатеричных цифр в нижнем регистре
    static auto to_hex(XXH64_hash_t hash) -> std::string;

    /// Checksum of a whole file in the form expected by RemoteSession::complete.
    static auto file_checksum(const std::filesystem::path& path)
        -> Result<std::string>;

private:
    static constexpr size_t BUFFER_SIZE = 4 * 1024 * 1024; // 4MB buffer
};

} // namespace vaultup::infra
