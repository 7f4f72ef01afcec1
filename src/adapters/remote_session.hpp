#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include "infra/error_handler/error.hpp"

namespace vaultup::adapters {

// Идентификация multipart-сессии на удалённой стороне
struct SessionHandle {
    std::string owner;       // account id
    std::string target;      // имя хранилища (vault)
    std::string session_id;  // upload id
};

struct ByteRange {
    std::uint64_t first = 0; // включительно
    std::uint64_t last = 0;  // включительно
};

/// Range header for one part: "bytes {first}-{last}/*". The total size is
/// never announced to the remote side.
[[nodiscard]] auto format_byte_range(std::uint64_t first, std::uint64_t last) -> std::string;

[[nodiscard]] auto parse_byte_range(std::string_view header) -> infra::Result<ByteRange>;

/// Multipart-upload protocol consumed by core::UploadEngine.
///
/// Every call is a single blocking attempt; implementations never retry.
/// Failures are reported as errors of ErrorKind::Remote.
class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    [[nodiscard]] virtual auto initiate(std::string_view target,
                                        std::string_view description,
                                        std::uint64_t part_size)
        -> infra::Result<SessionHandle> = 0;

    // Без обращения к хранилищу: живость сессии проверяется при первой загрузке части
    [[nodiscard]] virtual auto resume(std::string_view owner,
                                      std::string_view target,
                                      std::string_view session_id)
        -> infra::Result<SessionHandle> = 0;

    /// Sends one part covering the inclusive range [first, last] and returns
    /// the checksum the remote side computed for it.
    [[nodiscard]] auto upload_part(const SessionHandle& handle,
                                   std::uint64_t first,
                                   std::uint64_t last,
                                   std::span<const char> payload)
        -> infra::Result<std::string>;

    [[nodiscard]] virtual auto complete(const SessionHandle& handle,
                                        std::uint64_t total_size,
                                        std::string_view checksum)
        -> infra::VoidResult = 0;

protected:
    [[nodiscard]] virtual auto send_part(const SessionHandle& handle,
                                         std::string_view range_header,
                                         std::span<const char> payload)
        -> infra::Result<std::string> = 0;
};

} // namespace vaultup::adapters
