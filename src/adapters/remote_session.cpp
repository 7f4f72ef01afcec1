#include "remote_session.hpp"
#include <charconv>
#include <fmt/core.h>

namespace vaultup::adapters {

namespace {

constexpr std::string_view RANGE_PREFIX = "bytes ";
constexpr std::string_view RANGE_SUFFIX = "/*";

auto parse_offset(std::string_view text, std::uint64_t& out) -> bool {
    if (text.empty()) return false;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

} // namespace

auto format_byte_range(std::uint64_t first, std::uint64_t last) -> std::string {
    return fmt::format("bytes {}-{}/*", first, last);
}

auto parse_byte_range(std::string_view header) -> infra::Result<ByteRange> {
    auto malformed = [&] {
        return std::unexpected(infra::make_error(infra::ErrorCode::PartRejected,
                               fmt::format("Malformed range header '{}'", header)));
    };

    if (!header.starts_with(RANGE_PREFIX) || !header.ends_with(RANGE_SUFFIX)) {
        return malformed();
    }
    auto body = header.substr(RANGE_PREFIX.size(),
                              header.size() - RANGE_PREFIX.size() - RANGE_SUFFIX.size());
    auto dash = body.find('-');
    if (dash == std::string_view::npos) {
        return malformed();
    }

    ByteRange range;
    if (!parse_offset(body.substr(0, dash), range.first) ||
        !parse_offset(body.substr(dash + 1), range.last) ||
        range.last < range.first) {
        return malformed();
    }
    return range;
}

auto RemoteSession::upload_part(const SessionHandle& handle,
                                std::uint64_t first,
                                std::uint64_t last,
                                std::span<const char> payload)
    -> infra::Result<std::string>
{
    return send_part(handle, format_byte_range(first, last), payload);
}

} // namespace vaultup::adapters
