#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "remote_session.hpp"

namespace vaultup::adapters {

/// RemoteSession backed by a local directory tree.
///
/// Layout under `root`:
///   <vault>/                               vault must exist beforehand
///   <vault>/.multipart/<upload_id>/        open session
///       session.yaml                       owner, description, part size
///       part-<first offset, 20 digits>.bin received parts
///   <vault>/<upload_id>.archive            completed archive
///   <vault>/<upload_id>.yaml               archive metadata
///
/// Part checksums and the whole-archive checksum are XXH64 hex digests.
class LocalVaultSession final : public RemoteSession {
public:
    LocalVaultSession(std::filesystem::path root, std::string account_id);

    [[nodiscard]] auto initiate(std::string_view target,
                                std::string_view description,
                                std::uint64_t part_size)
        -> infra::Result<SessionHandle> override;

    [[nodiscard]] auto resume(std::string_view owner,
                              std::string_view target,
                              std::string_view session_id)
        -> infra::Result<SessionHandle> override;

    [[nodiscard]] auto complete(const SessionHandle& handle,
                                std::uint64_t total_size,
                                std::string_view checksum)
        -> infra::VoidResult override;

    [[nodiscard]] auto archive_path(const SessionHandle& handle) const -> std::filesystem::path;
    [[nodiscard]] auto session_dir(const SessionHandle& handle) const -> std::filesystem::path;

protected:
    [[nodiscard]] auto send_part(const SessionHandle& handle,
                                 std::string_view range_header,
                                 std::span<const char> payload)
        -> infra::Result<std::string> override;

private:
    struct Manifest {
        std::string owner;
        std::string description;
        std::uint64_t part_size = 0;
    };

    [[nodiscard]] auto load_manifest(const SessionHandle& handle) const -> infra::Result<Manifest>;

    std::filesystem::path root_;
    std::string account_id_;
};

} // namespace vaultup::adapters
