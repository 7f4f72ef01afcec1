#include "local_vault.hpp"
#include <charconv>
#include <fstream>
#include <map>
#include <optional>
#include <random>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include "infra/hash/xxhash_digest.hpp"

namespace vaultup::adapters {

namespace {

constexpr std::string_view MULTIPART_DIR = ".multipart";
constexpr std::string_view MANIFEST_NAME = "session.yaml";
constexpr std::string_view PART_PREFIX = "part-";
constexpr std::string_view PART_SUFFIX = ".bin";

auto new_upload_id() -> std::string {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    return fmt::format("{:016x}{:016x}", gen(), gen());
}

auto part_file_name(std::uint64_t first) -> std::string {
    return fmt::format("{}{:020}{}", PART_PREFIX, first, PART_SUFFIX);
}

auto part_offset(const std::filesystem::path& file) -> std::optional<std::uint64_t> {
    const auto name = file.filename().string();
    std::string_view view(name);
    if (!view.starts_with(PART_PREFIX) || !view.ends_with(PART_SUFFIX)) {
        return std::nullopt;
    }
    view = view.substr(PART_PREFIX.size(), view.size() - PART_PREFIX.size() - PART_SUFFIX.size());
    std::uint64_t offset = 0;
    auto [ptr, ec] = std::from_chars(view.data(), view.data() + view.size(), offset);
    if (ec != std::errc{} || ptr != view.data() + view.size()) {
        return std::nullopt;
    }
    return offset;
}

// Имя хранилища или id сессии становится одним компонентом пути
auto is_plain_name(std::string_view name) -> bool {
    return !name.empty() && name != "." && name != ".." &&
           name.find_first_of(std::string_view("/\\\0", 3)) == std::string_view::npos;
}

auto check_names(std::string_view target, std::string_view session_id) -> infra::VoidResult {
    if (!is_plain_name(target)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::VaultNotFound,
                               fmt::format("Illegal vault name '{}'", target)));
    }
    if (!is_plain_name(session_id)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SessionNotFound,
                               fmt::format("Illegal upload id '{}'", session_id)));
    }
    return {};
}

auto remote_failure(std::string message) -> std::unexpected<infra::Error> {
    return std::unexpected(infra::make_error(infra::ErrorCode::RemoteFailure, message));
}

// Дописывает содержимое src в открытый поток; буферизованно, как copy_file_buffered
auto append_file(const std::filesystem::path& src, std::ofstream& out) -> bool {
    std::ifstream in(src, std::ios::binary);
    if (!in) return false;

    constexpr size_t buffer_size = 64 * 1024;
    std::vector<char> buffer(buffer_size);
    while (in.read(buffer.data(), buffer_size) || in.gcount() > 0) {
        out.write(buffer.data(), in.gcount());
        if (!out) return false;
    }
    return !in.bad();
}

} // namespace

LocalVaultSession::LocalVaultSession(std::filesystem::path root, std::string account_id)
    : root_(std::move(root)), account_id_(std::move(account_id)) {}

auto LocalVaultSession::session_dir(const SessionHandle& handle) const -> std::filesystem::path {
    return root_ / handle.target / MULTIPART_DIR / handle.session_id;
}

auto LocalVaultSession::archive_path(const SessionHandle& handle) const -> std::filesystem::path {
    return root_ / handle.target / (handle.session_id + ".archive");
}

auto LocalVaultSession::initiate(std::string_view target,
                                 std::string_view description,
                                 std::uint64_t part_size)
    -> infra::Result<SessionHandle>
{
    std::error_code ec;
    const auto vault_dir = root_ / target;
    if (!is_plain_name(target) || !std::filesystem::is_directory(vault_dir, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::VaultNotFound,
                               fmt::format("Vault '{}' does not exist under {}", target, root_.string())));
    }
    if (part_size == 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PartRejected, "Part size must be positive"));
    }

    SessionHandle handle{
        .owner = account_id_,
        .target = std::string(target),
        .session_id = new_upload_id()
    };

    const auto dir = session_dir(handle);
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return remote_failure(fmt::format("Cannot create session {}: {}", dir.string(), ec.message()));
    }

    YAML::Node manifest;
    manifest["owner"] = handle.owner;
    manifest["description"] = std::string(description);
    manifest["part_size"] = part_size;

    std::ofstream ofs(dir / MANIFEST_NAME);
    ofs << manifest << "\n";
    if (!ofs) {
        return remote_failure(fmt::format("Cannot write session manifest in {}", dir.string()));
    }

    spdlog::debug("Opened multipart session {} in vault {}", handle.session_id, handle.target);
    return handle;
}

auto LocalVaultSession::resume(std::string_view owner,
                               std::string_view target,
                               std::string_view session_id)
    -> infra::Result<SessionHandle>
{
    if (auto valid = check_names(target, session_id); !valid) {
        return std::unexpected(std::move(valid.error()));
    }
    return SessionHandle{
        .owner = std::string(owner),
        .target = std::string(target),
        .session_id = std::string(session_id)
    };
}

auto LocalVaultSession::load_manifest(const SessionHandle& handle) const -> infra::Result<Manifest>
{
    if (auto valid = check_names(handle.target, handle.session_id); !valid) {
        return std::unexpected(std::move(valid.error()));
    }

    const auto path = session_dir(handle) / MANIFEST_NAME;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SessionNotFound,
                               fmt::format("No multipart upload '{}' in vault '{}'",
                                           handle.session_id, handle.target)));
    }

    Manifest manifest;
    try {
        YAML::Node node = YAML::LoadFile(path.string());
        manifest = Manifest{
            .owner = node["owner"].as<std::string>(),
            .description = node["description"] ? node["description"].as<std::string>() : std::string{},
            .part_size = node["part_size"].as<std::uint64_t>()
        };
    } catch (const YAML::Exception& e) {
        return remote_failure(fmt::format("Corrupt session manifest {}: {}", path.string(), e.what()));
    }

    if (manifest.part_size == 0) {
        return remote_failure(fmt::format("Corrupt session manifest {}: part_size is 0", path.string()));
    }
    return manifest;
}

auto LocalVaultSession::send_part(const SessionHandle& handle,
                                  std::string_view range_header,
                                  std::span<const char> payload)
    -> infra::Result<std::string>
{
    auto manifest = load_manifest(handle);
    if (!manifest) {
        return std::unexpected(std::move(manifest.error()));
    }
    if (manifest->owner != handle.owner) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PartRejected,
                               fmt::format("Upload '{}' does not belong to account '{}'",
                                           handle.session_id, handle.owner)));
    }

    auto range = parse_byte_range(range_header);
    if (!range) {
        return std::unexpected(std::move(range.error()));
    }

    const std::uint64_t length = range->last - range->first + 1;
    if (length != payload.size()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PartRejected,
                               fmt::format("Range '{}' covers {} bytes but body has {}",
                                           range_header, length, payload.size())));
    }
    if (length > manifest->part_size || range->first % manifest->part_size != 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PartRejected,
                               fmt::format("Range '{}' does not match part size {}",
                                           range_header, manifest->part_size)));
    }

    const auto part_path = session_dir(handle) / part_file_name(range->first);
    std::ofstream ofs(part_path, std::ios::binary | std::ios::trunc);
    ofs.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    ofs.close();
    if (!ofs) {
        return remote_failure(fmt::format("Cannot store part {}", part_path.string()));
    }

    return infra::XXHashDigest::to_hex(infra::XXHashDigest::hash_buffer(payload));
}

auto LocalVaultSession::complete(const SessionHandle& handle,
                                 std::uint64_t total_size,
                                 std::string_view checksum)
    -> infra::VoidResult
{
    auto manifest = load_manifest(handle);
    if (!manifest) {
        return std::unexpected(std::move(manifest.error()));
    }

    const auto dir = session_dir(handle);
    std::error_code ec;
    std::map<std::uint64_t, std::filesystem::path> parts;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (auto offset = part_offset(entry.path())) {
            parts.emplace(*offset, entry.path());
        }
    }
    if (ec) {
        return remote_failure(fmt::format("Cannot list parts in {}: {}", dir.string(), ec.message()));
    }

    const auto archive = archive_path(handle);
    auto partial = archive;
    partial += ".partial";

    std::uint64_t assembled = 0;
    {
        std::ofstream out(partial, std::ios::binary | std::ios::trunc);
        if (!out) {
            return remote_failure(fmt::format("Cannot create archive {}", partial.string()));
        }
        for (const auto& [offset, path] : parts) {
            if (offset != assembled) {
                out.close();
                std::filesystem::remove(partial, ec);
                return std::unexpected(infra::make_error(infra::ErrorCode::SizeMismatch,
                                       fmt::format("Upload '{}' is missing bytes {}-{}",
                                                   handle.session_id, assembled, offset - 1)));
            }
            if (!append_file(path, out)) {
                out.close();
                std::filesystem::remove(partial, ec);
                return remote_failure(fmt::format("Cannot assemble part {}", path.string()));
            }
            assembled += std::filesystem::file_size(path, ec);
            if (ec) {
                out.close();
                std::filesystem::remove(partial, ec);
                return remote_failure(fmt::format("Cannot stat part {}", path.string()));
            }
        }
    }

    if (assembled != total_size) {
        std::filesystem::remove(partial, ec);
        return std::unexpected(infra::make_error(infra::ErrorCode::SizeMismatch,
                               fmt::format("Archive size {} does not match received {} bytes",
                                           total_size, assembled)));
    }

    auto digest = infra::XXHashDigest::file_checksum(partial);
    if (!digest) {
        std::filesystem::remove(partial, ec);
        return std::unexpected(std::move(digest.error()));
    }
    if (*digest != checksum) {
        std::filesystem::remove(partial, ec);
        return std::unexpected(infra::make_error(infra::ErrorCode::ChecksumMismatch,
                               fmt::format("Checksum {} does not match computed {}", checksum, *digest)));
    }

    std::filesystem::rename(partial, archive, ec);
    if (ec) {
        return remote_failure(fmt::format("Cannot finalize archive {}: {}", archive.string(), ec.message()));
    }

    YAML::Node meta;
    meta["archive_id"] = handle.session_id;
    meta["description"] = manifest->description;
    meta["size"] = total_size;
    meta["checksum"] = std::string(checksum);
    meta["parts"] = static_cast<std::uint64_t>(parts.size());
    {
        auto meta_path = root_ / handle.target / (handle.session_id + ".yaml");
        std::ofstream ofs(meta_path);
        ofs << meta << "\n";
        if (!ofs) {
            spdlog::warn("Cannot write archive metadata {}", meta_path.string());
        }
    }

    std::filesystem::remove_all(dir, ec);
    if (ec) {
        spdlog::warn("Cannot clean up session {}: {}", dir.string(), ec.message());
    }

    spdlog::info("Archive {} stored at {}", handle.session_id, archive.string());
    return {};
}

} // namespace vaultup::adapters
