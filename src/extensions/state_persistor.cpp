// state_persistor.cpp
#include "state_persistor.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string_view>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <fcntl.h>
#include <unistd.h>

namespace vaultup::extensions {

namespace {

constexpr std::string_view RECORD_TEMPLATE = "dump-XXXXXX.yaml";
constexpr int RECORD_SUFFIX_LEN = 5; // ".yaml"

auto malformed(const std::filesystem::path& location, std::string_view what)
    -> std::unexpected<infra::Error>
{
    return std::unexpected(infra::make_error(infra::ErrorCode::MalformedRecord,
                           fmt::format("Resume record {}: {}", location.string(), what)));
}

template<typename T>
auto required(const YAML::Node& node, const char* key,
              const std::filesystem::path& location) -> infra::Result<T>
{
    const YAML::Node value = node[key];
    if (!value) {
        return malformed(location, fmt::format("missing field '{}'", key));
    }
    if (!value.IsScalar()) {
        return malformed(location, fmt::format("field '{}' is not a scalar", key));
    }
    try {
        return value.as<T>();
    } catch (const YAML::BadConversion&) {
        return malformed(location, fmt::format("field '{}' has an invalid value '{}'",
                                               key, value.Scalar()));
    }
}

auto write_all(int fd, const std::string& text) -> bool {
    const char* data = text.data();
    std::size_t remaining = text.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += written;
        remaining -= static_cast<std::size_t>(written);
    }
    return true;
}

} // namespace

auto to_record(const core::UploadJob& job) -> ResumeRecord
{
    return ResumeRecord{
        .version = RECORD_VERSION,
        .account_id = job.session.owner,
        .vault_name = job.session.target,
        .upload_id = job.session.session_id,
        .file_path = job.file_path,
        .chunk_size_mb = job.chunk_size_mb,
        .cur_chunk = job.cur_chunk,
        .cur_byte = job.cur_byte,
        .part_checksums = job.part_checksums
    };
}

YamlStatePersistor::YamlStatePersistor(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

auto YamlStatePersistor::dump(const core::UploadJob& job)
    -> std::optional<std::filesystem::path>
{
    try {
        auto location = write_record(to_record(job));
        if (!location) {
            (void)infra::log_and_return(std::move(location.error()));
            return std::nullopt;
        }
        spdlog::info("Saved resume state (chunk {}, byte {}) to {}",
                     job.cur_chunk, job.cur_byte, location->string());
        return *location;
    } catch (const std::exception& e) {
        // Исходная ошибка загрузки важнее — только логируем
        spdlog::error("Failed to save resume state: {}", e.what());
        return std::nullopt;
    }
}

auto YamlStatePersistor::write_record(const ResumeRecord& record)
    -> infra::Result<std::filesystem::path>
{
    YAML::Node node;
    node["version"] = record.version;
    node["account_id"] = record.account_id;
    node["vault_name"] = record.vault_name;
    node["upload_id"] = record.upload_id;
    node["cur_chunk"] = record.cur_chunk;
    node["cur_byte"] = record.cur_byte;
    node["file_path"] = record.file_path.string();
    node["chunk_size_mb"] = record.chunk_size_mb;

    YAML::Node checksums(YAML::NodeType::Map);
    for (const auto& [index, checksum] : record.part_checksums) {
        checksums[index] = checksum;
    }
    node["part_checksums"] = checksums;

    YAML::Emitter out;
    out << node;
    if (!out.good()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::WriteFailed,
                               fmt::format("Cannot serialize resume record: {}", out.GetLastError())));
    }
    std::string text = std::string(out.c_str()) + "\n";

    // mkstemps создаёт файл атомарно (O_EXCL), существующие записи не затираются
    std::string name = (directory_ / RECORD_TEMPLATE).string();
    std::vector<char> buffer(name.begin(), name.end());
    buffer.push_back('\0');

    int fd = ::mkstemps(buffer.data(), RECORD_SUFFIX_LEN);
    if (fd == -1) {
        return std::unexpected(infra::make_error(infra::ErrorCode::WriteFailed,
                               fmt::format("Cannot create resume record in {}: {}",
                                           directory_.string(), std::strerror(errno))));
    }
    std::filesystem::path location(buffer.data());

    bool ok = write_all(fd, text) && ::fsync(fd) == 0;
    int saved_errno = errno;
    ::close(fd);
    if (!ok) {
        std::error_code ec;
        std::filesystem::remove(location, ec);
        return std::unexpected(infra::make_error(infra::ErrorCode::WriteFailed,
                               fmt::format("Cannot write resume record {}: {}",
                                           location.string(), std::strerror(saved_errno))));
    }
    return location;
}

auto YamlStatePersistor::load(const std::filesystem::path& location)
    -> infra::Result<ResumeRecord>
{
    std::error_code ec;
    if (!std::filesystem::exists(location, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::FileNotFound,
                               fmt::format("Resume record not found: {}", location.string())));
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(location.string());
    } catch (const YAML::Exception& e) {
        return malformed(location, e.what());
    }
    if (!node.IsMap()) {
        return malformed(location, "top level is not a mapping");
    }

    ResumeRecord record;
    if (node["version"]) {
        auto version = required<std::uint32_t>(node, "version", location);
        if (!version) return std::unexpected(std::move(version.error()));
        if (*version == 0 || *version > RECORD_VERSION) {
            return std::unexpected(infra::make_error(infra::ErrorCode::UnsupportedRecordVersion,
                                   fmt::format("Resume record {} has version {}, expected at most {}",
                                               location.string(), *version, RECORD_VERSION)));
        }
        record.version = *version;
    }

    auto account_id = required<std::string>(node, "account_id", location);
    if (!account_id) return std::unexpected(std::move(account_id.error()));
    auto vault_name = required<std::string>(node, "vault_name", location);
    if (!vault_name) return std::unexpected(std::move(vault_name.error()));
    auto upload_id = required<std::string>(node, "upload_id", location);
    if (!upload_id) return std::unexpected(std::move(upload_id.error()));
    auto file_path = required<std::string>(node, "file_path", location);
    if (!file_path) return std::unexpected(std::move(file_path.error()));
    auto chunk_size_mb = required<std::uint64_t>(node, "chunk_size_mb", location);
    if (!chunk_size_mb) return std::unexpected(std::move(chunk_size_mb.error()));
    auto cur_chunk = required<std::uint64_t>(node, "cur_chunk", location);
    if (!cur_chunk) return std::unexpected(std::move(cur_chunk.error()));
    auto cur_byte = required<std::uint64_t>(node, "cur_byte", location);
    if (!cur_byte) return std::unexpected(std::move(cur_byte.error()));

    record.account_id = std::move(*account_id);
    record.vault_name = std::move(*vault_name);
    record.upload_id = std::move(*upload_id);
    record.file_path = std::move(*file_path);
    record.chunk_size_mb = *chunk_size_mb;
    record.cur_chunk = *cur_chunk;
    record.cur_byte = *cur_byte;

    if (record.upload_id.empty() || record.vault_name.empty()) {
        return malformed(location, "empty session identification");
    }

    const YAML::Node checksums = node["part_checksums"];
    if (!checksums) {
        return malformed(location, "missing field 'part_checksums'");
    }
    if (!checksums.IsMap()) {
        return malformed(location, "field 'part_checksums' is not a mapping");
    }
    for (const auto& entry : checksums) {
        std::uint64_t index = 0;
        std::string checksum;
        try {
            index = entry.first.as<std::uint64_t>();
            checksum = entry.second.as<std::string>();
        } catch (const YAML::BadConversion&) {
            return malformed(location, "invalid entry in 'part_checksums'");
        }
        if (!record.part_checksums.emplace(index, std::move(checksum)).second) {
            return malformed(location, fmt::format("duplicate checksum for chunk {}", index));
        }
    }

    const auto& parts = record.part_checksums;
    // Записи без версии считали cur_chunk до подтверждения части
    if (!node["version"] && record.cur_chunk == parts.size() + 1) {
        record.cur_chunk = parts.size();
    }

    // Ключи обязаны быть ровно 1..cur_chunk
    if (parts.size() != record.cur_chunk ||
        (!parts.empty() && (parts.begin()->first != 1 || parts.rbegin()->first != record.cur_chunk))) {
        return malformed(location, fmt::format("checksums do not cover chunks 1..{}", record.cur_chunk));
    }

    spdlog::debug("Loaded resume record {} (upload {}, chunk {}, byte {})",
                  location.string(), record.upload_id, record.cur_chunk, record.cur_byte);
    return record;
}

void YamlStatePersistor::discard(const std::filesystem::path& location)
{
    std::error_code ec;
    if (std::filesystem::remove(location, ec)) {
        spdlog::debug("Discarded resume record {}", location.string());
    } else if (ec) {
        spdlog::warn("Cannot remove resume record {}: {}", location.string(), ec.message());
    }
}

} // namespace vaultup::extensions
