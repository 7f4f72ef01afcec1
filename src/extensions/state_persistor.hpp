// src/extensions/state_persistor.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include "../core/upload_job.hpp"
#include "../infra/error_handler/error.hpp"

namespace vaultup::extensions {

inline constexpr std::uint32_t RECORD_VERSION = 1;

// Снимок UploadJob после последнего подтверждённого чанка
struct ResumeRecord {
    std::uint32_t version = RECORD_VERSION;
    std::string account_id;
    std::string vault_name;
    std::string upload_id;
    std::filesystem::path file_path;
    std::uint64_t chunk_size_mb = 0;
    std::uint64_t cur_chunk = 0;
    std::uint64_t cur_byte = 0;
    std::map<std::uint64_t, std::string> part_checksums;
};

[[nodiscard]] auto to_record(const core::UploadJob& job) -> ResumeRecord;

class StatePersistor {
public:
    virtual ~StatePersistor() = default;

    /// Writes a new record for `job` and returns where it went. Never
    /// overwrites an existing record. Failures are logged and reported as
    /// std::nullopt so that the caller's own error stays the one propagated.
    [[nodiscard]] virtual auto dump(const core::UploadJob& job)
        -> std::optional<std::filesystem::path> = 0;

    [[nodiscard]] virtual auto load(const std::filesystem::path& location)
        -> infra::Result<ResumeRecord> = 0;

    // Удаляет использованную запись; ошибки только логируются
    virtual void discard(const std::filesystem::path& location) = 0;
};

/// Stores records as YAML files named dump-XXXXXX.yaml in one directory.
/// JSON records (a YAML subset) with the same keys load as well.
class YamlStatePersistor final : public StatePersistor {
public:
    explicit YamlStatePersistor(std::filesystem::path directory);

    [[nodiscard]] auto dump(const core::UploadJob& job)
        -> std::optional<std::filesystem::path> override;

    [[nodiscard]] auto load(const std::filesystem::path& location)
        -> infra::Result<ResumeRecord> override;

    void discard(const std::filesystem::path& location) override;

    [[nodiscard]] auto write_record(const ResumeRecord& record)
        -> infra::Result<std::filesystem::path>;

    [[nodiscard]] auto directory() const -> const std::filesystem::path& { return directory_; }

private:
    std::filesystem::path directory_;
};

} // namespace vaultup::extensions
