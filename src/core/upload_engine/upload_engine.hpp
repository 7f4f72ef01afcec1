#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include "../upload_job.hpp"
#include "../../adapters/remote_session.hpp"
#include "../../extensions/state_persistor.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/monitoring/monitoring.hpp"

namespace vaultup::core {

inline constexpr std::uint64_t MIN_CHUNK_SIZE_MB = 1;
inline constexpr std::uint64_t MAX_CHUNK_SIZE_MB = 4096;

enum class UploadState {
    Fresh,
    Initiating,
    Resuming,
    Transmitting,
    Completing,
    Done,
    Aborted,
};

[[nodiscard]] auto to_string(UploadState state) -> std::string_view;

struct UploadRequest {
    std::filesystem::path file_path;
    std::string vault_name;
    std::string description;
    std::uint64_t chunk_size_mb = 0;
};

// Неудача фазы передачи: причина и номер чанка, который не удалось отправить
struct TransmitFailure {
    infra::Error cause;
    std::uint64_t chunk_index = 0;
};

// Внешний вычислитель контрольной суммы всего файла
using FileDigest = std::function<infra::Result<std::string>(const std::filesystem::path&)>;

class UploadEngine {
public:
    UploadEngine(adapters::RemoteSession& remote,
                 extensions::StatePersistor& persistor,
                 infra::ProgressMonitor& monitor,
                 FileDigest digest);

    UploadEngine(const UploadEngine&) = delete;
    UploadEngine& operator=(const UploadEngine&) = delete;

    /// Power of two in [1, 4096] MiB.
    [[nodiscard]] static auto validate_chunk_size_mb(std::uint64_t chunk_size_mb) -> infra::VoidResult;

    // Fresh -> Initiating. Ошибки возвращаются без записи resume-состояния.
    [[nodiscard]] auto start(const UploadRequest& request) -> infra::VoidResult;

    // Fresh -> Resuming. Файл открывается заново и позиционируется на cur_byte.
    [[nodiscard]] auto resume(const std::filesystem::path& record_path) -> infra::VoidResult;

    /// Sends every remaining chunk in order. On failure the job is dumped
    /// through the StatePersistor, the file is released and the original
    /// error is returned.
    [[nodiscard]] auto transmit() -> infra::VoidResult;

    /// Re-reads the whole file through the digest and closes the session.
    [[nodiscard]] auto complete() -> infra::VoidResult;

    // transmit() + complete()
    [[nodiscard]] auto run() -> infra::VoidResult;

    [[nodiscard]] auto state() const -> UploadState { return state_; }
    [[nodiscard]] auto job() const -> const UploadJob& { return job_; }
    [[nodiscard]] auto last_resume_record() const -> const std::optional<std::filesystem::path>& {
        return last_record_;
    }

private:
    [[nodiscard]] auto open_file(std::uint64_t offset) -> infra::VoidResult;
    [[nodiscard]] auto transmit_chunks() -> std::expected<void, TransmitFailure>;
    [[nodiscard]] auto fail(infra::Error&& err) -> std::unexpected<infra::Error>;
    void release_consumed_record();

    adapters::RemoteSession& remote_;
    extensions::StatePersistor& persistor_;
    infra::ProgressMonitor& monitor_;
    FileDigest digest_;

    UploadState state_ = UploadState::Fresh;
    UploadJob job_{};
    std::ifstream file_;
    std::optional<std::filesystem::path> consumed_record_;
    std::optional<std::filesystem::path> last_record_;
};

} // namespace vaultup::core
