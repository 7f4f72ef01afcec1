#include "upload_engine.hpp"
#include <algorithm>
#include <utility>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../chunk_reader/chunk_reader.hpp"
#include "../../infra/interrupt.hpp"

namespace vaultup::core {

auto to_string(UploadState state) -> std::string_view {
    switch (state) {
        case UploadState::Fresh:        return "fresh";
        case UploadState::Initiating:   return "initiating";
        case UploadState::Resuming:     return "resuming";
        case UploadState::Transmitting: return "transmitting";
        case UploadState::Completing:   return "completing";
        case UploadState::Done:         return "done";
        case UploadState::Aborted:      return "aborted";
    }
    return "unknown";
}

UploadEngine::UploadEngine(adapters::RemoteSession& remote,
                           extensions::StatePersistor& persistor,
                           infra::ProgressMonitor& monitor,
                           FileDigest digest)
    : remote_(remote), persistor_(persistor), monitor_(monitor), digest_(std::move(digest)) {}

auto UploadEngine::validate_chunk_size_mb(std::uint64_t chunk_size_mb) -> infra::VoidResult
{
    if (chunk_size_mb < MIN_CHUNK_SIZE_MB || chunk_size_mb > MAX_CHUNK_SIZE_MB) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidChunkSize,
                               fmt::format("Illegal chunk size: expected value between 1 MiB and 4 GiB, "
                                           "received {}.", chunk_size_mb)));
    }
    if (chunk_size_mb & (chunk_size_mb - 1)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidChunkSize,
                               "Illegal chunk size: size must be a power of 2."));
    }
    return {};
}

auto UploadEngine::start(const UploadRequest& request) -> infra::VoidResult
{
    if (state_ != UploadState::Fresh) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidState,
                               fmt::format("Cannot start an upload in state '{}'", to_string(state_))));
    }
    // Проверка размера чанка — до любого I/O и сетевых вызовов
    if (auto valid = validate_chunk_size_mb(request.chunk_size_mb); !valid) {
        return valid;
    }

    std::error_code ec;
    const auto file_size = std::filesystem::file_size(request.file_path, ec);
    if (ec) {
        return fail(infra::make_error(infra::ErrorCode::FileNotFound,
                    fmt::format("Cannot stat {}: {}", request.file_path.string(), ec.message())));
    }

    job_ = UploadJob{
        .file_path = request.file_path,
        .description = request.description,
        .file_size = file_size,
        .chunk_size_mb = request.chunk_size_mb,
        .chunk_size = request.chunk_size_mb * BYTES_PER_MB,
        .chunk_count = chunk_count_for(file_size, request.chunk_size_mb * BYTES_PER_MB),
    };

    if (auto opened = open_file(0); !opened) {
        return fail(std::move(opened.error()));
    }

    state_ = UploadState::Initiating;
    spdlog::debug("path: {}, fsize: {}, csize: {}, nchunks: {}",
                  job_.file_path.string(), job_.file_size, job_.chunk_size, job_.chunk_count);

    auto handle = remote_.initiate(request.vault_name, request.description, job_.chunk_size);
    if (!handle) {
        return fail(std::move(handle.error()));
    }
    job_.session = std::move(*handle);
    monitor_.set_total(job_.chunk_count, job_.file_size);

    spdlog::info("Created upload {} in vault {}", job_.session.session_id, job_.session.target);
    return {};
}

auto UploadEngine::resume(const std::filesystem::path& record_path) -> infra::VoidResult
{
    if (state_ != UploadState::Fresh) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidState,
                               fmt::format("Cannot resume an upload in state '{}'", to_string(state_))));
    }
    state_ = UploadState::Resuming;

    auto record = persistor_.load(record_path);
    if (!record) {
        return fail(std::move(record.error()));
    }
    if (auto valid = validate_chunk_size_mb(record->chunk_size_mb); !valid) {
        return fail(std::move(valid.error()));
    }

    std::error_code ec;
    const auto file_size = std::filesystem::file_size(record->file_path, ec);
    if (ec) {
        return fail(infra::make_error(infra::ErrorCode::FileNotFound,
                    fmt::format("Cannot stat {}: {}", record->file_path.string(), ec.message())));
    }

    const auto chunk_size = record->chunk_size_mb * BYTES_PER_MB;
    const auto chunk_count = chunk_count_for(file_size, chunk_size);
    // Запись всегда соответствует границе подтверждённого чанка
    const auto expected_byte = std::min(record->cur_chunk * chunk_size, file_size);
    if (record->cur_chunk > chunk_count || record->cur_byte > file_size ||
        record->cur_byte != expected_byte) {
        return fail(infra::make_error(infra::ErrorCode::MalformedRecord,
                    fmt::format("Resume record {} is inconsistent with {}: byte {} after chunk {} "
                                "of a {} byte file", record_path.string(), record->file_path.string(),
                                record->cur_byte, record->cur_chunk, file_size)));
    }

    job_ = UploadJob{
        .file_path = record->file_path,
        .file_size = file_size,
        .chunk_size_mb = record->chunk_size_mb,
        .chunk_size = chunk_size,
        .chunk_count = chunk_count,
        .cur_chunk = record->cur_chunk,
        .cur_byte = record->cur_byte,
        .part_checksums = std::move(record->part_checksums),
    };

    if (auto opened = open_file(job_.cur_byte); !opened) {
        return fail(std::move(opened.error()));
    }

    auto handle = remote_.resume(record->account_id, record->vault_name, record->upload_id);
    if (!handle) {
        return fail(std::move(handle.error()));
    }
    job_.session = std::move(*handle);
    consumed_record_ = record_path;
    monitor_.set_total(job_.chunk_count, job_.file_size, job_.cur_chunk, job_.cur_byte);

    spdlog::info("Resuming upload {} at chunk {} of {} (byte {})",
                 job_.session.session_id, job_.cur_chunk + 1, job_.chunk_count, job_.cur_byte);
    return {};
}

auto UploadEngine::transmit() -> infra::VoidResult
{
    if (state_ != UploadState::Initiating && state_ != UploadState::Resuming) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidState,
                               fmt::format("Cannot transmit in state '{}'", to_string(state_))));
    }
    state_ = UploadState::Transmitting;

    auto sent = transmit_chunks();
    file_.close();

    if (!sent) {
        auto& failure = sent.error();
        state_ = UploadState::Aborted;
        spdlog::error("Upload {} stopped at chunk {} of {}: {}",
                      job_.session.session_id, failure.chunk_index, job_.chunk_count,
                      failure.cause.message);

        last_record_ = persistor_.dump(job_);
        if (last_record_) {
            // Новая запись заменяет использованную
            release_consumed_record();
            spdlog::warn("Resume with: --resume-from-err {}", last_record_->string());
        }
        return std::unexpected(std::move(failure.cause));
    }

    spdlog::debug("Sent {} chunks ({} bytes) for upload {}",
                  job_.cur_chunk, job_.cur_byte, job_.session.session_id);
    return {};
}

auto UploadEngine::transmit_chunks() -> std::expected<void, TransmitFailure>
{
    ChunkReader reader(file_, job_.chunk_size, job_.cur_byte, job_.cur_chunk);

    while (true) {
        if (infra::is_interrupted()) {
            return std::unexpected(TransmitFailure{
                infra::make_error(infra::ErrorCode::Interrupted, "Upload interrupted"),
                job_.cur_chunk + 1});
        }

        auto next = reader.next();
        if (!next) {
            return std::unexpected(TransmitFailure{std::move(next.error()), job_.cur_chunk + 1});
        }
        if (!*next) {
            break;
        }

        const ChunkPayload& chunk = **next;
        spdlog::debug("Sending chunk {} ({})", chunk.index,
                      adapters::format_byte_range(chunk.first_byte, chunk.last_byte));

        auto checksum = remote_.upload_part(job_.session, chunk.first_byte, chunk.last_byte, chunk.bytes());
        if (!checksum) {
            return std::unexpected(TransmitFailure{std::move(checksum.error()), chunk.index});
        }

        // Состояние продвигается только после подтверждения части
        job_.part_checksums.emplace(chunk.index, std::move(*checksum));
        job_.cur_chunk = chunk.index;
        job_.cur_byte += chunk.size();
        monitor_.chunk_sent(job_.cur_chunk, job_.cur_byte);
    }
    return {};
}

auto UploadEngine::complete() -> infra::VoidResult
{
    if (state_ != UploadState::Transmitting) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidState,
                               fmt::format("Cannot complete in state '{}'", to_string(state_))));
    }
    state_ = UploadState::Completing;

    auto checksum = digest_(job_.file_path);
    if (!checksum) {
        return fail(std::move(checksum.error()));
    }

    if (auto done = remote_.complete(job_.session, job_.file_size, *checksum); !done) {
        return fail(std::move(done.error()));
    }

    state_ = UploadState::Done;
    release_consumed_record();
    spdlog::info("Completed upload {} ({} bytes, checksum {})",
                 job_.session.session_id, job_.file_size, *checksum);
    return {};
}

auto UploadEngine::run() -> infra::VoidResult
{
    if (auto sent = transmit(); !sent) {
        return sent;
    }
    return complete();
}

auto UploadEngine::open_file(std::uint64_t offset) -> infra::VoidResult
{
    file_.open(job_.file_path, std::ios::binary);
    if (!file_) {
        return std::unexpected(infra::make_error(infra::ErrorCode::FileNotFound,
                               fmt::format("Cannot open {}", job_.file_path.string())));
    }
    if (offset > 0) {
        file_.seekg(static_cast<std::streamoff>(offset));
        if (!file_) {
            file_.close();
            return std::unexpected(infra::make_error(infra::ErrorCode::ReadFailed,
                                   fmt::format("Cannot seek {} to byte {}", job_.file_path.string(), offset)));
        }
    }
    return {};
}

auto UploadEngine::fail(infra::Error&& err) -> std::unexpected<infra::Error>
{
    state_ = UploadState::Aborted;
    if (file_.is_open()) {
        file_.close();
    }
    return std::unexpected(std::move(err));
}

void UploadEngine::release_consumed_record()
{
    if (consumed_record_) {
        persistor_.discard(*consumed_record_);
        consumed_record_.reset();
    }
}

} // namespace vaultup::core
