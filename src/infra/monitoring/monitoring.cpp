#include "monitoring.hpp"
#include <fmt/core.h>
#include <cstdio>

namespace vaultup::infra {

namespace {

constexpr double BYTES_PER_MB = 1024.0 * 1024.0;

} // namespace

ProgressMonitor::ProgressMonitor(bool enabled, bool quiet)
    : enabled_(enabled && !quiet)
    , start_time_(std::chrono::steady_clock::now())
{}

void ProgressMonitor::set_total(std::uint64_t chunks, std::uint64_t bytes,
                                std::uint64_t already_sent_chunks,
                                std::uint64_t already_sent_bytes) {
    total_chunks_ = chunks;
    total_bytes_ = bytes;
    sent_chunks_ = already_sent_chunks;
    sent_bytes_ = already_sent_bytes;
    bytes_at_start_ = already_sent_bytes;
}

void ProgressMonitor::chunk_sent(std::uint64_t chunk, std::uint64_t sent_bytes) {
    sent_chunks_ = chunk;
    sent_bytes_ = sent_bytes;

    if (!enabled_) return;
    fmt::print("{}\n", format_progress_line(chunk, total_chunks_, sent_bytes, total_bytes_));
    std::fflush(stdout);
}

auto ProgressMonitor::get_stats() const -> Stats {
    return Stats{
        .total_chunks = total_chunks_,
        .sent_chunks = sent_chunks_,
        .total_bytes = total_bytes_,
        .sent_bytes = sent_bytes_,
        .start_time = start_time_
    };
}

auto ProgressMonitor::bytes_per_second() const -> double {
    auto elapsed_sec = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time_).count();
    if (elapsed_sec <= 0.0) return 0.0;
    return static_cast<double>(sent_bytes_ - bytes_at_start_) / elapsed_sec;
}

auto ProgressMonitor::format_progress_line(std::uint64_t chunk,
                                           std::uint64_t total_chunks,
                                           std::uint64_t sent_bytes,
                                           std::uint64_t total_bytes)
    -> std::string
{
    const double percent = total_bytes == 0
        ? 100.0
        : static_cast<double>(sent_bytes) / static_cast<double>(total_bytes) * 100.0;

    return fmt::format("Uploaded chunk {} of {} ({:.2f} MB / {:.2f} MB) [{:.2f}%]",
                       chunk, total_chunks,
                       static_cast<double>(sent_bytes) / BYTES_PER_MB,
                       static_cast<double>(total_bytes) / BYTES_PER_MB,
                       percent);
}

} // namespace vaultup::infra
