#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace vaultup::infra {

// Синхронный отчёт о прогрессе: одна строка на каждый подтверждённый чанк
class ProgressMonitor {
public:
    struct Stats {
        std::uint64_t total_chunks = 0;
        std::uint64_t sent_chunks = 0;
        std::uint64_t total_bytes = 0;
        std::uint64_t sent_bytes = 0;
        std::chrono::steady_clock::time_point start_time{};
    };

    explicit ProgressMonitor(bool enabled = false, bool quiet = false);

    // При возобновлении скорость считается только по текущему запуску
    void set_total(std::uint64_t chunks, std::uint64_t bytes,
                   std::uint64_t already_sent_chunks = 0,
                   std::uint64_t already_sent_bytes = 0);

    // chunk и sent_bytes — абсолютные значения, а не приращения
    void chunk_sent(std::uint64_t chunk, std::uint64_t sent_bytes);

    [[nodiscard]] auto get_stats() const -> Stats;
    [[nodiscard]] auto is_enabled() const -> bool { return enabled_; }

    /// Average throughput in bytes per second since construction.
    [[nodiscard]] auto bytes_per_second() const -> double;

    [[nodiscard]] static auto format_progress_line(std::uint64_t chunk,
                                                   std::uint64_t total_chunks,
                                                   std::uint64_t sent_bytes,
                                                   std::uint64_t total_bytes)
        -> std::string;

private:
    std::uint64_t total_chunks_ = 0;
    std::uint64_t total_bytes_ = 0;
    std::uint64_t sent_chunks_ = 0;
    std::uint64_t sent_bytes_ = 0;
    std::uint64_t bytes_at_start_ = 0;

    const bool enabled_;
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace vaultup::infra
