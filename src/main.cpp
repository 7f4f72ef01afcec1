#include <filesystem>
#include <fmt/core.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/hash/xxhash_digest.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/upload_engine/upload_engine.hpp"
#include "adapters/local_vault.hpp"
#include "extensions/state_persistor.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

using ARGS = vaultup::args_parser::CLIArgs;

constexpr auto load_from_cli = vaultup::infra::config_from_cli;
constexpr auto load_config_file = vaultup::infra::load_config_from_file;
constexpr auto args_parser = vaultup::args_parser::parse_args;

static auto
__report_failure(const vaultup::infra::Error& err,
                 const vaultup::core::UploadEngine& engine)
-> int {
    spdlog::error("Upload failed ({}): {}", vaultup::infra::to_string(err.kind()), err.message);
    spdlog::debug("  raised at {}:{} in {}", err.file, err.line, err.function);
    if (const auto& record = engine.last_resume_record()) {
        fmt::print(stderr, "Resume state saved to {}\n", record->string());
        fmt::print(stderr, "Continue with: vaultup --resume-from-err {}\n", record->string());
    }
    return err.to_exit_code();
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        vaultup::infra::install_signal_handler();

        auto args_opt = args_parser(argc, argv);
        if (!args_opt) {
            return 1; // --help или ошибка
        }
        const ARGS& args = *args_opt;

        // 1. Загрузить из файла
        auto config_res = load_config_file();
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error());
            return vaultup::infra::make_error(vaultup::infra::ErrorCode::InvalidConfig,
                                              config_res.error()).to_exit_code();
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        config.merge_with(load_from_cli(args));

        if (config.quiet) {
            spdlog::set_level(spdlog::level::warn);
        } else if (config.verbose) {
            spdlog::set_level(spdlog::level::debug);
        }

        const auto cwd = std::filesystem::current_path();
        const auto vault_root = config.vault_root.value_or(cwd);
        const auto state_dir = config.state_dir.value_or(cwd);

        vaultup::adapters::LocalVaultSession remote(vault_root, config.account_id);
        vaultup::extensions::YamlStatePersistor persistor(state_dir);
        vaultup::infra::ProgressMonitor monitor(config.verbose, config.quiet);
        vaultup::core::UploadEngine engine(remote, persistor, monitor,
                                           &vaultup::infra::XXHashDigest::file_checksum);

        auto start_time = std::chrono::steady_clock::now();

        auto prepared = args.resume_from_err
            ? engine.resume(args.path)
            : engine.start(vaultup::core::UploadRequest{
                  .file_path = args.path,
                  .vault_name = args.vault,
                  .description = args.description.value_or(""),
                  .chunk_size_mb = config.chunk_size_mb.value_or(vaultup::infra::DEFAULT_CHUNK_SIZE_MB)
              });
        if (!prepared) {
            return __report_failure(prepared.error(), engine);
        }

        auto result = engine.run();
        if (!result) {
            return __report_failure(result.error(), engine);
        }

        auto end_time = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

        if (!config.quiet) {
            const auto& job = engine.job();
            fmt::print("Upload successful!\n");
            spdlog::info("Archive id: {}", job.session.session_id);
            spdlog::info("Bytes: {} ({:.2f} MB) in {} chunks",
                         job.file_size, job.file_size / 1024.0 / 1024.0, job.chunk_count);
            spdlog::info("Time elapsed: {:.2f} seconds", duration.count() / 1000.0);
            if (monitor.bytes_per_second() > 0) {
                spdlog::info("Average speed: {:.2f} MB/s", monitor.bytes_per_second() / 1024.0 / 1024.0);
            }
        }

        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
