#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace vaultup::infra {
    void Config::merge_with(const Config& other) {
        if (other.account_id != "-") account_id = other.account_id;
        if (other.vault_root) vault_root = other.vault_root;
        if (other.chunk_size_mb) chunk_size_mb = other.chunk_size_mb;
        if (other.state_dir) state_dir = other.state_dir;
        if (other.verbose) verbose = true;
        if (other.quiet) quiet = true;
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".vaultup.yaml");

        // 2. Глобальный файл
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "vaultup" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "vaultup" / "config.yaml");
            }
        }

        return paths;
    }

    auto load_config_from(const std::filesystem::path& path)
        -> std::expected<Config, std::string>
    {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            Config cfg{};

            if (config["account_id"]) cfg.account_id = config["account_id"].as<std::string>();
            if (config["vault_root"]) cfg.vault_root = config["vault_root"].as<std::string>();
            if (config["chunk_size_mb"]) cfg.chunk_size_mb = config["chunk_size_mb"].as<std::uint64_t>();
            if (config["state_dir"]) cfg.state_dir = config["state_dir"].as<std::string>();
            if (config["verbose"]) cfg.verbose = config["verbose"].as<bool>();
            if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const YAML::Exception& e) {
            return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
        }
    }

    auto load_config_from_file() -> std::expected<Config, std::string> {
        for (const auto& path : get_config_paths()) {
            if (!std::filesystem::exists(path)) continue;
            return load_config_from(path);
        }

        // Файл не найден — возвращаем пустой конфиг (не ошибка!)
        return Config{};
    }

    [[nodiscard]]
    auto config_from_cli(const vaultup::args_parser::CLIArgs& args) -> Config {
        Config cfg{};
        if (args.account_id) cfg.account_id = *args.account_id;
        if (args.vault_root) cfg.vault_root = *args.vault_root;
        cfg.chunk_size_mb = args.chunk_size_mb;
        if (args.state_dir) cfg.state_dir = *args.state_dir;
        cfg.verbose = args.verbose;
        cfg.quiet = args.quiet;
        return cfg;
    }

} // namespace vaultup::infra
