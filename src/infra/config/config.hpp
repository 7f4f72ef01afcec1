#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>

namespace vaultup::args_parser{
    struct CLIArgs;
}

namespace vaultup::infra {

inline constexpr std::uint64_t DEFAULT_CHUNK_SIZE_MB = 128;

struct Config {
    // Удалённая сторона
    std::string account_id = "-";
    std::optional<std::filesystem::path> vault_root;

    // Загрузка
    std::optional<std::uint64_t> chunk_size_mb;
    std::optional<std::filesystem::path> state_dir;   // куда пишутся resume-записи

    // Вывод
    bool verbose = false;
    bool quiet = false;

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);
};

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.vaultup.yaml
///   2. $XDG_CONFIG_HOME/vaultup/config.yaml
///   3. ~/.config/vaultup/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

/// Parses one config file; the file must exist.
[[nodiscard]] auto load_config_from(const std::filesystem::path& path)
    -> std::expected<Config, std::string>;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const vaultup::args_parser::CLIArgs& args) -> Config;

} // namespace vaultup::infra
