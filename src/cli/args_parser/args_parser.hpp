#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>



namespace vaultup::args_parser {
    struct CLIArgs
{
    std::string vault;                          // позиционный: имя хранилища
    std::string path;                           // позиционный: файл или resume-запись
    std::optional<std::string> description;     // -d, --description
    std::optional<std::uint64_t> chunk_size_mb; // -s, --chunk-size=SIZE (MiB)
    bool verbose{false};                        // -v, --verbose
    bool quiet{false};                          // -q, --quiet
    bool resume_from_err{false};                // --resume-from-err
    std::optional<std::string> account_id;      // --account-id
    std::optional<std::string> vault_root;      // --vault-root
    std::optional<std::string> state_dir;       // --state-dir
};



/// Parses command-line arguments and returns a CLIArgs struct.
/// Returns std::nullopt after printing help or a usage error.
std::optional<CLIArgs> parse_args(int argc, char const* const* argv);

} // namespace vaultup::args_parser
