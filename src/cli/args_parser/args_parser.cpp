#include "args_parser.hpp"
#include <filesystem>
#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include "core/upload_engine/upload_engine.hpp"

namespace vaultup::args_parser {

namespace {

auto chunk_size_validator() -> CLI::Validator {
    return CLI::Validator(
        [](std::string& input) -> std::string {
            std::uint64_t value = 0;
            if (!CLI::detail::lexical_cast(input, value)) {
                return fmt::format("Illegal chunk size: '{}' is not an integer", input);
            }
            auto valid = core::UploadEngine::validate_chunk_size_mb(value);
            return valid ? std::string{} : valid.error().message;
        },
        "POW2 in [1, 4096]");
}

} // namespace

std::optional<CLIArgs> parse_args(int argc, char const* const* argv)
{
    CLIArgs args;
    std::vector<std::string> positionals;

    CLI::App app{"Upload large files to an archival vault in resumable chunks"};
    app.add_option("args", positionals,
                   "<vault> <path> to start an upload, or <dumpfile> with --resume-from-err")
        ->expected(1, 2);
    app.add_flag("-v,--verbose", args.verbose, "Show more details while uploading");
    app.add_flag("-q,--quiet", args.quiet, "Only report errors");
    app.add_option("-d,--description", args.description,
                   "The description of this file (defaults to the file's name)");
    app.add_option("-s,--chunk-size", args.chunk_size_mb,
                   "The size of each upload part, in megabytes. Must be a power of 2. Defaults to 128.")
        ->check(chunk_size_validator());
    app.add_flag("--resume-from-err", args.resume_from_err,
                 "If the upload exited unexpectedly, set this flag and pass the dumpfile");
    app.add_option("--account-id", args.account_id, "Account that owns the upload");
    app.add_option("--vault-root", args.vault_root, "Root directory of the local vault store");
    app.add_option("--state-dir", args.state_dir, "Directory for resume records");

    try {
        app.parse(argc, argv);
        if (args.resume_from_err && positionals.size() != 1) {
            throw CLI::ValidationError("args", "--resume-from-err takes exactly one <dumpfile>");
        }
        if (!args.resume_from_err && positionals.size() != 2) {
            throw CLI::ValidationError("args", "expected <vault> <path>");
        }
    } catch (const CLI::ParseError& e) {
        (void)app.exit(e);
        return std::nullopt;
    }

    if (args.resume_from_err) {
        args.path = std::filesystem::absolute(positionals[0]).string();
    } else {
        args.vault = positionals[0];
        args.path = std::filesystem::absolute(positionals[1]).string();
        if (!args.description) {
            args.description = std::filesystem::path(args.path).filename().string();
        }
    }
    return args;
}

} // namespace vaultup::args_parser
