#include "user/cl_args.hpp"

#include <patchgrader/common/enum_names.hpp>
#include <patchgrader/common/expected.hpp>
#include <patchgrader/harness/env_manager.hpp>
#include <patchgrader/logging.hpp>
#include <patchgrader/runner/image_cache.hpp>

#include "common/terminal_checks.hpp"
#include "user/program_options.hpp"
#include "version.hpp"

#include <argparse/argparse.hpp>
#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace patchgrader {

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), /*unused*/ PATCHGRADER_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    // Add parser arguments
    setup_parser();
}

namespace {

std::size_t parse_positive(const std::string& opt, std::string_view arg_name) {
    std::size_t value{};
    const auto* last = opt.data() + opt.size();
    auto [ptr, err] = std::from_chars(opt.data(), last, value);

    if (err != std::errc{} || ptr != last || value == 0) {
        throw std::invalid_argument(fmt::format("{} must be a positive integer, got {:?}", arg_name, opt));
    }

    return value;
}

template <NamedEnum E>
E parse_choice(const std::string& opt, std::string_view arg_name) {
    auto parsed = enum_from_string<E>(opt);

    if (!parsed) {
        throw std::invalid_argument(
            fmt::format("{} must be one of {}, got {:?}", arg_name, fmt::join(enum_name_list<E>(), ", "), opt));
    }

    return *parsed;
}

} // namespace

void CommandLineArgs::setup_parser() {
    if (auto term_sz = terminal_size(stdout)) {
        arg_parser_.set_usage_max_line_width(term_sz->ws_col * 3 / 4);
    } else {
        constexpr std::size_t DEFAULT_MAX_WIDTH = 80;
        LOG_DEBUG("Failed to get terminal size. Setting max width to 80");
        arg_parser_.set_usage_max_line_width(DEFAULT_MAX_WIDTH);
    }

    arg_parser_.add_description(fmt::format("patchgrader v{}\n"
                                            "Validates benchmark task instances by running their tests "
                                            "before and after the reference patch in containers.",
                                            PATCHGRADER_VERSION_STRING));

    // FIXME: argparse is kind of annoying. Behavior is dependant upon ORDER of chained fn calls.

    // clang-format off
    // Verbatim from argparse.hpp, except replacing `-v` with `-V`
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", PATCHGRADER_VERSION_STRING);
            std::exit(0);
        })
        .help("prints version information and exits");

    {
        // Block to reduce scope of `using enum`

        using enum VerbosityLevel;

        constexpr auto DEFAULT_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(ProgramOptions::DEFAULT_VERBOSITY_LEVEL);
        constexpr auto MAX_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(All);
        constexpr auto MIN_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(Silent);

        constexpr auto MAX_VERBOSITY_INCREASE = MAX_VERBOSITY_VALUE - DEFAULT_VERBOSITY_VALUE;
        constexpr auto MAX_VERBOSITY_DECREASE = DEFAULT_VERBOSITY_VALUE - MIN_VERBOSITY_VALUE;

        arg_parser_.add_argument("-v", "--verbose")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    auto level = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) + 1;

                    if (level > MAX_VERBOSITY_VALUE) {
                        throw std::invalid_argument("Verbosity specification exceeds maximum level");
                    }

                    opts_buffer_.verbosity = static_cast<VerbosityLevel>(level);
                })
            .append()
            .help(fmt::format("Increase verbosity level (up to {}x)", MAX_VERBOSITY_INCREASE));

        arg_parser_.add_argument("-q", "--quiet")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    auto level = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) - 1;

                    if (level < MIN_VERBOSITY_VALUE) {
                        throw std::invalid_argument("Verbosity specification is lower than minimum level");
                    }

                    opts_buffer_.verbosity = static_cast<VerbosityLevel>(level);
                })
            .append()
            .help(fmt::format("Decrease verbosity level (up to {}x)", MAX_VERBOSITY_DECREASE));

        opts_buffer_.verbosity = ProgramOptions::DEFAULT_VERBOSITY_LEVEL;
    }

    arg_parser_.add_argument("-c", "--color")
        .choices("never", "auto", "always")
        .default_value(std::string{"auto"})
        .metavar("WHEN")
        .nargs(1)
        .help("When to use colors")
        .action([this] (const std::string& opt) {
                using enum ProgramOptions::ColorizeOpt;

                if (opt == "never") {
                    opts_buffer_.colorize_option = Never;
                } else if (opt == "auto") {
                    opts_buffer_.colorize_option = Auto;
                } else if (opt == "always") {
                    opts_buffer_.colorize_option = Always;
                }
        });

    // ###### Inputs and outputs

    arg_parser_.add_argument("--input-path")
        .required()
        .metavar("PATH")
        .action([this] (const std::string& opt) { opts_buffer_.input_path = opt; })
        .help("A JSONL file, or a directory of JSONL files, with task instances");

    arg_parser_.add_argument("--run-id")
        .required()
        .metavar("ID")
        .action([this] (const std::string& opt) { opts_buffer_.run_id = opt; })
        .help("Identifies the run; names the per-instance log directory");

    arg_parser_.add_argument("--validated-dir")
        .required()
        .metavar("DIR")
        .action([this] (const std::string& opt) { opts_buffer_.validated_dir = opt; })
        .help("Where instances with at least one fail-to-pass test are written");

    arg_parser_.add_argument("--pre-validated-dir")
        .required()
        .metavar("DIR")
        .action([this] (const std::string& opt) { opts_buffer_.pre_validated_dir = opt; })
        .help("Where every instance is written along with its test transitions");

    arg_parser_.add_argument("--state-output-path")
        .default_value(std::string{ProgramOptions::DEFAULT_STATE_OUTPUT_PATH})
        .metavar("DIR")
        .action([this] (const std::string& opt) { opts_buffer_.state_output_path = opt; })
        .help("Directory receiving one failure-mode state file per repository");

    arg_parser_.add_argument("--overwrite")
        .flag()
        .store_into(opts_buffer_.overwrite)
        .help("Validate again files that already have validated output");

    arg_parser_.add_argument("--log-root")
        .default_value(std::string{ProgramOptions::DEFAULT_LOG_ROOT})
        .metavar("DIR")
        .action([this] (const std::string& opt) { opts_buffer_.log_root = opt; })
        .help("Root of the per-instance log directories");

    // ###### Execution

    arg_parser_.add_argument("--max-workers")
        .default_value(std::to_string(ProgramOptions::DEFAULT_MAX_WORKERS))
        .metavar("N")
        .action([this] (const std::string& opt) { opts_buffer_.max_workers = parse_positive(opt, "--max-workers"); })
        .help("Maximum number of instances validated at once (should be <= 75% of CPU cores)");

    arg_parser_.add_argument("--open-file-limit")
        .default_value(std::to_string(ProgramOptions::DEFAULT_OPEN_FILE_LIMIT))
        .metavar("N")
        .action([this] (const std::string& opt) {
                opts_buffer_.open_file_limit = parse_positive(opt, "--open-file-limit");
        })
        .help("Open file limit to raise the process to");

    arg_parser_.add_argument("--timeout")
        .default_value(std::to_string(ProgramOptions::DEFAULT_TIMEOUT_SECONDS))
        .metavar("SECONDS")
        .action([this] (const std::string& opt) {
                opts_buffer_.timeout = std::chrono::seconds{parse_positive(opt, "--timeout")};
        })
        .help("Timeout for each test run of an instance");

    arg_parser_.add_argument("--docker")
        .default_value(std::string{ProgramOptions::DEFAULT_DOCKER_BINARY})
        .metavar("BINARY")
        .action([this] (const std::string& opt) { opts_buffer_.docker = opt; })
        .help("docker client to drive containers with");

    // ###### Images

    arg_parser_.add_argument("--force-rebuild")
        .flag()
        .store_into(opts_buffer_.force_rebuild)
        .help("Rebuild instance images even if they exist");

    arg_parser_.add_argument("--cache-level")
        .default_value(std::string{enum_to_string(CacheLevel::Env)})
        .metavar("LEVEL")
        .action([this] (const std::string& opt) {
                opts_buffer_.cache_level = parse_choice<CacheLevel>(opt, "--cache-level");
        })
        .help(fmt::format("Remove images above this level once done. One of: {}",
                          fmt::join(enum_name_list<CacheLevel>(), ", ")));

    arg_parser_.add_argument("--clean")
        .flag()
        .store_into(opts_buffer_.clean)
        .help("Also remove images above the cache level that existed before the run");

    // ###### Environments and repositories

    arg_parser_.add_argument("--repo-config-dir")
        .default_value(std::string{ProgramOptions::DEFAULT_REPO_CONFIG_DIR})
        .metavar("DIR")
        .action([this] (const std::string& opt) { opts_buffer_.repo_config_dir = opt; })
        .help("Directory of <repo_name>.json build configs (and _default.json)");

    arg_parser_.add_argument("--env-manager")
        .default_value(std::string{enum_to_string(EnvManagerKind::Conda)})
        .metavar("NAME")
        .action([this] (const std::string& opt) {
                opts_buffer_.env_manager = parse_choice<EnvManagerKind>(opt, "--env-manager");
        })
        .help(fmt::format("Environment manager used inside containers. One of: {}",
                          fmt::join(enum_name_list<EnvManagerKind>(), ", ")));

    arg_parser_.add_argument("--python-version")
        .default_value(std::string{ProgramOptions::DEFAULT_PYTHON_VERSION})
        .metavar("VERSION")
        .action([this] (const std::string& opt) { opts_buffer_.python_version = opt; })
        .help("Interpreter version for environments whose build spec does not name one");

    arg_parser_.add_argument("--instance-repos-dir")
        .metavar("DIR")
        .action([this] (const std::string& opt) { opts_buffer_.instance_repos_dir = opt; })
        .help("Pre-fetched checkouts, one repo__<instance_id> per instance");

    arg_parser_.add_argument("--local-repos-dir")
        .metavar("DIR")
        .action([this] (const std::string& opt) { opts_buffer_.local_repos_dir = opt; })
        .help("Local mirrors cloned instead of GitHub");

    arg_parser_.add_argument("--local-pip-dir")
        .metavar("DIR")
        .action([this] (const std::string& opt) { opts_buffer_.local_pip_dir = opt; })
        .help("Offline wheel directory that every pip install is pointed at");

    arg_parser_.add_argument("--local-channel-dir")
        .metavar("DIR")
        .action([this] (const std::string& opt) { opts_buffer_.local_channel_dir = opt; })
        .help("Offline conda channel directory");
    // clang-format on
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    try {
        arg_parser_.parse_args(args_);
    } catch (const std::exception& err) {
        return err.what();
    }

    if (auto valid = opts_buffer_.validate(); !valid) {
        return valid.error();
    }

    LOG_DEBUG("Parsed CLI arguments: {}", opts_buffer_);

    return opts_buffer_;
}

std::string CommandLineArgs::help_message() const {
    return arg_parser_.help().str();
}

std::string CommandLineArgs::usage_message() const {
    return arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs cl_args{args};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::print("{}\n{}\n", fmt::styled(opts_res.error(), fg(fmt::color::red)), cl_args.usage_message());
        std::exit(exit_code);
    }

    return opts_res.value();
}

} // namespace patchgrader
