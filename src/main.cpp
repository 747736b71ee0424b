#include <patchgrader/common/linux.hpp>
#include <patchgrader/logging.hpp>
#include <patchgrader/runtime/docker_cli_runtime.hpp>

#include "app/trace_exception.hpp"
#include "app/validator_app.hpp"
#include "output/stdout_sink.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <cstdio>
#include <exception>
#include <span>
#include <string>
#include <string_view>

#include <sys/resource.h>

namespace {

void handle_exception(std::string_view what) {
    patchgrader::trace_exception(fmt::format("{} (caught in main)", what));
}

/// Every worker holds pipes and log files open, so the soft limit is usually too low
void raise_open_file_limit(std::size_t limit) {
    auto current = patchgrader::linux::getrlimit(RLIMIT_NOFILE);
    if (!current) {
        LOG_WARN("Could not query the open file limit: {}", current.error().message());
        return;
    }

    auto wanted = static_cast<rlim_t>(limit);
    struct ::rlimit new_limit{.rlim_cur = wanted, .rlim_max = wanted};

    if (current->rlim_max != RLIM_INFINITY && current->rlim_max < wanted) {
        LOG_WARN("Open file limit {} exceeds the hard limit {}; using the hard limit", wanted, current->rlim_max);
        new_limit = {.rlim_cur = current->rlim_max, .rlim_max = current->rlim_max};
    }

    if (auto res = patchgrader::linux::setrlimit(RLIMIT_NOFILE, new_limit); !res) {
        LOG_WARN("Could not raise the open file limit to {}: {}", new_limit.rlim_cur, res.error().message());
        return;
    }

    LOG_DEBUG("Open file limit set to {}", new_limit.rlim_cur);
}

} // namespace

int main(int argc, const char* argv[]) {
    using namespace patchgrader;

    init_loggers();

    try {
        std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

        const ProgramOptions options = parse_args_or_exit(args);

        LOG_DEBUG("Options: {}", options);

        raise_open_file_limit(options.open_file_limit);

        DockerCliRuntime runtime{DockerCliOptions{.docker_binary = options.docker}};
        StdoutSink output_sink;

        ValidatorApp app{options, runtime, output_sink};

        return app.run();
    } catch (const std::exception& ex) {
        handle_exception(ex.what());
    } catch (...) {
        handle_exception("(unknown - not derived from std::exception)");
    }

    return 1;
}
