#include "catch2_custom.hpp"

#include <patchgrader/harness/test_spec.hpp>
#include <patchgrader/runtime/docker_cli_runtime.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace patchgrader;

TEST_CASE("Containers run as root without a CPU limit by default") {
    TestSpec spec{.instance_id = "owner__sample-1", .arch = "x86_64"};

    REQUIRE(docker_run_args("pg.eval.x86_64.owner__sample-1:latest", spec, "pg.val.x") ==
            std::vector<std::string>{"run", "-d", "--platform", "linux/x86_64", "--name", "pg.val.x",
                                     "pg.eval.x86_64.owner__sample-1:latest", "tail", "-f", "/dev/null"});
}

TEST_CASE("The spec's user and CPU limit reach docker run") {
    TestSpec spec{.instance_id = "owner__sample-1", .arch = "x86_64"};
    spec.execute_test_as_nonroot = true;
    spec.nano_cpus = 1'500'000'000;

    REQUIRE(docker_run_args("img:latest", spec, "pg.val.x") ==
            std::vector<std::string>{"run", "-d", "--platform", "linux/x86_64", "--name", "pg.val.x", "-u", "nonroot",
                                     "--cpus", "1.5", "img:latest", "tail", "-f", "/dev/null"});

    spec.execute_test_as_nonroot = false;
    spec.nano_cpus = 2'000'000'000;

    REQUIRE(docker_run_args("img:latest", spec, "pg.val.x") ==
            std::vector<std::string>{"run", "-d", "--platform", "linux/x86_64", "--name", "pg.val.x", "--cpus", "2",
                                     "img:latest", "tail", "-f", "/dev/null"});
}
