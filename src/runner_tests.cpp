#include "runner.h"

#include "errors.h"

#include "doctest.h"

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::filesystem::path make_temp_root(char const *tag) {
  static std::atomic<int> counter{ 0 };
  auto const id = counter.fetch_add(1, std::memory_order_relaxed);
  return std::filesystem::temp_directory_path() /
         ("skillet-runner-test-" + std::string(tag) + "-" + std::to_string(::getpid()) + "-" +
          std::to_string(id));
}

skillet::process_spec sh_spec(std::string const &script,
                              std::chrono::milliseconds timeout = std::chrono::seconds{ 10 },
                              std::size_t output_limit = 1 << 20) {
  return skillet::process_spec{ .argv = { "/bin/sh", "-c", script },
                                .env = { { "PATH", "/usr/bin:/bin" } },
                                .cwd = std::filesystem::temp_directory_path(),
                                .timeout = timeout,
                                .output_limit = output_limit,
                                .memory_limit_mb = std::nullopt,
                                .cpu_limit_s = std::nullopt };
}

skillet::execution_cfg sh_cfg(std::filesystem::path const &work_root) {
  skillet::execution_cfg cfg;
  cfg.work_root = work_root;
  cfg.install_timeout = 10;
  cfg.interpreter = { "/bin/sh", "{script}" };
  return cfg;
}

skillet::run_request sh_request(std::string artifact) {
  return skillet::run_request{ .artifact = std::move(artifact),
                               .packages = {},
                               .python = ">=3.12",
                               .env = { { "PATH", "/usr/bin:/bin" } },
                               .timeout = std::chrono::seconds{ 10 } };
}

bool directory_is_empty(std::filesystem::path const &dir) {
  return std::filesystem::directory_iterator{ dir } == std::filesystem::directory_iterator{};
}

}  // namespace

TEST_CASE("run_process captures stdout, stderr and exit code") {
  auto const r{ skillet::run_process(sh_spec("echo out; echo err >&2; exit 3"), "test") };
  CHECK_FALSE(r.timed_out);
  REQUIRE(r.exit_code.has_value());
  CHECK(*r.exit_code == 3);
  CHECK(r.out.text == "out\n");
  CHECK(r.err.text == "err\n");
  CHECK_FALSE(r.out.truncated());
}

TEST_CASE("run_process passes only the given environment") {
  auto spec{ sh_spec("printf '%s|%s' \"$SKILLET_RUNNER_VAR\" \"${HOME-unset}\"") };
  spec.env["SKILLET_RUNNER_VAR"] = "visible";
  auto const r{ skillet::run_process(spec, "test") };
  CHECK(r.out.text == "visible|unset");
}

TEST_CASE("run_process runs in the requested directory with stdin closed") {
  auto const root{ make_temp_root("cwd") };
  std::filesystem::create_directories(root);
  skillet::scoped_path_cleanup const cleanup{ root };

  auto spec{ sh_spec("pwd; cat; echo done") };
  spec.cwd = root;
  auto const r{ skillet::run_process(spec, "test") };
  CHECK(r.out.text ==
        std::filesystem::canonical(root).string() + "\ndone\n");
}

TEST_CASE("run_process bounds captured output per stream") {
  auto const r{ skillet::run_process(
      sh_spec("printf abcdefghijklmnopqrstuvwxyz; printf 0123 >&2", std::chrono::seconds{ 10 }, 10),
      "test") };
  CHECK(r.out.text == "abcdefghij");
  CHECK(r.out.dropped == 16);
  CHECK(r.out.truncated());
  CHECK(r.err.text == "0123");
  CHECK_FALSE(r.err.truncated());
}

TEST_CASE("run_process kills the process group on timeout") {
  auto const start{ std::chrono::steady_clock::now() };
  auto const r{ skillet::run_process(
      sh_spec("echo started; sleep 30 & sleep 30", std::chrono::milliseconds{ 300 }), "test") };
  auto const elapsed{ std::chrono::steady_clock::now() - start };

  CHECK(r.timed_out);
  CHECK_FALSE(r.exit_code.has_value());
  CHECK(r.out.text == "started\n");
  CHECK(elapsed < std::chrono::seconds{ 10 });
}

TEST_CASE("run_process enforces the timeout after the child closes its output") {
  auto const start{ std::chrono::steady_clock::now() };
  auto const r{ skillet::run_process(
      sh_spec("exec >/dev/null 2>&1; sleep 5", std::chrono::milliseconds{ 1000 }), "test") };
  auto const elapsed{ std::chrono::steady_clock::now() - start };

  CHECK(r.timed_out);
  CHECK_FALSE(r.exit_code.has_value());
  CHECK(elapsed < std::chrono::milliseconds{ 4000 });
}

TEST_CASE("run_process reports signalled children as 128 plus signal") {
  auto const r{ skillet::run_process(sh_spec("kill -9 $$"), "test") };
  REQUIRE(r.exit_code.has_value());
  CHECK(*r.exit_code == 137);
}

TEST_CASE("run_process resolves the program against PATH in the environment") {
  skillet::process_spec spec{ sh_spec("") };
  spec.argv = { "sh", "-c", "echo found" };
  CHECK(skillet::run_process(spec, "test").out.text == "found\n");

  spec.argv = { "skillet-no-such-program-here" };
  auto const missing{ skillet::run_process(spec, "test") };
  REQUIRE(missing.exit_code.has_value());
  CHECK(*missing.exit_code == 127);
}

TEST_CASE("run_process rejects an empty argv") {
  auto spec{ sh_spec("") };
  spec.argv.clear();
  CHECK_THROWS_AS(skillet::run_process(spec, "test"), std::invalid_argument);
}

TEST_CASE("run_process applies the address space limit") {
  auto spec{ sh_spec("ulimit -v") };
  spec.memory_limit_mb = 512;
  auto const r{ skillet::run_process(spec, "test") };
  CHECK(r.out.text == "524288\n");
}

TEST_CASE("runner_expand_template substitutes placeholders") {
  std::map<std::string, std::string> const vars{ { "python", ">=3.12" },
                                                 { "venv", "/s/venv" },
                                                 { "script", "/s/artifact.py" } };
  std::vector<std::string> const packages{ "requests>=2", "rich" };

  CHECK(skillet::runner_expand_template(
            { "uv", "pip", "install", "--python", "{venv}/bin/python", "{packages}" },
            vars,
            packages) == std::vector<std::string>{ "uv",
                                                   "pip",
                                                   "install",
                                                   "--python",
                                                   "/s/venv/bin/python",
                                                   "requests>=2",
                                                   "rich" });
  CHECK(skillet::runner_expand_template({ "--python={python}", "{unknown}" }, vars, {}) ==
        std::vector<std::string>{ "--python=>=3.12", "{unknown}" });
  CHECK(skillet::runner_expand_template({ "{packages}" }, vars, {}).empty());
}

TEST_CASE("sandbox_run executes the artifact and removes its scratch directory") {
  auto const root{ make_temp_root("run") };
  skillet::scoped_path_cleanup const cleanup{ root };
  auto const cfg{ sh_cfg(root / "work") };

  skillet::sandbox_run run{ cfg };
  CHECK(run.status() == skillet::run_status::pending);

  auto const outcome{ run.execute(sh_request("case \"$(pwd)\" in */run-*) echo scratch;; esac\n"
                                             "test -f artifact.py && echo artifact\n")) };
  CHECK(outcome.status == skillet::run_status::succeeded);
  CHECK(run.status() == skillet::run_status::succeeded);
  REQUIRE(outcome.exit_code.has_value());
  CHECK(*outcome.exit_code == 0);
  CHECK(outcome.out.text == "scratch\nartifact\n");
  CHECK(directory_is_empty(root / "work"));
}

TEST_CASE("sandbox_run reports failure and timeout states") {
  auto const root{ make_temp_root("states") };
  skillet::scoped_path_cleanup const cleanup{ root };
  auto const cfg{ sh_cfg(root / "work") };

  SUBCASE("non-zero exit") {
    skillet::sandbox_run run{ cfg };
    auto const outcome{ run.execute(sh_request("echo boom >&2; exit 4\n")) };
    CHECK(outcome.status == skillet::run_status::failed);
    REQUIRE(outcome.exit_code.has_value());
    CHECK(*outcome.exit_code == 4);
    CHECK(outcome.err.text == "boom\n");
  }

  SUBCASE("timeout") {
    skillet::sandbox_run run{ cfg };
    auto req{ sh_request("sleep 30\n") };
    req.timeout = std::chrono::seconds{ 1 };
    auto const outcome{ run.execute(req) };
    CHECK(outcome.status == skillet::run_status::timed_out);
    CHECK_FALSE(outcome.exit_code.has_value());
  }
}

TEST_CASE("sandbox_run executes only once") {
  auto const root{ make_temp_root("once") };
  skillet::scoped_path_cleanup const cleanup{ root };
  auto const cfg{ sh_cfg(root / "work") };

  skillet::sandbox_run run{ cfg };
  static_cast<void>(run.execute(sh_request("true\n")));
  CHECK_THROWS_AS(run.execute(sh_request("true\n")), std::logic_error);
  CHECK(run.status() == skillet::run_status::succeeded);
}

TEST_CASE("sandbox_run skips install when there are no packages") {
  auto const root{ make_temp_root("noinstall") };
  skillet::scoped_path_cleanup const cleanup{ root };
  auto cfg{ sh_cfg(root / "work") };
  cfg.install = { "/bin/sh", "-c", "exit 9" };

  skillet::sandbox_run run{ cfg };
  CHECK(run.execute(sh_request("echo ok\n")).status == skillet::run_status::succeeded);
}

TEST_CASE("sandbox_run runs provision and install with the package list") {
  auto const root{ make_temp_root("install") };
  skillet::scoped_path_cleanup const cleanup{ root };
  auto cfg{ sh_cfg(root / "work") };
  cfg.provision = { "/bin/sh", "-c", "mkdir \"$1\"", "provision", "{venv}" };
  cfg.install = { "/bin/sh", "-c", "echo \"$@\" > \"$0/installed\"", "{venv}", "{packages}" };

  auto req{ sh_request("cat venv/installed; echo \"$UV_CACHE_DIR\" | grep -q cache && echo "
                       "no-cache-leak || echo clean\n") };
  req.packages = { "requests>=2", "rich" };

  skillet::sandbox_run run{ cfg };
  auto const outcome{ run.execute(req) };
  CHECK(outcome.status == skillet::run_status::succeeded);
  CHECK(outcome.out.text == "requests>=2 rich\nclean\n");
}

TEST_CASE("sandbox_run raises dependency_install_error when install fails") {
  auto const root{ make_temp_root("installfail") };
  skillet::scoped_path_cleanup const cleanup{ root };
  auto cfg{ sh_cfg(root / "work") };
  cfg.install = { "/bin/sh", "-c", "echo 'no matching distribution' >&2; exit 1" };

  auto req{ sh_request("echo never\n") };
  req.packages = { "nonexistent-package" };

  skillet::sandbox_run run{ cfg };
  try {
    static_cast<void>(run.execute(req));
    FAIL("expected dependency_install_error");
  } catch (skillet::dependency_install_error const &e) {
    CHECK(std::string{ e.what() }.find("exit code 1") != std::string::npos);
    CHECK(e.stderr_text == "no matching distribution\n");
  }
  CHECK(run.status() == skillet::run_status::failed);
  CHECK(directory_is_empty(root / "work"));
}
