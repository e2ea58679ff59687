#include "cmd_batch.h"

#include "cmd_common.h"
#include "sol_util.h"
#include "tui.h"
#include "util.h"

#include "CLI11.hpp"
#include "tbb/task_group.h"

#include <memory>
#include <stdexcept>
#include <utility>

namespace skillet {

void cmd_batch::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("batch", "Run a file of invocation requests concurrently") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("file", cfg_ptr->requests_path, "Lua file defining REQUESTS")
      ->required()
      ->check(CLI::ExistingFile);
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_batch::cmd_batch(cmd_batch::cfg cfg, cli_globals const &globals)
    : cfg_{ std::move(cfg) }, globals_{ globals } {}

std::vector<invocation_request> cmd_batch_parse(std::string_view script,
                                                std::string_view source_name) {
  auto lua{ sol_util_make_lua_state() };
  sol_util_run_script(*lua, script, "Failed to execute " + std::string{ source_name });

  sol::object const requests{ (*lua)["REQUESTS"] };
  if (requests.get_type() != sol::type::table) {
    throw std::runtime_error(std::string{ source_name } + ": REQUESTS must be a table");
  }

  auto const table{ requests.as<sol::table>() };
  std::vector<invocation_request> result;
  for (std::size_t i{ 1 }, n{ table.size() }; i <= n; ++i) {
    std::string const ctx{ std::string{ source_name } + ": REQUESTS[" + std::to_string(i) +
                           "]" };
    sol::object const entry{ table[i] };
    if (entry.get_type() != sol::type::table) {
      throw std::runtime_error(ctx + " must be a table");
    }
    auto const t{ entry.as<sol::table>() };

    result.push_back(invocation_request{
        .code = sol_util_get_required<std::string>(t, "code", ctx),
        .imports = sol_util_get_string_array(t, "imports", ctx).value_or(
            std::vector<std::string>{}),
        .timeout = sol_util_get_optional<std::int64_t>(t, "timeout", ctx) });
  }
  return result;
}

std::vector<batch_result> cmd_batch_run(invocation_ctx const &ctx,
                                        std::vector<invocation_request> const &requests) {
  std::vector<batch_result> results(requests.size());

  tbb::task_group tg;
  for (std::size_t i{ 0 }; i < requests.size(); ++i) {
    tg.run([&, i]() {
      try {
        auto const response{ invoke(ctx, requests[i]) };
        results[i] = batch_result{ .json = response.to_json(),
                                   .succeeded = response.succeeded() };
      } catch (std::exception const &e) {
        tui::debug("Batch request %zu failed: %s", i + 1, e.what());
        std::string json{ "{\"error\":\"" };
        util_append_json_string(json, e.what());
        json += "\"}";
        results[i] = batch_result{ .json = std::move(json), .succeeded = false };
      }
    });
  }
  tg.wait();

  return results;
}

bool cmd_batch::execute() {
  auto const s{ load_session(globals_) };
  auto const requests{ cmd_batch_parse(util_load_text(cfg_.requests_path),
                                       cfg_.requests_path.string()) };
  tui::debug("Running %zu batch request(s)", requests.size());

  auto const results{ cmd_batch_run(invocation_ctx{ .graph = *s->graph,
                                                    .execution = s->cfg.execution,
                                                    .classifier = s->classifier,
                                                    .store = &s->store },
                                    requests) };

  bool all_succeeded{ true };
  for (auto const &r : results) {
    tui::print_stdout("%s\n", r.json.c_str());
    all_succeeded = all_succeeded && r.succeeded;
  }
  return all_succeeded;
}

}  // namespace skillet
