#include "cmd.h"

#include "doctest.h"

#include <type_traits>

namespace {

class test_cmd : public skillet::cmd {
 public:
  struct cfg : skillet::cmd_cfg<test_cmd> {
    int value{ 0 };
  };

  test_cmd(cfg c, skillet::cli_globals const &globals)
      : cfg_{ c }, graph_path_{ globals.graph_path } {}

  bool execute() override { return cfg_.value > 0; }

  std::optional<std::filesystem::path> const &graph_path() const { return graph_path_; }

 private:
  cfg cfg_;
  std::optional<std::filesystem::path> graph_path_;
};

}  // namespace

TEST_CASE("cmd_cfg exposes cmd_t alias") {
  CHECK(std::is_same_v<test_cmd::cfg::cmd_t, test_cmd>);
}

TEST_CASE("cmd factory creates command from cfg and globals") {
  test_cmd::cfg cfg{};
  cfg.value = 1;
  skillet::cli_globals const globals{ .config_path = std::nullopt,
                                      .graph_path = "/tmp/graph.lua",
                                      .log_level_from_cli = false };

  auto cmd{ skillet::cmd::create(cfg, globals) };
  REQUIRE(cmd);
  auto const *typed{ dynamic_cast<test_cmd *>(cmd.get()) };
  REQUIRE(typed);
  CHECK(typed->graph_path() == std::filesystem::path{ "/tmp/graph.lua" });
  CHECK(cmd->execute());
}
