#include "secret_store.h"

#include "util.h"

#include "doctest.h"

#include <sys/stat.h>
#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

std::filesystem::path make_temp_root(char const *tag) {
  static std::atomic<int> counter{ 0 };
  auto const id = counter.fetch_add(1, std::memory_order_relaxed);
  return std::filesystem::temp_directory_path() /
         ("skillet-store-test-" + std::string(tag) + "-" + std::to_string(::getpid()) + "-" +
          std::to_string(id)) /
         "secrets";
}

mode_t mode_of(std::filesystem::path const &p) {
  struct stat st{};
  REQUIRE(::stat(p.c_str(), &st) == 0);
  return st.st_mode & 0777;
}

}  // namespace

TEST_CASE("secret_store_encode quotes values that need it") {
  skillet::variable_list const vars{ { "PLAIN", "abc123" },
                                     { "SPACED", "two words" },
                                     { "TRICKY", "a\"b\\c\nd$e#f" },
                                     { "EMPTY", "" } };
  CHECK(skillet::secret_store_encode(vars) ==
        "PLAIN=abc123\n"
        "SPACED=\"two words\"\n"
        "TRICKY=\"a\\\"b\\\\c\\nd$e#f\"\n"
        "EMPTY=\n");
}

TEST_CASE("secret_store_decode reads what encode writes") {
  skillet::variable_list const vars{ { "A", "x y" }, { "B", "q\"\\\n" }, { "C", "plain" } };
  CHECK(skillet::secret_store_decode(skillet::secret_store_encode(vars)) == vars);
}

TEST_CASE("secret_store_decode skips comments and blank lines, last key wins") {
  auto const vars{ skillet::secret_store_decode(
      "# comment\n\nA = 1\nB=\"two\"  # trailing\nA=3\r\n") };
  REQUIRE(vars.size() == 2);
  CHECK(vars[0] == std::pair<std::string, std::string>{ "A", "3" });
  CHECK(vars[1] == std::pair<std::string, std::string>{ "B", "two" });
}

TEST_CASE("secret_store_decode rejects malformed lines") {
  CHECK_THROWS_WITH_AS(skillet::secret_store_decode("A=1\nnot a pair\n"),
                       "line 2: expected key=value",
                       std::runtime_error);
  CHECK_THROWS_AS(skillet::secret_store_decode("=1\n"), std::runtime_error);
  CHECK_THROWS_AS(skillet::secret_store_decode("A=\"open\n"), std::runtime_error);
  CHECK_THROWS_AS(skillet::secret_store_decode("A=\"x\" y\n"), std::runtime_error);
  CHECK_THROWS_AS(skillet::secret_store_decode("A=\"\\t\"\n"), std::runtime_error);
}

TEST_CASE("secret_store writes owner-only files in an owner-only directory") {
  auto const root{ make_temp_root("perm") };
  skillet::scoped_path_cleanup const cleanup{ root.parent_path() };
  skillet::secret_store const store{ root };

  CHECK_FALSE(store.read("creds").has_value());

  store.write("creds", { { "API_KEY", "abc123" } });

  CHECK(mode_of(root) == 0700);
  CHECK(mode_of(store.file_for("creds")) == 0600);

  auto const read_back{ store.read("creds") };
  REQUIRE(read_back.has_value());
  CHECK(*read_back == skillet::variable_list{ { "API_KEY", "abc123" } });
}

TEST_CASE("secret_store rejects path-like collection ids") {
  skillet::secret_store const store{ "/tmp/unused" };
  CHECK_THROWS_AS(static_cast<void>(store.file_for("../etc")), std::invalid_argument);
  CHECK_THROWS_AS(static_cast<void>(store.file_for("a/b")), std::invalid_argument);
  CHECK_THROWS_AS(static_cast<void>(store.file_for("")), std::invalid_argument);
  CHECK(store.file_for("c-1_x") == std::filesystem::path{ "/tmp/unused/c-1_x.env" });
}

TEST_CASE("secret_store persist_missing keeps stored values") {
  auto const root{ make_temp_root("merge") };
  skillet::scoped_path_cleanup const cleanup{ root.parent_path() };
  skillet::secret_store const store{ root };

  store.write("c", { { "API_KEY", "stored" } });
  auto const added{ store.persist_missing("c", { { "API_KEY", "graph" }, { "TOKEN", "t" } }) };
  CHECK(added == 1);

  auto const vars{ store.read("c") };
  REQUIRE(vars.has_value());
  CHECK(*vars == skillet::variable_list{ { "API_KEY", "stored" }, { "TOKEN", "t" } });

  CHECK(store.persist_missing("c", { { "TOKEN", "other" } }) == 0);
}

TEST_CASE("secret_store serializes concurrent writers of one collection") {
  auto const root{ make_temp_root("concurrent") };
  skillet::scoped_path_cleanup const cleanup{ root.parent_path() };
  skillet::secret_store const store{ root };

  std::vector<std::thread> threads;
  for (int i{ 0 }; i < 8; ++i) {
    threads.emplace_back([&store, i] {
      store.persist_missing("shared", { { "KEY_" + std::to_string(i), std::to_string(i) } });
    });
  }
  for (auto &t : threads) { t.join(); }

  auto const vars{ store.read("shared") };
  REQUIRE(vars.has_value());
  CHECK(vars->size() == 8);
}
