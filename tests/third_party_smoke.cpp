#include <tbb/global_control.h>
#include <tbb/task_group.h>

#include <atomic>
#include <string>

#include "CLI11.hpp"
#include "semver.hpp"
#include "sol/sol.hpp"

int main() {
    sol::state lua;
    lua.open_libraries(sol::lib::base);
    lua.script("answer = 40 + 2");
    if (lua["answer"].get<int>() != 42) {
        return 1;
    }

    tbb::global_control control(tbb::global_control::max_allowed_parallelism, 2);
    std::atomic<int> ran{0};
    tbb::task_group tg;
    for (int i = 0; i < 4; ++i) {
        tg.run([&ran] { ran.fetch_add(1); });
    }
    tg.wait();
    if (ran.load() != 4) {
        return 1;
    }

    semver::version<> lower;
    semver::version<> upper;
    if (!semver::parse("2.31.0", lower) || !semver::parse("3.0.0", upper) || !(lower < upper)) {
        return 1;
    }

    CLI::App app{"smoke"};
    std::string value;
    app.add_option("--value", value);
    char arg0[] = "smoke";
    char arg1[] = "--value";
    char arg2[] = "ok";
    char *argv[] = {arg0, arg1, arg2};
    app.parse(3, argv);
    if (value != "ok") {
        return 1;
    }

    return 0;
}
