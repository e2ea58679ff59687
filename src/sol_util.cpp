#include "sol_util.h"

#include <stdexcept>

namespace skillet {

sol_state_ptr sol_util_make_lua_state() {
  auto lua{ std::make_unique<sol::state>() };
  lua->open_libraries(sol::lib::base,
                      sol::lib::string,
                      sol::lib::os,
                      sol::lib::math,
                      sol::lib::table,
                      sol::lib::debug);

  // Override error() and assert() to automatically include stack traces
  lua->script(R"lua(
do
  local orig_error = error
  local orig_assert = assert

  _G.error = function(message, level)
    level = (level or 1) + 1
    return orig_error(debug.traceback(tostring(message), level), 0)
  end

  _G.assert = function(condition, message, ...)
    if not condition then
      message = message or "assertion failed"
      return orig_assert(false, debug.traceback(tostring(message), 2))
    end
    return condition, message, ...
  end
end
)lua");

  return lua;
}

void sol_util_run_script(sol::state &lua, std::string_view script, std::string_view context) {
  if (sol::protected_function_result const result{
          lua.safe_script(script, sol::script_pass_on_error) };
      !result.valid()) {
    sol::error err = result;
    throw std::runtime_error(std::string(context) + ": " + err.what());
  }
}

std::optional<std::vector<std::string>> sol_util_get_string_array(
    sol::table const &table,
    std::string_view key,
    std::string_view context) {
  auto const array{ sol_util_get_optional<sol::table>(table, key, context) };
  if (!array) { return std::nullopt; }

  std::vector<std::string> result;
  for (std::size_t i{ 1 }; i <= array->size(); ++i) {
    sol::object const item{ (*array)[i] };
    if (!item.is<std::string>()) {
      throw std::runtime_error(std::string(context) + ": " + std::string(key) + "[" +
                               std::to_string(i) + "] must be a string");
    }
    result.push_back(item.as<std::string>());
  }
  return result;
}

}  // namespace skillet
