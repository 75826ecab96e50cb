#include "sol_util.h"

namespace provision {

sol_state_ptr sol_util_make_lua_state() {
  auto lua{ std::make_unique<sol::state>() };
  lua->open_libraries(sol::lib::base,
                      sol::lib::string,
                      sol::lib::table,
                      sol::lib::math,
                      sol::lib::os);
  return lua;
}

std::string sol_util_type_name(sol::type t) {
  switch (t) {
    case sol::type::none:
    case sol::type::lua_nil: return "nil";
    case sol::type::boolean: return "boolean";
    case sol::type::number: return "number";
    case sol::type::string: return "string";
    case sol::type::table: return "table";
    case sol::type::function: return "function";
    default: return "userdata";
  }
}

}  // namespace provision
