#pragma once

#include "sol/sol.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace provision {

using sol_state_ptr = std::unique_ptr<sol::state>;

// Fresh state with the libraries a manifest may use: base, string, table, math, os.
sol_state_ptr sol_util_make_lua_state();

std::string sol_util_type_name(sol::type t);

template <typename T>
constexpr char const *sol_util_expected_name() {
  if constexpr (std::is_same_v<T, bool>) {
    return "boolean";
  } else if constexpr (std::is_same_v<T, std::string>) {
    return "string";
  } else if constexpr (std::is_same_v<T, sol::table>) {
    return "table";
  } else {
    static_assert(std::is_arithmetic_v<T>, "unsupported manifest field type");
    return "number";
  }
}

// nullopt when the key is absent or nil. Throws std::runtime_error
// "<context>: <key> must be a <expected>, got <actual>" on a type mismatch.
template <typename T>
std::optional<T> sol_util_field(sol::table const &table,
                                std::string_view key,
                                std::string const &context) {
  sol::object const value = table[key];
  if (value.get_type() == sol::type::lua_nil || value.get_type() == sol::type::none) {
    return std::nullopt;
  }
  if (!value.is<T>()) {
    throw std::runtime_error(context + ": " + std::string{ key } + " must be a " +
                             sol_util_expected_name<T>() + ", got " +
                             sol_util_type_name(value.get_type()));
  }
  return value.as<T>();
}

template <typename T>
T sol_util_required_field(sol::table const &table,
                          std::string_view key,
                          std::string const &context) {
  if (auto v{ sol_util_field<T>(table, key, context) }) { return std::move(*v); }
  throw std::runtime_error(context + ": " + std::string{ key } + " is required");
}

}  // namespace provision
