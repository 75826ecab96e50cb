#include "CLI/CLI.hpp"
#include "sol/sol.hpp"

#include <string>
#include <string_view>

#include "lua.hpp"

int main() {
    lua_State *L = luaL_newstate();
    if (!L) {
        return 1;
    }
    luaL_openlibs(L);
    if (luaL_dostring(L, "STEPS = { { name = 'smoke', run = 'true' } }") != LUA_OK) {
        lua_close(L);
        return 1;
    }
    lua_close(L);

    sol::state lua;
    lua.open_libraries(sol::lib::base, sol::lib::string);
    auto const result = lua.safe_script("return ('provision'):upper()", sol::script_pass_on_error);
    if (!result.valid() || result.get<std::string>() != "PROVISION") {
        return 1;
    }

    CLI::App app{"smoke"};
    std::string manifest;
    app.add_option("--manifest", manifest);
    char arg0[] = "smoke";
    char arg1[] = "--manifest";
    char arg2[] = "provision.lua";
    char *argv[] = {arg0, arg1, arg2, nullptr};
    try {
        app.parse(3, argv);
    } catch (CLI::ParseError const &) {
        return 1;
    }
    if (std::string_view{manifest} != "provision.lua") {
        return 1;
    }

    return 0;
}
