// LuaSandbox.cpp
//
// Lua C functions in this file avoid holding C++ objects with destructors
// across calls that may raise a Lua error, and keep C++ exceptions from
// unwinding through Lua frames.
#include "LuaSandbox.hpp"
#include "Log.hpp"
#include <lua.hpp>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <new>

namespace MidiFlow {

namespace {

constexpr int kHookInstructionCount = 1000;
constexpr size_t kReadFileLimit = 1024 * 1024;
constexpr size_t kMaxLogLines = 256;
constexpr const char* kReserved[] = {"event", "node", "context"};

struct SandboxState {
    const ScriptInvocation* invocation = nullptr;
    ScriptResult* result = nullptr;
    std::chrono::steady_clock::time_point deadline;
    size_t memoryUsed = 0;
    size_t memoryLimit = 0;
    bool timedOut = false;
};

SandboxState& stateOf(lua_State* L) {
    return **static_cast<SandboxState**>(lua_getextraspace(L));
}

void* sandboxAlloc(void* ud, void* ptr, size_t osize, size_t nsize) {
    auto* state = static_cast<SandboxState*>(ud);
    const size_t old = ptr ? osize : 0;
    if (nsize == 0) {
        std::free(ptr);
        state->memoryUsed -= old;
        return nullptr;
    }
    if (nsize > old && state->memoryUsed - old + nsize > state->memoryLimit) return nullptr;
    void* p = std::realloc(ptr, nsize);
    if (p) state->memoryUsed = state->memoryUsed - old + nsize;
    return p;
}

void deadlineHook(lua_State* L, lua_Debug*) {
    SandboxState& state = stateOf(L);
    if (state.timedOut || std::chrono::steady_clock::now() >= state.deadline) {
        state.timedOut = true;
        luaL_error(L, "script exceeded its %d ms time limit", state.invocation->timeoutMs);
    }
}

// pcall that cannot swallow the timeout error
int sandboxPcall(lua_State* L) {
    luaL_checkany(L, 1);
    const int status = lua_pcall(L, lua_gettop(L) - 1, LUA_MULTRET, 0);
    if (stateOf(L).timedOut) {
        if (status == LUA_OK) lua_pushliteral(L, "script timed out");
        return lua_error(L);
    }
    lua_pushboolean(L, status == LUA_OK);
    lua_insert(L, 1);
    return lua_gettop(L);
}

// Lua runs __gc finalizers with hooks disabled, so a finalizer would escape
// the deadline. Objects are only marked for finalization here, when the
// metatable is set.
int sandboxSetmetatable(lua_State* L) {
    const int t = lua_type(L, 2);
    luaL_checktype(L, 1, LUA_TTABLE);
    luaL_argexpected(L, t == LUA_TNIL || t == LUA_TTABLE, 2, "nil or table");
    if (t == LUA_TTABLE) {
        lua_pushliteral(L, "__gc");
        const bool hasGc = lua_rawget(L, 2) != LUA_TNIL;
        lua_pop(L, 1);
        if (hasGc) return luaL_error(L, "__gc metamethods are not available to scripts");
    }
    if (luaL_getmetafield(L, 1, "__metatable") != LUA_TNIL) return luaL_error(L, "cannot change a protected metatable");
    lua_settop(L, 2);
    lua_setmetatable(L, 1);
    return 1;
}

// ---------------------------------------------------------------------------
// Read-only tables
// ---------------------------------------------------------------------------

int readOnlyNewIndex(lua_State* L) {
    return luaL_error(L, "attempt to modify a read-only table");
}

int proxyNext(lua_State* L) {
    luaL_checktype(L, 1, LUA_TTABLE);
    lua_settop(L, 2);
    if (lua_next(L, 1)) return 2;
    lua_pushnil(L);
    return 1;
}

int proxyPairs(lua_State* L) {
    lua_pushcfunction(L, proxyNext);
    lua_pushvalue(L, lua_upvalueindex(1));
    lua_pushnil(L);
    return 3;
}

int proxyLen(lua_State* L) {
    lua_pushinteger(L, static_cast<lua_Integer>(lua_rawlen(L, lua_upvalueindex(1))));
    return 1;
}

// Replaces the table on top of the stack with a read-only proxy of it
void makeReadOnly(lua_State* L) {
    const int data = lua_gettop(L);
    lua_newtable(L);
    lua_newtable(L);
    lua_pushvalue(L, data);
    lua_setfield(L, -2, "__index");
    lua_pushcfunction(L, readOnlyNewIndex);
    lua_setfield(L, -2, "__newindex");
    lua_pushvalue(L, data);
    lua_pushcclosure(L, proxyPairs, 1);
    lua_setfield(L, -2, "__pairs");
    lua_pushvalue(L, data);
    lua_pushcclosure(L, proxyLen, 1);
    lua_setfield(L, -2, "__len");
    lua_pushliteral(L, "read-only");
    lua_setfield(L, -2, "__metatable");
    lua_setmetatable(L, -2);
    lua_replace(L, data);
}

void pushJson(lua_State* L, const nlohmann::json& j) {
    switch (j.type()) {
        case nlohmann::json::value_t::boolean: lua_pushboolean(L, j.get<bool>()); break;
        case nlohmann::json::value_t::number_integer: lua_pushinteger(L, j.get<lua_Integer>()); break;
        case nlohmann::json::value_t::number_unsigned: lua_pushinteger(L, static_cast<lua_Integer>(j.get<unsigned long long>())); break;
        case nlohmann::json::value_t::number_float: lua_pushnumber(L, j.get<double>()); break;
        case nlohmann::json::value_t::string: {
            const auto& s = j.get_ref<const std::string&>();
            lua_pushlstring(L, s.data(), s.size());
            break;
        }
        case nlohmann::json::value_t::array: {
            lua_createtable(L, static_cast<int>(j.size()), 0);
            lua_Integer i = 1;
            for (const auto& item : j) {
                pushJson(L, item);
                lua_rawseti(L, -2, i++);
            }
            makeReadOnly(L);
            break;
        }
        case nlohmann::json::value_t::object: {
            lua_createtable(L, 0, static_cast<int>(j.size()));
            for (auto it = j.begin(); it != j.end(); ++it) {
                pushJson(L, it.value());
                lua_setfield(L, -2, it.key().c_str());
            }
            makeReadOnly(L);
            break;
        }
        default: lua_pushnil(L); break;
    }
}

void pushValue(lua_State* L, const Value& v) {
    if (auto* d = std::get_if<double>(&v)) lua_pushnumber(L, *d);
    else if (auto* s = std::get_if<std::string>(&v)) lua_pushlstring(L, s->data(), s->size());
    else lua_pushnil(L);
}

// ---------------------------------------------------------------------------
// context
// ---------------------------------------------------------------------------

// Returns false when the line could not be stored
bool recordLog(SandboxState& state, const char* text, size_t len) {
    if (state.result->logs.size() >= kMaxLogLines) return true;
    try {
        state.result->logs.emplace_back(text, len);
        MIDIFLOW_INFO("script node {}: {}", state.invocation->nodeId, state.result->logs.back());
    } catch (const std::bad_alloc&) {
        return false;
    }
    return true;
}

int contextLog(lua_State* L) {
    const int n = lua_gettop(L);
    luaL_Buffer b;
    luaL_buffinit(L, &b);
    for (int i = 1; i <= n; ++i) {
        if (i > 1) luaL_addchar(&b, ' ');
        luaL_tolstring(L, i, nullptr);
        luaL_addvalue(&b);
    }
    luaL_pushresult(&b);
    size_t len = 0;
    const char* text = lua_tolstring(L, -1, &len);
    if (!recordLog(stateOf(L), text, len)) return luaL_error(L, "not enough memory");
    return 0;
}

int contextNow(lua_State* L) {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    lua_pushnumber(L, std::chrono::duration<double>(now).count());
    return 1;
}

bool isWithin(const std::filesystem::path& root, const std::filesystem::path& candidate) {
    auto r = root.begin();
    auto c = candidate.begin();
    for (; r != root.end(); ++r, ++c) {
        if (r->empty()) continue; // trailing separator
        if (c == candidate.end() || *r != *c) return false;
    }
    return true;
}

// Copies at most `capacity` bytes of an allowed regular file into `dest`.
// Returns nullptr on success, otherwise a static error message.
const char* readAllowedFile(const SandboxState& state, const char* requested, char* dest, size_t capacity,
                            size_t& length) {
    namespace fs = std::filesystem;
    try {
        std::error_code ec;
        const fs::path target = fs::weakly_canonical(fs::absolute(requested, ec), ec);
        if (ec) return "cannot resolve path";
        bool allowed = false;
        for (const auto& dir : state.invocation->allowedPaths) {
            std::error_code dirEc;
            const fs::path root = fs::weakly_canonical(fs::absolute(dir, dirEc), dirEc);
            if (!dirEc && isWithin(root, target)) {
                allowed = true;
                break;
            }
        }
        if (!allowed) return "path is outside the allowed directories";
        // FIFOs and devices would block outside the VM where the deadline hook cannot fire
        if (!fs::is_regular_file(target, ec)) return "not a regular file";
        std::ifstream in(target, std::ios::binary);
        if (!in) return "cannot open file";
        in.read(dest, static_cast<std::streamsize>(capacity));
        length = static_cast<size_t>(in.gcount());
        return nullptr;
    } catch (const std::exception&) {
        return "cannot read file";
    }
}

int contextReadFile(lua_State* L) {
    const char* requested = luaL_checkstring(L, 1);
    luaL_Buffer b;
    char* dest = luaL_buffinitsize(L, &b, kReadFileLimit);
    size_t length = 0;
    if (const char* error = readAllowedFile(stateOf(L), requested, dest, kReadFileLimit, length)) {
        lua_pushnil(L);
        lua_pushstring(L, error);
        return 2;
    }
    luaL_pushresultsize(&b, length);
    return 1;
}

// ---------------------------------------------------------------------------
// Environment
// ---------------------------------------------------------------------------

int envNewIndex(lua_State* L) {
    if (lua_type(L, 2) == LUA_TSTRING) {
        const char* key = lua_tostring(L, 2);
        for (const char* reserved : kReserved) {
            if (std::strcmp(key, reserved) == 0) return luaL_error(L, "'%s' is read-only", key);
        }
    }
    lua_rawset(L, 1);
    return 0;
}

// Builds the globals table and leaves the chunk environment on the stack.
// Runs under lua_pcall so allocation failures are reported, not fatal.
int setupEnvironment(lua_State* L) {
    const ScriptInvocation& inv = *stateOf(L).invocation;

    const luaL_Reg libs[] = {
        {LUA_GNAME, luaopen_base},
        {LUA_TABLIBNAME, luaopen_table},
        {LUA_STRLIBNAME, luaopen_string},
        {LUA_MATHLIBNAME, luaopen_math},
        {LUA_UTF8LIBNAME, luaopen_utf8},
    };
    for (const auto& lib : libs) {
        luaL_requiref(L, lib.name, lib.func, 1);
        lua_pop(L, 1);
    }

    lua_pushglobaltable(L);
    const int globals = lua_gettop(L);
    for (const char* name : {"dofile", "loadfile", "load", "require", "collectgarbage", "rawset", "xpcall", "warn"}) {
        lua_pushnil(L);
        lua_setfield(L, globals, name);
    }
    lua_pushcfunction(L, sandboxPcall);
    lua_setfield(L, globals, "pcall");
    lua_pushcfunction(L, sandboxSetmetatable);
    lua_setfield(L, globals, "setmetatable");
    lua_pushcfunction(L, contextLog);
    lua_setfield(L, globals, "print");
    lua_getfield(L, globals, LUA_STRLIBNAME);
    lua_pushnil(L);
    lua_setfield(L, -2, "dump");
    lua_pop(L, 1);

    // event
    lua_createtable(L, 0, 6);
    lua_pushlstring(L, inv.event.device.data(), inv.event.device.size());
    lua_setfield(L, -2, "device");
    lua_pushinteger(L, inv.event.channel);
    lua_setfield(L, -2, "channel");
    lua_pushinteger(L, inv.event.control);
    lua_setfield(L, -2, "control");
    lua_pushnumber(L, inv.event.rawValue);
    lua_setfield(L, -2, "value");
    lua_pushstring(L, eventKindName(inv.event.kind));
    lua_setfield(L, -2, "kind");
    lua_pushnumber(L, inv.event.timestampMs);
    lua_setfield(L, -2, "timestamp");
    makeReadOnly(L);
    lua_setfield(L, globals, "event");

    // node
    lua_createtable(L, 0, 5);
    lua_pushinteger(L, inv.nodeId);
    lua_setfield(L, -2, "id");
    lua_pushlstring(L, inv.nodeTitle.data(), inv.nodeTitle.size());
    lua_setfield(L, -2, "title");
    lua_pushlstring(L, inv.nodeKind.data(), inv.nodeKind.size());
    lua_setfield(L, -2, "kind");
    pushJson(L, inv.config);
    lua_setfield(L, -2, "config");
    lua_createtable(L, 0, static_cast<int>(inv.inputs.size()));
    for (const auto& input : inv.inputs) {
        pushValue(L, input.second);
        lua_setfield(L, -2, input.first.c_str());
    }
    makeReadOnly(L);
    lua_setfield(L, -2, "inputs");
    makeReadOnly(L);
    lua_setfield(L, globals, "node");

    // context
    lua_createtable(L, 0, 4);
    lua_pushcfunction(L, contextLog);
    lua_setfield(L, -2, "log");
    lua_pushcfunction(L, contextNow);
    lua_setfield(L, -2, "now");
    lua_pushcfunction(L, contextReadFile);
    lua_setfield(L, -2, "read_file");
    lua_pushlstring(L, inv.workspaceId.data(), inv.workspaceId.size());
    lua_setfield(L, -2, "workspace");
    makeReadOnly(L);
    lua_setfield(L, globals, "context");

    // Chunk environment: script globals land here, lookups fall back to the
    // sandbox globals, reserved names cannot be shadowed
    lua_newtable(L);
    lua_newtable(L);
    lua_pushvalue(L, globals);
    lua_setfield(L, -2, "__index");
    lua_pushcfunction(L, envNewIndex);
    lua_setfield(L, -2, "__newindex");
    lua_pushliteral(L, "locked");
    lua_setfield(L, -2, "__metatable");
    lua_setmetatable(L, -2);
    lua_pushvalue(L, -1);
    lua_setfield(L, -2, "_G");
    return 1;
}

} // namespace

std::optional<std::string> LuaSandbox::checkSyntax(const std::string& source) {
    std::unique_ptr<lua_State, decltype(&lua_close)> L(luaL_newstate(), &lua_close);
    if (!L) return std::string("cannot create Lua state");
    if (luaL_loadbufferx(L.get(), source.data(), source.size(), "=script", "t") != LUA_OK) {
        std::string message = lua_tostring(L.get(), -1);
        return message;
    }
    return std::nullopt;
}

ScriptResult LuaSandbox::run(const ScriptInvocation& invocation) {
    ScriptResult result;
    const auto t0 = std::chrono::steady_clock::now();
    SandboxState state;
    state.invocation = &invocation;
    state.result = &result;
    state.deadline = t0 + std::chrono::milliseconds(invocation.timeoutMs);
    state.memoryLimit = invocation.memoryLimit;

    std::unique_ptr<lua_State, decltype(&lua_close)> holder(lua_newstate(sandboxAlloc, &state), &lua_close);
    lua_State* L = holder.get();
    if (!L) {
        result.error = "cannot create Lua state";
        return result;
    }
    *static_cast<SandboxState**>(lua_getextraspace(L)) = &state;

    lua_pushcfunction(L, setupEnvironment);
    if (lua_pcall(L, 0, 1, 0) != LUA_OK) {
        result.error = std::string("sandbox setup failed: ") + lua_tostring(L, -1);
        return result;
    }
    const int env = lua_gettop(L);

    if (luaL_loadbufferx(L, invocation.source.data(), invocation.source.size(), "=script", "t") != LUA_OK) {
        result.error = lua_tostring(L, -1);
        return result;
    }
    lua_pushvalue(L, env);
    if (!lua_setupvalue(L, -2, 1)) lua_pop(L, 1);

    lua_sethook(L, deadlineHook, LUA_MASKCOUNT, kHookInstructionCount);
    const int status = lua_pcall(L, 0, 0, 0);
    if (status != LUA_OK) {
        const char* message = lua_tostring(L, -1);
        result.error = message ? message : "script raised a non-string error";
        if (status == LUA_ERRMEM) result.error = "script exceeded its memory limit";
    }
    // Close before reporting so the elapsed time covers the teardown
    holder.reset();

    result.elapsedMs = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
    if (state.timedOut) {
        result.timedOut = true;
        result.error = "script exceeded its time limit";
        return result;
    }
    result.ok = status == LUA_OK;
    return result;
}

} // namespace MidiFlow
