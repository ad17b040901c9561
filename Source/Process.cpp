/*
 * [ Eragen ]
 *   Source/Process.cpp
 * Author(s): Regan Green
 * Date: 2024-02-13
 *
 * Copyright (C) 2024 Regan "CKDEV" Green
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as
 * published by the Free Software Foundation, either version 3 of the
 * License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#include "Process.h"

#include <stdexcept>

namespace Eragen
{
namespace Process
{

// Get the signature pointer of a function table
static const Parse::FunctionSignature *GetLuaSignature(lua_State *T, int idx)
{
	lua_pushstring(T, "signature");
	lua_gettable(T, idx < 0 ? idx - 1 : idx);
	auto signature = reinterpret_cast<const Parse::FunctionSignature *>(lua_touserdata(T, -1));
	lua_pop(T, 1);
	return signature;
}

// args_by_inout(func, filter [, prop [, join]])
static int LuaArgsByInout(lua_State *T)
{
	luaL_checktype(T, 1, LUA_TTABLE);
	std::string filter = luaL_checkstring(T, 2);
	bool has_prop = !lua_isnoneornil(T, 3);
	bool has_join = !lua_isnoneornil(T, 4);
	std::string prop = has_prop ? luaL_checkstring(T, 3) : "";
	std::string join = has_join ? luaL_checkstring(T, 4) : "";

	const Parse::FunctionSignature *signature = GetLuaSignature(T, 1);
	if (signature == nullptr)
		luaL_error(T, "args_by_inout: expected a function table");

	std::string error;
	try
	{
		std::vector<Parse::Direction> directions = Parse::ParseDirections(filter);

		if (!has_prop)
		{
			// Select the argument tables themselves
			lua_pushstring(T, "args");
			lua_gettable(T, 1);
			lua_newtable(T);

			int select_i = 1;
			for (const Parse::Argument &arg : signature->SelectByDirection(directions))
			{
				int arg_i = static_cast<int>(&arg - signature->Arguments().data()) + 1;

				lua_pushnumber(T, select_i++);
				lua_rawgeti(T, -3, arg_i);
				lua_settable(T, -3);
			}

			lua_remove(T, -2);
			return 1;
		}

		Parse::Field field = Parse::ParseField(prop);

		if (!has_join)
		{
			lua_newtable(T);

			int select_i = 1;
			for (auto &i : signature->SelectByDirection(directions, field))
			{
				lua_pushnumber(T, select_i++);
				lua_pushstring(T, i.c_str());
				lua_settable(T, -3);
			}
			return 1;
		}

		lua_pushstring(T, signature->SelectByDirection(directions, field, join).c_str());
		return 1;
	}
	catch (std::exception &e)
	{
		error = e.what();
	}

	luaL_error(T, "args_by_inout: %s", error.c_str());
	return 0;
}

void RegisterLuaFunctions(lua_State *T)
{
	lua_pushcfunction(T, LuaArgsByInout, "args_by_inout");
	lua_setglobal(T, "args_by_inout");
}

// Lua tables
static void ConstructLuaArgument(lua_State *T, const Parse::FunctionSignature &signature, const Parse::Argument &arg)
{
	lua_newtable(T);

	LuaTableSetString(T, -1, "name", arg.name.c_str());
	LuaTableSetString(T, -1, "ctype", arg.type.c_str());
	LuaTableSetString(T, -1, "ctype_ptr", arg.CallType().c_str());
	LuaTableSetString(T, -1, "inout_state", Parse::DirectionString(arg.direction));
	LuaTableSetString(T, -1, "dtype", signature.Project(arg, Parse::Field::Storage).c_str());
	LuaTableSetString(T, -1, "definition", arg.definition.c_str());

	LuaTableSetBoolean(T, -1, "pointer", arg.pointer);
	LuaTableSetBoolean(T, -1, "is_ret", arg.kind == Parse::Argument::Kind::Return);
}

void ConstructLuaTables(lua_State *T, const std::vector<Parse::FunctionSignature> &signatures)
{
	// Create functions table
	lua_newtable(T);

	int func_i = 1;
	for (auto &i : signatures)
	{
		lua_pushnumber(T, func_i++);
		lua_newtable(T);

		LuaTableSetString(T, -1, "name", i.Name().c_str());
		LuaTableSetString(T, -1, "pyname", i.ShortName().c_str());
		LuaTableSetString(T, -1, "return_type", i.ReturnType().c_str());
		LuaTableSetString(T, -1, "path", i.Path().c_str());
		LuaTableSetString(T, -1, "declaration", i.Declaration().c_str());

		lua_pushstring(T, "signature");
		lua_pushlightuserdata(T, const_cast<Parse::FunctionSignature *>(&i));
		lua_settable(T, -3);

		lua_pushstring(T, "args");
		lua_newtable(T);
		int arg_i = 1;
		for (auto &a : i.Arguments())
		{
			lua_pushnumber(T, arg_i++);
			ConstructLuaArgument(T, i, a);
			lua_settable(T, -3);
		}
		lua_settable(T, -3);

		// The return slot shares its table with the last argument
		if (i.Return() != nullptr)
		{
			lua_pushstring(T, "args");
			lua_gettable(T, -2);

			lua_pushstring(T, "ret");
			lua_rawgeti(T, -2, arg_i - 1);
			lua_settable(T, -4);

			lua_pop(T, 1);
		}

		lua_settable(T, -3);
	}
}

lua_State *LoadProcess(lua_State *L, const std::string &source)
{
	std::string bytecode = Luau::compile(source);
	if (luau_load(L, "=process", bytecode.data(), bytecode.size(), 0) != 0)
	{
		size_t len;
		const char *msg = lua_tolstring(L, -1, &len);

		std::string error(msg, len);
		lua_pop(L, 1);

		throw std::runtime_error("Lua process failed to compile: " + error);
	}

	// Setup thread
	// The stack now contains the function that will execute the loaded bytecode
	lua_State *T = lua_newthread(L);
	lua_pushvalue(L, -2);
	lua_remove(L, -3);
	lua_xmove(L, T, 1);

	int thread_status = lua_resume(T, nullptr, 0);

	if (thread_status != LUA_OK)
	{
		std::string error;
		if (thread_status == LUA_YIELD)
			error = "thread yielded unexpectedly";
		else if (const char *str = lua_tostring(T, -1))
			error = str;

		error += "\nstack backtrace:\n";
		error += lua_debugtrace(T);

		throw std::runtime_error("Lua process failed to execute: " + error);
	}

	// Check for the table off the stack
	if (lua_gettop(T) == 0 || !lua_istable(T, -1))
		throw std::runtime_error("Lua process did not return `table`");

	return T;
}

std::string RunProcess(lua_State *T, const char *function, const std::vector<Parse::FunctionSignature> &signatures)
{
	// Get process function
	lua_pushstring(T, function);
	lua_gettable(T, -2);
	if (!lua_isfunction(T, -1))
	{
		lua_pop(T, 1);
		throw std::runtime_error(std::string("Lua process has no `") + function + "` function");
	}

	ConstructLuaTables(T, signatures); // functions

	int thread_status = lua_pcall(T, 1, 1, 0);

	if (thread_status != 0)
	{
		std::string error;
		if (thread_status == LUA_YIELD)
			error = "thread yielded unexpectedly";
		else if (const char *str = lua_tostring(T, -1))
			error = str;

		error += "\nstack backtrace:\n";
		error += lua_debugtrace(T);

		throw std::runtime_error("Lua process failed to execute: " + error);
	}

	// Get result string
	if (!lua_isstring(T, -1))
		throw std::runtime_error("Lua process did not return `string`");
	std::string output = lua_tostring(T, -1);
	lua_pop(T, 1);

	return output;
}

}
}
