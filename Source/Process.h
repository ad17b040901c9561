/*
 * [ Eragen ]
 *   Source/Process.h
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

#pragma once

#include "Parse.h"

#include <Luau/Compiler.h>
#include <lua.h>
#include <lualib.h>

#include <string>
#include <vector>

namespace Eragen
{
namespace Process
{

// Lua helpers
static void LuaTableSetBoolean(lua_State *T, int idx, const char *name, int v)
{
	lua_pushstring(T, name);
	lua_pushboolean(T, v);
	lua_settable(T, idx - 2);
}

static void LuaTableSetString(lua_State *T, int idx, const char *name, const char *v)
{
	lua_pushstring(T, name);
	lua_pushstring(T, v);
	lua_settable(T, idx - 2);
}

// Lua process functions
/*
Registers the following globals
 - args_by_inout(func, filter [, prop [, join]])
*/
void RegisterLuaFunctions(lua_State *T);

/*
This pushes the following table onto the stack
 - functions
The signatures must outlive the table
*/
void ConstructLuaTables(lua_State *T, const std::vector<Parse::FunctionSignature> &signatures);

// Compile and run a process script on a new thread of L
// Leaves the thread on L's stack and returns it with the script's result table on top of its stack
lua_State *LoadProcess(lua_State *L, const std::string &source);

// Call a function of the process table with the functions table and get the resulting string
std::string RunProcess(lua_State *T, const char *function, const std::vector<Parse::FunctionSignature> &signatures);

}
}
