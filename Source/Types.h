/*
 * [ Eragen ]
 *   Source/Types.h
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

#include <initializer_list>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace Eragen
{
namespace Types
{

// Thrown when a type spelling isn't in the table
class UnknownTypeError : public std::runtime_error
{
	public:
		explicit UnknownTypeError(const std::string &type) : std::runtime_error("Unknown C type \"" + type + "\""), type(type) {}
		UnknownTypeError(const std::string &type, const std::string &function, const std::string &path) :
			std::runtime_error("Unknown C type \"" + type + "\" (function " + function + ", file \"" + path + "\")"),
			type(type), function(function), path(path)
		{}

		std::string type;
		std::string function; // Empty outside of a function
		std::string path;
};

// Get the pointer-stripped spelling of a type, as used by the native call signature
// "double[3]" -> "double *", "const char *" -> "char *"
std::string CallType(const std::string &type);

// Maps C type spellings to storage descriptors
// Keys are the full annotated spelling, so "double *" and "double[3]" are distinct
class TypeTable
{
	private:
		std::unordered_map<std::string, std::string> descriptors;

	public:
		TypeTable() = default;
		TypeTable(std::initializer_list<std::pair<const std::string, std::string>> init) : descriptors(init) {}

		// Get the storage descriptor of a type, throws UnknownTypeError
		const std::string &Resolve(const std::string &type) const;

		bool Contains(const std::string &type) const;
		size_t Size() const { return descriptors.size(); }
};

// Type vocabulary of the ERFA library
const TypeTable &ErfaTypeTable();

}
}
