/*
 * [ Eragen ]
 *   Source/Parse.h
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

#include "Doc.h"
#include "Types.h"

#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace Eragen
{
namespace Parse
{

// Thrown when a function's declaration and documentation can't be found or understood
class LocationError : public std::runtime_error
{
	public:
		LocationError(const std::string &function, const std::string &path, const std::string &what) :
			std::runtime_error(what + " (function " + function + ", file \"" + path + "\")"),
			function(function), path(path)
		{}

		std::string function;
		std::string path;
};

// Argument direction
enum class Direction
{
	Unknown,
	In,
	Out,
	InOut,
	Return,
};

// "", "in", "out", "inout", "ret"
const char *DirectionString(Direction direction);

// Parse a "in|inout" style direction filter
std::vector<Direction> ParseDirections(const std::string &filter);

// A function argument, either a declared parameter or the return value
struct Argument
{
	enum class Kind
	{
		Invalid,
		Parameter,
		Return,
	} kind = Kind::Invalid;

	std::string definition; // Declaration fragment, empty for the return value
	std::string name;
	std::string type;

	bool pointer = false;

	Direction direction = Direction::Unknown;

	std::string CallType() const { return Types::CallType(type); }
};

// Split a declaration fragment like "double *ra" or "double pv[2][3]" into an argument
// Direction is left unknown
Argument ParseArgument(const std::string &definition);

// Argument field to project when selecting by direction
enum class Field
{
	Name,
	Type,
	CallType,
	Direction,
	Storage,
	Definition,
};

// "name", "ctype", "ctype_ptr", "inout_state", "dtype", "definition"
Field ParseField(const std::string &field);

// Source text and where it came from
struct SourceBuffer
{
	std::string path;
	std::string text;
};

// Get the short name of a function, "eraSepp" -> "sepp"
std::string GetShortName(const std::string &name, const std::string &prefix);

// Read the source holding a function
// A directory source is searched for "<short name>.c", a file source is used as is
SourceBuffer ReadSource(const std::string &name, const std::filesystem::path &source_path, const std::string &prefix);

// Skip a buffer up to the first line starting with the anchor
SourceBuffer ApplyAnchor(const std::string &name, const SourceBuffer &source, const std::string &anchor);

// A function declaration with its documented arguments
class FunctionSignature
{
	private:
		const Types::TypeTable *types = nullptr;

		std::string name;
		std::string short_name;
		std::string return_type;
		std::string path;

		std::string declaration;
		Doc::DocumentationBlock doc;

		std::vector<Argument> args;

		Direction GetDirection(const std::string &arg_name) const;

	public:
		// Locate and parse a function in a source buffer
		// If an anchor is given, searching starts at the first line beginning with it
		FunctionSignature(const std::string &name, const SourceBuffer &source, const Types::TypeTable &types, const std::string &anchor = "", const std::string &prefix = "era");

		const std::string &Name() const { return name; }
		const std::string &ShortName() const { return short_name; }
		const std::string &ReturnType() const { return return_type; }
		const std::string &Path() const { return path; }
		const std::string &Declaration() const { return declaration; }

		const Doc::DocumentationBlock &Documentation() const { return doc; }
		const Types::TypeTable &GetTypeTable() const { return *types; }

		const std::vector<Argument> &Arguments() const { return args; }

		// Get the return value slot, or nullptr if the function doesn't return a scalar
		const Argument *Return() const;

		// Get a field of an argument as text
		std::string Project(const Argument &arg, Field field) const;

		// Select arguments by direction, in declaration order
		std::vector<std::reference_wrapper<const Argument>> SelectByDirection(const std::vector<Direction> &directions) const;
		std::vector<std::string> SelectByDirection(const std::vector<Direction> &directions, Field field) const;
		std::string SelectByDirection(const std::vector<Direction> &directions, Field field, const std::string &join) const;
};

}
}
