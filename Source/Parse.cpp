/*
 * [ Eragen ]
 *   Source/Parse.cpp
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

#include "Parse.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace Eragen
{
namespace Parse
{

// Only functions returning this get a return value slot
static const std::string scalar_return_type = "double";

static const char *whitespace = " \t\r\n";

// Trim whitespace from both ends of a string
static std::string Trim(const std::string &str)
{
	size_t first = str.find_first_not_of(whitespace);
	if (first == std::string::npos)
		return "";
	size_t last = str.find_last_not_of(whitespace);
	return str.substr(first, last - first + 1);
}

// Direction strings
const char *DirectionString(Direction direction)
{
	switch (direction)
	{
		case Direction::Unknown:
			return "";
		case Direction::In:
			return "in";
		case Direction::Out:
			return "out";
		case Direction::InOut:
			return "inout";
		case Direction::Return:
			return "ret";
	}
	return "";
}

std::vector<Direction> ParseDirections(const std::string &filter)
{
	std::vector<Direction> result;

	// Empty segments, including a whole empty filter, select undocumented arguments
	size_t start = 0;
	while (true)
	{
		size_t end = filter.find('|', start);
		std::string token = filter.substr(start, end == std::string::npos ? std::string::npos : end - start);

		if (token == "in")
			result.push_back(Direction::In);
		else if (token == "out")
			result.push_back(Direction::Out);
		else if (token == "inout")
			result.push_back(Direction::InOut);
		else if (token == "ret")
			result.push_back(Direction::Return);
		else if (token.empty())
			result.push_back(Direction::Unknown);
		else
			throw std::runtime_error("Unknown direction \"" + token + "\"");

		if (end == std::string::npos)
			break;
		start = end + 1;
	}

	return result;
}

Field ParseField(const std::string &field)
{
	if (field == "name")
		return Field::Name;
	if (field == "ctype")
		return Field::Type;
	if (field == "ctype_ptr")
		return Field::CallType;
	if (field == "inout_state")
		return Field::Direction;
	if (field == "dtype")
		return Field::Storage;
	if (field == "definition")
		return Field::Definition;
	throw std::runtime_error("Unknown argument field \"" + field + "\"");
}

// Arguments
Argument ParseArgument(const std::string &definition)
{
	Argument arg;
	arg.kind = Argument::Kind::Parameter;
	arg.definition = Trim(definition);

	size_t star = arg.definition.find('*');
	if (star != std::string::npos)
	{
		// "double *ra" -> "double *", "ra"
		arg.type = Trim(arg.definition.substr(0, star)) + " *";
		arg.name = Trim(arg.definition.substr(star + 1));
		arg.pointer = true;
	}
	else
	{
		// "double pv[2][3]" -> "double", "pv[2][3]"
		size_t split = arg.definition.find_last_of(whitespace);
		if (split == std::string::npos)
			throw std::runtime_error("Parameter \"" + arg.definition + "\" has no name");

		arg.type = Trim(arg.definition.substr(0, split));
		arg.name = arg.definition.substr(split + 1);

		// Move array dimensions onto the type
		size_t bracket = arg.name.find('[');
		if (bracket != std::string::npos)
		{
			arg.type += arg.name.substr(bracket);
			arg.name.erase(bracket);
		}
	}

	if (arg.name.empty())
		throw std::runtime_error("Parameter \"" + arg.definition + "\" has no name");

	return arg;
}

// Sources
std::string GetShortName(const std::string &name, const std::string &prefix)
{
	std::string short_name = name;
	if (!prefix.empty() && short_name.compare(0, prefix.size(), prefix) == 0)
		short_name.erase(0, prefix.size());

	std::transform(short_name.begin(), short_name.end(), short_name.begin(), [](unsigned char c) { return std::tolower(c); });
	return short_name;
}

SourceBuffer ReadSource(const std::string &name, const std::filesystem::path &source_path, const std::string &prefix)
{
	SourceBuffer source;

	std::filesystem::path file_path = source_path;
	if (std::filesystem::is_directory(source_path))
		file_path = source_path.lexically_normal() / (GetShortName(name, prefix) + ".c");
	source.path = file_path.string();

	std::ifstream file_stream(file_path, std::ios::binary);
	if (!file_stream)
		throw LocationError(name, source.path, "Failed to open source");

	std::stringstream file_sstream;
	file_sstream << file_stream.rdbuf();
	source.text = file_sstream.str();

	return source;
}

SourceBuffer ApplyAnchor(const std::string &name, const SourceBuffer &source, const std::string &anchor)
{
	size_t line_start = 0;
	while (line_start < source.text.size())
	{
		if (source.text.compare(line_start, anchor.size(), anchor) == 0)
		{
			// Keep a newline in front so the anchored line can match as a declaration
			SourceBuffer anchored;
			anchored.path = source.path;
			anchored.text = '\n' + source.text.substr(line_start);
			return anchored;
		}

		size_t line_end = source.text.find('\n', line_start);
		if (line_end == std::string::npos)
			break;
		line_start = line_end + 1;
	}

	throw LocationError(name, source.path, "Could not find the anchor line \"" + anchor + "\"");
}

// Declaration location
struct Location
{
	std::string declaration;
	size_t paren_open = 0; // Index into declaration
	std::string comment;
};

// Find the first line declaring a function with the comment block that follows
// Matches "\n<line prefix>NAME ?(<no closing paren>)<anything>/*<comment>*/"
static bool Locate(const std::string &text, const std::string &name, Location &location)
{
	for (size_t newline = text.find('\n'); newline != std::string::npos; newline = text.find('\n', newline + 1))
	{
		size_t line_start = newline + 1;
		size_t line_end = text.find('\n', line_start);
		if (line_end == std::string::npos)
			line_end = text.size();

		std::string line = text.substr(line_start, line_end - line_start);

		// Try the last occurrence on the line first, the name can't start the line
		size_t search = line.size();
		while (search > 0)
		{
			size_t name_pos = line.rfind(name, search - 1);
			if (name_pos == std::string::npos || name_pos == 0)
				break;
			search = name_pos;

			size_t paren_open = name_pos + name.size();
			if (paren_open < line.size() && line[paren_open] == ' ')
				paren_open++;
			if (paren_open >= line.size() || line[paren_open] != '(')
				continue;

			size_t paren_close = text.find(')', line_start + paren_open + 1);
			if (paren_close == std::string::npos || paren_close == line_start + paren_open + 1)
				continue;

			// The comment is the nearest block comment after the declaration
			size_t comment_start = text.find("/*", paren_close + 2);
			if (comment_start == std::string::npos)
				continue;
			size_t comment_end = text.find("*/", comment_start + 3);
			if (comment_end == std::string::npos)
				continue;

			location.declaration = text.substr(line_start, paren_close + 1 - line_start);
			location.paren_open = paren_open;
			location.comment = text.substr(comment_start, comment_end + 2 - comment_start);
			return true;
		}
	}
	return false;
}

// Function signature
FunctionSignature::FunctionSignature(const std::string &_name, const SourceBuffer &source, const Types::TypeTable &_types, const std::string &anchor, const std::string &prefix)
	: types(&_types), name(_name), path(source.path)
{
	short_name = GetShortName(name, prefix);

	// Find the declaration
	Location location;
	bool found;
	if (!anchor.empty())
		found = Locate(ApplyAnchor(name, source, anchor).text, name, location);
	else
		found = Locate(source.text, name, location);

	if (!found)
		throw LocationError(name, path, "Could not find a declaration matching \"\\n([^\\n]+" + name + " ?\\([^)]+\\)).+?(/\\*.+?\\*/)\"");

	declaration = location.declaration;
	doc = Doc::DocumentationBlock(location.comment);

	// Get return type from the text before the name
	std::string first_line = declaration.substr(0, declaration.find('\n'));
	return_type = Trim(first_line.substr(0, first_line.rfind(name)));

	// Split arguments
	std::string arg_list = declaration.substr(location.paren_open + 1, declaration.size() - location.paren_open - 2);
	if (arg_list.find('(') != std::string::npos)
		throw LocationError(name, path, "Function pointer parameters are unsupported");

	if (Trim(arg_list) != "void")
	{
		std::stringstream arg_stream(arg_list);
		std::string definition;

		while (std::getline(arg_stream, definition, ','))
		{
			Argument arg;
			try
			{
				arg = ParseArgument(definition);
			}
			catch (std::runtime_error &e)
			{
				throw LocationError(name, path, e.what());
			}

			arg.direction = GetDirection(arg.name);
			args.emplace_back(std::move(arg));
		}
	}

	// Return value slot
	if (return_type == scalar_return_type)
	{
		Argument ret;
		ret.kind = Argument::Kind::Return;
		ret.name = "ret";
		ret.type = return_type;
		ret.direction = Direction::Return;
		args.emplace_back(std::move(ret));
	}
}

Direction FunctionSignature::GetDirection(const std::string &arg_name) const
{
	bool input = doc.IsInput(arg_name);
	bool output = doc.IsOutput(arg_name);

	if (input && output)
		return Direction::InOut;
	if (input)
		return Direction::In;
	if (output)
		return Direction::Out;

	// Undocumented, like internal work arrays
	return Direction::Unknown;
}

const Argument *FunctionSignature::Return() const
{
	if (!args.empty() && args.back().kind == Argument::Kind::Return)
		return &args.back();
	return nullptr;
}

std::string FunctionSignature::Project(const Argument &arg, Field field) const
{
	switch (field)
	{
		case Field::Name:
			return arg.name;
		case Field::Type:
			return arg.type;
		case Field::CallType:
			return arg.CallType();
		case Field::Direction:
			return DirectionString(arg.direction);
		case Field::Storage:
			try
			{
				return types->Resolve(arg.type);
			}
			catch (Types::UnknownTypeError &e)
			{
				throw Types::UnknownTypeError(e.type, name, path);
			}
		case Field::Definition:
			return arg.definition;
	}
	throw std::runtime_error("Invalid argument field");
}

std::vector<std::reference_wrapper<const Argument>> FunctionSignature::SelectByDirection(const std::vector<Direction> &directions) const
{
	std::vector<std::reference_wrapper<const Argument>> result;
	for (auto &i : args)
	{
		if (std::find(directions.begin(), directions.end(), i.direction) != directions.end())
			result.emplace_back(i);
	}
	return result;
}

std::vector<std::string> FunctionSignature::SelectByDirection(const std::vector<Direction> &directions, Field field) const
{
	std::vector<std::string> result;
	for (const Argument &i : SelectByDirection(directions))
		result.push_back(Project(i, field));
	return result;
}

std::string FunctionSignature::SelectByDirection(const std::vector<Direction> &directions, Field field, const std::string &join) const
{
	std::vector<std::string> fields = SelectByDirection(directions, field);

	std::string result;
	for (size_t i = 0; i < fields.size(); i++)
	{
		if (i)
			result += join;
		result += fields[i];
	}
	return result;
}

}
}
