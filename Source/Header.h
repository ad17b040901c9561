/*
 * [ Eragen ]
 *   Source/Header.h
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

#include <clang-c/Index.h>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace Eragen
{
namespace Header
{

// Get string from a CXString and dispose it
inline std::string GetCXString(CXString string)
{
	std::string result = clang_getCString(string);
	clang_disposeString(string);
	return result;
}

// Thrown when the header and its section markers disagree
class EnumerationInvariantError : public std::runtime_error
{
	public:
		EnumerationInvariantError(const std::string &name, const std::string &what) : std::runtime_error(what), name(name) {}

		std::string name;
};

// A "/* Section/Subsection */" marker and the lines up to the next blank line
struct SectionBlock
{
	std::string section;
	std::string subsection;

	// 1-based, inclusive
	unsigned int first_line = 0;
	unsigned int last_line = 0;
};

// A function declared in a section
struct FunctionEntry
{
	std::string section;
	std::string subsection;

	std::string name;
	unsigned int line = 0;

	// Return type and name as written, for finding the definition in a combined source
	std::string anchor;
};

// Options for parsing the header
struct ScanOptions
{
	std::vector<std::string> includes;
	std::vector<std::string> defines;
};

// Find section blocks in header text
std::vector<SectionBlock> FindSections(const std::string &text);

// Get the anchor text of a declaration line, "double eraSepp(double a[3], double b[3]);" -> "double eraSepp"
std::string GetAnchor(const std::string &line, const std::string &name);

// Parse a header and get every function declared inside a section block, in header order
std::vector<FunctionEntry> ScanHeader(const std::filesystem::path &path, const ScanOptions &options);

// Get the functions of one top-level section
std::vector<FunctionEntry> SelectSection(const std::vector<FunctionEntry> &entries, const std::string &section);

}
}
