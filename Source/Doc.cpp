/*
 * [ Eragen ]
 *   Source/Doc.cpp
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

#include "Doc.h"

#include <regex>
#include <sstream>

namespace Eragen
{
namespace Doc
{

// Replace every occurrence of a string
static void ReplaceAll(std::string &str, const std::string &from, const std::string &to)
{
	size_t pos = 0;
	while ((pos = str.find(from, pos)) != std::string::npos)
	{
		str.replace(pos, from.size(), to);
		pos += to.size();
	}
}

// Find the body of a section, the text between the header line and the first line ending in two spaces
static bool FindSection(const std::string &doc, const std::string &header, std::string &body)
{
	for (size_t pos = doc.find(header); pos != std::string::npos; pos = doc.find(header, pos + 1))
	{
		// The header line must end in a colon, anything between is a qualifier
		size_t line_end = doc.find('\n', pos + header.size());
		if (line_end == std::string::npos)
			return false;
		if (line_end == pos + header.size() || doc[line_end - 1] != ':')
			continue;

		// The body is at least one character long
		size_t body_start = line_end + 1;
		if (body_start >= doc.size())
			return false;

		size_t body_end = doc.find("  \n", body_start + 1);
		if (body_end == std::string::npos)
			continue;

		body = doc.substr(body_start, body_end - body_start);
		return true;
	}
	return false;
}

// Parse every argument entry in a section body
static void ParseSection(const std::string &body, std::vector<ArgumentEntry> &entries)
{
	std::stringstream body_stream(body);
	std::string line;

	while (std::getline(body_stream, line))
	{
		ArgumentEntry entry;
		if (ParseArgumentEntry(line, entry))
			entries.emplace_back(std::move(entry));
	}
}

// Check if a name is listed by any entry
static bool HasName(const std::vector<ArgumentEntry> &entries, const std::string &name)
{
	for (auto &i : entries)
	{
		std::stringstream names(i.name);
		std::string alias;
		while (std::getline(names, alias, ','))
		{
			if (alias == name)
				return true;
		}
	}
	return false;
}

bool ParseArgumentEntry(const std::string &line, ArgumentEntry &entry)
{
	static const std::regex entry_regex("^ +([^ ]+) +([^ ]+) +(.+)");

	std::smatch match;
	if (!std::regex_search(line, match, entry_regex))
		return false;

	entry.name = match[1].str();
	entry.type = match[2].str();
	entry.doc = match[3].str();
	return true;
}

DocumentationBlock::DocumentationBlock(const std::string &comment) : doc(comment)
{
	// Strip comment delimiters and emphasis, keeping column positions
	ReplaceAll(doc, "**", "  ");
	ReplaceAll(doc, "/*", "  ");
	ReplaceAll(doc, "*/", "  ");

	std::string body;

	if (FindSection(doc, "Given", body))
		ParseSection(body, inputs);

	if (FindSection(doc, "Returned", body))
		ParseSection(body, outputs);

	if (FindSection(doc, "Given and returned", body))
	{
		ParseSection(body, inputs);
		ParseSection(body, outputs);
	}
}

bool DocumentationBlock::IsInput(const std::string &name) const
{
	return HasName(inputs, name);
}

bool DocumentationBlock::IsOutput(const std::string &name) const
{
	return HasName(outputs, name);
}

}
}
