/*
 * [ Eragen ]
 *   Source/Doc.h
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

#include <string>
#include <vector>

namespace Eragen
{
namespace Doc
{

// A single documented argument line
// name may be a comma separated list of aliases sharing one description
struct ArgumentEntry
{
	std::string name;
	std::string type;
	std::string doc;
};

// Parse a documentation line, returns false if the line isn't an argument entry
bool ParseArgumentEntry(const std::string &line, ArgumentEntry &entry);

// Parsed Given / Returned / Given and returned sections of a comment block
class DocumentationBlock
{
	private:
		std::string doc;

		std::vector<ArgumentEntry> inputs;
		std::vector<ArgumentEntry> outputs;

	public:
		DocumentationBlock() = default;
		explicit DocumentationBlock(const std::string &comment);

		const std::string &Text() const { return doc; }

		const std::vector<ArgumentEntry> &Inputs() const { return inputs; }
		const std::vector<ArgumentEntry> &Outputs() const { return outputs; }

		// Check if a parameter name is documented in a section
		// Entries are split on commas, so "ra,da" documents both ra and da
		bool IsInput(const std::string &name) const;
		bool IsOutput(const std::string &name) const;
};

}
}
