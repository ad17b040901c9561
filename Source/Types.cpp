/*
 * [ Eragen ]
 *   Source/Types.cpp
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

#include "Types.h"

namespace Eragen
{
namespace Types
{

static const std::string const_prefix = "const ";

std::string CallType(const std::string &type)
{
	if (!type.empty() && type.back() == ']')
		return type.substr(0, type.find('[')) + " *";
	if (type.compare(0, const_prefix.size(), const_prefix) == 0)
		return type.substr(const_prefix.size());
	return type;
}

const std::string &TypeTable::Resolve(const std::string &type) const
{
	auto it = descriptors.find(type);
	if (it != descriptors.end())
		return it->second;

	// Qualifiers don't change storage
	if (type.compare(0, const_prefix.size(), const_prefix) == 0)
	{
		it = descriptors.find(type.substr(const_prefix.size()));
		if (it != descriptors.end())
			return it->second;
	}

	throw UnknownTypeError(type);
}

bool TypeTable::Contains(const std::string &type) const
{
	return descriptors.find(type) != descriptors.end();
}

const TypeTable &ErfaTypeTable()
{
	static const TypeTable table = {
		{ "double",       "numpy.double" },
		{ "double *",     "numpy.double" },
		{ "int",          "numpy.int" },
		{ "int *",        "numpy.int" },
		{ "int[4]",       "numpy.dtype([('', 'i', (4,))])" },
		{ "double[2]",    "numpy.dtype([('', 'd', (2,))])" },
		{ "double[3]",    "numpy.dtype([('p', 'd', (3,))])" },
		{ "double[2][3]", "numpy.dtype([('pv', 'd', (2,3))])" },
		{ "double[3][3]", "numpy.dtype([('r', 'd', (3,3))])" },
		{ "eraASTROM *",  "dt_eraASTROM" },
		{ "char *",       "numpy.dtype('S1')" },
	};
	return table;
}

}
}
