/*
 * [ Eragen ]
 *   Source/Eragen.cpp
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

#include "Header.h"
#include "Parse.h"
#include "Process.h"
#include "Types.h"

#include <sstream>
#include <fstream>
#include <filesystem>
#include <iostream>
#include <memory>

// Get standardized path
struct StdPath
{
	std::filesystem::path path;
	std::string utf8;
};

static StdPath GetStdPath(const std::string &src)
{
	StdPath out;
	out.path = std::filesystem::path(src);
	if (!std::filesystem::exists(out.path))
		throw std::runtime_error("File \"" + src + "\" doesn't exist");
	else
		out.path = std::filesystem::canonical(out.path);

	out.utf8 = out.path.string();
	for (auto &i : out.utf8)
		if (i == '\\')
			i = '/';

	return out;
}

// Parse a CMake list
static std::vector<std::string> ParseCMakeList(const std::string &src)
{
	std::vector<std::string> result;
	std::stringstream ss(src);
	std::string token;

	while (std::getline(ss, token, ';'))
		result.push_back(token);

	return result;
}

// Entry point
int main(int argc, char **argv)
{
	try
	{
		// Print Eragen information
		std::cout << "========================================" << '\n';
		std::cout << "Eragen (" ERAGEN_VERSION ")" << '\n';
		std::cout << "libclang: " << Eragen::Header::GetCXString(clang_getClangVersion()) << '\n';
		std::cout << "========================================" << std::endl;

		if (argc < 3)
		{
			std::cout << "Usage: " << argv[0] << " <process.lua> [options] <source>" << std::endl;
			return -1;
		}

		int argi = 1;

		StdPath lua_std = GetStdPath(argv[argi++]);

		// Parse options
		std::string out_name = "erfa.pyx";
		std::string header_name;
		std::string section = "Astronomy";
		std::string prefix = "era";

		Eragen::Header::ScanOptions scan_options;

		std::string current_option;

		for (; argi < argc; argi++)
		{
			std::string args(argv[argi]);

			if (current_option.empty())
			{
				if (args == "-output")
					current_option = args;
				else if (args == "-header")
					current_option = args;
				else if (args == "-section")
					current_option = args;
				else if (args == "-prefix")
					current_option = args;
				else if (args == "-include")
					current_option = args;
				else if (args == "-define")
					current_option = args;
				else
					break;
			}
			else
			{
				if (current_option == "-output")
				{
					out_name = args;
				}
				else if (current_option == "-header")
				{
					header_name = args;
				}
				else if (current_option == "-section")
				{
					section = args;
				}
				else if (current_option == "-prefix")
				{
					prefix = args;
				}
				else if (current_option == "-include")
				{
					// Parse includes
					auto arg_includes = ParseCMakeList(args);
					scan_options.includes.insert(scan_options.includes.end(), arg_includes.begin(), arg_includes.end());
				}
				else if (current_option == "-define")
				{
					// Parse defines
					auto arg_defines = ParseCMakeList(args);
					scan_options.defines.insert(scan_options.defines.end(), arg_defines.begin(), arg_defines.end());
				}
				current_option.clear();
			}
		}

		if (!current_option.empty())
			throw std::runtime_error("Option " + current_option + " is missing its value.");
		if (argi >= argc)
			throw std::runtime_error("Given no source.");

		// A directory holds one file per function, a file holds every function
		StdPath source_std = GetStdPath(argv[argi]);
		bool multi_file = std::filesystem::is_directory(source_std.path);

		if (header_name.empty())
		{
			if (multi_file)
				header_name = (source_std.path / "erfa.h").string();
			else
				header_name = (source_std.path.parent_path() / "erfa.h").string();
		}
		StdPath header_std = GetStdPath(header_name);

		// Load and compile lua source
		std::stringstream lua_sstream;
		{
			std::ifstream lua_stream(lua_std.path);
			if (!lua_stream)
				throw std::runtime_error("Failed to open process: " + lua_std.utf8);
			lua_sstream << lua_stream.rdbuf();
		}

		std::unique_ptr<lua_State, void (*)(lua_State *)> GL(luaL_newstate(), lua_close);
		luaL_openlibs(GL.get());
		Eragen::Process::RegisterLuaFunctions(GL.get());

		lua_State *L = lua_newthread(GL.get());
		lua_State *T = Eragen::Process::LoadProcess(L, lua_sstream.str());

		// Enumerate functions from the header
		std::cout << "[ Scanning `" << header_std.path.filename().string() << "` ]" << '\n';

		auto entries = Eragen::Header::SelectSection(Eragen::Header::ScanHeader(header_std.path, scan_options), section);
		if (entries.empty())
			throw std::runtime_error("Section \"" + section + "\" has no functions.");

		// Parse functions
		const Eragen::Types::TypeTable &types = Eragen::Types::ErfaTypeTable();

		std::vector<Eragen::Parse::FunctionSignature> signatures;
		signatures.reserve(entries.size());

		std::string last_subsection;
		Eragen::Parse::SourceBuffer combined;
		if (!multi_file)
			combined = Eragen::Parse::ReadSource(entries.front().name, source_std.path, prefix);

		for (auto &entry : entries)
		{
			if (entry.subsection != last_subsection)
			{
				std::cout << "[ " << entry.section << "." << entry.subsection << " ]" << '\n';
				last_subsection = entry.subsection;
			}
			std::cout << "[ Reading `" << entry.name << "` ]" << '\n';

			if (multi_file)
			{
				// Easy because each function has its own file
				Eragen::Parse::SourceBuffer source = Eragen::Parse::ReadSource(entry.name, source_std.path, prefix);
				signatures.emplace_back(entry.name, source, types, "", prefix);
			}
			else
			{
				// Look for the header's declaration, otherwise a call could be found instead of the definition
				signatures.emplace_back(entry.name, combined, types, entry.anchor, prefix);
			}
		}

		// Render and write output
		std::cout << "[ Generating `" << out_name << "` ]" << '\n';

		std::string output = Eragen::Process::RunProcess(T, "Render", signatures);

		std::ofstream output_stream(out_name, std::ios::binary);
		if (!output_stream)
			throw std::runtime_error("Failed to open output: " + out_name);

		output_stream.write(output.data(), output.size());

		std::cout << "[ Done, " << signatures.size() << " functions ]" << std::endl;
	}
	catch (std::exception &e)
	{
		std::cout << std::flush;
		std::cerr << std::endl;

		std::cerr << "========================================" << '\n';
		std::cerr << "Eragen generator failed!" << '\n';
		std::cerr << "========================================" << '\n';
		std::cerr << "Error: " << e.what() << std::endl;
		return 1;
	}

	return 0;
}
