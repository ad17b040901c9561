/*
 * [ Eragen ]
 *   Source/Header.cpp
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

#include <fstream>
#include <iostream>
#include <memory>
#include <regex>
#include <sstream>

namespace Eragen
{
namespace Header
{

// Split text into lines
static std::vector<std::string> SplitLines(const std::string &text)
{
	std::vector<std::string> lines;
	std::stringstream text_stream(text);
	std::string line;

	while (std::getline(text_stream, line))
	{
		if (!line.empty() && line.back() == '\r')
			line.pop_back();
		lines.push_back(line);
	}

	return lines;
}

std::vector<SectionBlock> FindSections(const std::string &text)
{
	static const std::regex marker_regex("/\\* (\\w*)/(\\w*) \\*/$");

	std::vector<SectionBlock> blocks;
	std::vector<std::string> lines = SplitLines(text);

	SectionBlock *current = nullptr;

	for (unsigned int i = 0; i < lines.size(); i++)
	{
		unsigned int line_no = i + 1;

		if (current != nullptr)
		{
			// Blocks end at the first blank line
			if (lines[i].empty())
				current = nullptr;
			else
				current->last_line = line_no;
			continue;
		}

		std::smatch match;
		if (std::regex_search(lines[i], match, marker_regex))
		{
			SectionBlock block;
			block.section = match[1].str();
			block.subsection = match[2].str();
			block.first_line = line_no + 1;
			block.last_line = line_no;
			current = &(blocks.emplace_back(std::move(block)));
		}
	}

	return blocks;
}

std::string GetAnchor(const std::string &line, const std::string &name)
{
	if (line.find(name) == std::string::npos)
		throw EnumerationInvariantError(name, "Function " + name + " isn't named on its declaration line \"" + line + "\"");

	std::string anchor = line;
	if (!anchor.empty() && anchor.back() == ';')
		anchor.pop_back();

	// Header and source argument names don't have to match
	return anchor.substr(0, anchor.find('('));
}

// Function declarations found by libclang
struct Declaration
{
	std::string name;
	unsigned int line = 0;
};

static std::vector<Declaration> ParseDeclarations(const std::filesystem::path &path, const ScanOptions &options)
{
	// Setup arguments
	std::vector<std::string> args;

	args.push_back("-x"); args.push_back("c");

	// Include our system headers
#define ERAGEN_SYSTEM_INCLUDE_FRAME(header) args.push_back("-isystem"); args.push_back( header );
#include <EragenSystemIncludeFrame.h>
#undef ERAGEN_SYSTEM_INCLUDE_FRAME

	// Headers beside the header, like erfam.h
	args.push_back("-I" + path.parent_path().string());

	for (auto &i : options.includes)
		args.push_back("-I" + i);

	for (auto &d : options.defines)
		args.push_back("-D" + d);

	std::vector<const char *> args_c;
	for (auto &i : args)
		args_c.push_back(i.c_str());

	// Load up the header
	std::unique_ptr<void, void (*)(CXIndex)> index(clang_createIndex(0, 0), clang_disposeIndex);

	CXTranslationUnit tu_raw = nullptr;
	CXTranslationUnit_Flags flags = static_cast<CXTranslationUnit_Flags>(CXTranslationUnit_SkipFunctionBodies | CXTranslationUnit_Incomplete);
	CXErrorCode ec = clang_parseTranslationUnit2(index.get(), path.string().c_str(), args_c.data(), static_cast<int>(args_c.size()), nullptr, 0, flags, &tu_raw);

	if (ec != CXError_Success)
	{
		std::string problem;
		switch (ec)
		{
			case CXError_Failure:
				problem = "Failure";
				break;
			case CXError_Crashed:
				problem = "Crashed";
				break;
			case CXError_InvalidArguments:
				problem = "Invalid Arguments";
				break;
			case CXError_ASTReadError:
				problem = "AST Read Error";
				break;
			default:
				problem = std::to_string(ec);
				break;
		}
		throw std::runtime_error("Failed to parse header \"" + path.string() + "\": " + problem);
	}

	std::unique_ptr<CXTranslationUnitImpl, void (*)(CXTranslationUnit)> tu(tu_raw, clang_disposeTranslationUnit);

	// Check diagnostics
	unsigned int num_diagnostics = clang_getNumDiagnostics(tu.get());
	if (num_diagnostics != 0)
	{
		std::cout << std::flush;

		for (unsigned int i = 0; i < num_diagnostics; i++)
		{
			auto diagnostic = clang_getDiagnostic(tu.get(), i);
			auto severity = clang_getDiagnosticSeverity(diagnostic);
			switch (severity)
			{
				case CXDiagnostic_Ignored:
					break;
				case CXDiagnostic_Note:
				case CXDiagnostic_Warning:
				case CXDiagnostic_Error:
				case CXDiagnostic_Fatal:
					std::cerr << GetCXString(clang_formatDiagnostic(diagnostic, clang_defaultDiagnosticDisplayOptions())) << '\n';
					break;
			}
			clang_disposeDiagnostic(diagnostic);

			if (severity == CXDiagnostic_Error || severity == CXDiagnostic_Fatal)
				throw std::runtime_error("Header parsing ran into a fatal error. See above.");
		}

		std::cerr << std::flush;
	}

	// Visit declarations
	struct VisitorClient
	{
		std::vector<Declaration> decls;
	} client;

	auto visitor = [](CXCursor cursor, CXCursor parent, CXClientData clientData) -> CXChildVisitResult
		{
			auto &client = *(reinterpret_cast<VisitorClient *>(clientData));

			if (!clang_Location_isFromMainFile(clang_getCursorLocation(cursor)))
				return CXChildVisit_Continue;

			if (cursor.kind == CXCursor_LinkageSpec)
				return CXChildVisit_Recurse;

			if (cursor.kind == CXCursor_FunctionDecl)
			{
				Declaration decl;
				decl.name = GetCXString(clang_getCursorSpelling(cursor));

				// The declaration starts with its return type
				CXSourceRange extent = clang_getCursorExtent(cursor);
				clang_getSpellingLocation(clang_getRangeStart(extent), nullptr, &decl.line, nullptr, nullptr);

				// Skip redeclarations
				for (auto &i : client.decls)
				{
					if (i.name == decl.name)
						return CXChildVisit_Continue;
				}

				client.decls.emplace_back(std::move(decl));
			}

			return CXChildVisit_Continue;
		};

	clang_visitChildren(clang_getTranslationUnitCursor(tu.get()), visitor, &client);

	return client.decls;
}

std::vector<FunctionEntry> ScanHeader(const std::filesystem::path &path, const ScanOptions &options)
{
	// Read header text for section markers
	std::string text;
	{
		std::ifstream header_stream(path, std::ios::binary);
		if (!header_stream)
			throw std::runtime_error("Failed to open header: " + path.string());

		std::stringstream header_sstream;
		header_sstream << header_stream.rdbuf();
		text = header_sstream.str();
	}

	std::vector<std::string> lines = SplitLines(text);
	std::vector<SectionBlock> blocks = FindSections(text);
	std::vector<Declaration> decls = ParseDeclarations(path, options);

	// Assign declarations to blocks
	std::vector<FunctionEntry> entries;

	for (auto &block : blocks)
	{
		for (auto &decl : decls)
		{
			if (decl.line < block.first_line || decl.line > block.last_line)
				continue;

			FunctionEntry entry;
			entry.section = block.section;
			entry.subsection = block.subsection;
			entry.name = decl.name;
			entry.line = decl.line;
			entry.anchor = GetAnchor(lines.at(decl.line - 1), decl.name);

			entries.emplace_back(std::move(entry));
		}
	}

	return entries;
}

std::vector<FunctionEntry> SelectSection(const std::vector<FunctionEntry> &entries, const std::string &section)
{
	std::vector<FunctionEntry> result;
	for (auto &i : entries)
	{
		if (i.section == section)
			result.push_back(i);
	}
	return result;
}

}
}
