/*
MIT License

Copyright (c) 2020 Christian Greyeyes

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/

#include <string>
#include <map>
#include <vector>
#include <fstream>
#include <iostream>
#include <optional>

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include "md_branchman/MDBranchMan.h"
#include "JsonExport.h"

namespace md = md_branchman;

namespace mdbtree {
	enum class out_format : uint8_t {
		SExpr, Json, Markdown
	};
	enum exit_code : int {
		Success = 0, IoFailure = 1, ConfigFailure = 2, GrammarFailure = 3
	};
	struct CmdArgInfo {
		std::vector<std::string> inFiles;
		std::string outFilename;
		std::string configFilename;
		std::string entityFilename;
		out_format format = out_format::SExpr;
		bool positions = false;
		bool noBlankLines = false;
		bool trace = false;
		bool noReferences = false;
		bool singleLineLinks = false;
		md::UInt parenDepth = 1;
		md::UInt nestingDepth = 128;
	};
}

void configureParser(CLI::App& cmdArgParser, mdbtree::CmdArgInfo& argInfo);
void applyFlags(const CLI::App& argProcessor, const mdbtree::CmdArgInfo& argInfo, md::ParserOptions& opts);
bool writeTree(const MDBMNode& doc, const mdbtree::CmdArgInfo& argInfo, std::ostream& out);

int main(int argc, char* argv[])
{
	mdbtree::CmdArgInfo cmdArgResult{};

	CLI::App argProcessor{ "Parses markdown into its block and inline structure and prints the tree.", "mdbtree" };

	configureParser(argProcessor, cmdArgResult);

	CLI11_PARSE(argProcessor, argc, argv);

	md::ParserOptions opts{};
	std::optional<md::MapEntityTable> entities;
	try {
		if (not cmdArgResult.configFilename.empty()) {
			mdbtree::loadConfigFile(cmdArgResult.configFilename, opts);
		}
		if (not cmdArgResult.entityFilename.empty()) {
			entities.emplace(mdbtree::loadEntityFile(cmdArgResult.entityFilename));
			opts.entities = &*entities;
		}
	}
	catch (const mdbtree::ConfigError& e) {
		fmt::print(stderr, "mdbtree: {}\n", e.what());
		return mdbtree::ConfigFailure;
	}
	applyFlags(argProcessor, cmdArgResult, opts);

	std::optional<std::ofstream> outFile;
	std::ostream* outStream = &std::cout;
	if (not cmdArgResult.outFilename.empty()) {
		outFile.emplace(cmdArgResult.outFilename);
		if (not *outFile) {
			fmt::print(stderr, "mdbtree: cannot open {} for writing\n", cmdArgResult.outFilename);
			return mdbtree::IoFailure;
		}
		outStream = &*outFile;
	}

	int result = mdbtree::Success;
	try {
		if (cmdArgResult.inFiles.empty()) {
			if (not writeTree(md::parseDocument(std::cin, opts), cmdArgResult, *outStream)) {
				result = mdbtree::IoFailure;
			}
		}
		const bool singleFile = cmdArgResult.inFiles.size() == 1;
		for (const auto& inFilename : cmdArgResult.inFiles) {
			std::ifstream streamie{ inFilename, std::ios::binary };
			if (not streamie) {
				fmt::print(stderr, "mdbtree: file not found; skipping {}\n", inFilename);
				result = mdbtree::IoFailure;
				continue;
			}
			if (not singleFile) {
				*outStream << inFilename << ":\n";
			}
			if (not writeTree(md::parseDocument(streamie, opts), cmdArgResult, *outStream)) {
				fmt::print(stderr, "mdbtree: could not write the tree of {}\n", inFilename);
				result = mdbtree::IoFailure;
			}
		}
	}
	catch (const md::GrammarInvariantError& e) {
		fmt::print(stderr, "mdbtree: internal grammar error: {}\n", e.what());
		return mdbtree::GrammarFailure;
	}
	if (not *outStream) {
		fmt::print(stderr, "mdbtree: write failed\n");
		return mdbtree::IoFailure;
	}
	return result;
}

void configureParser(CLI::App& cmdArgParser, mdbtree::CmdArgInfo& argInfo) {
	const std::map<std::string, mdbtree::out_format> formats{
		{ "sexp", mdbtree::out_format::SExpr },
		{ "json", mdbtree::out_format::Json },
		{ "markdown", mdbtree::out_format::Markdown }
	};
	cmdArgParser.add_option("files", argInfo.inFiles, "Markdown files to parse; stdin when none are given");
	cmdArgParser.add_option("-o,--output", argInfo.outFilename, "Write the tree to this file instead of stdout");
	cmdArgParser.add_option("-f,--format", argInfo.format, "Output format")
		->transform(CLI::CheckedTransformer(formats, CLI::ignore_case));
	cmdArgParser.add_option("-c,--config", argInfo.configFilename, "JSON file of parser options")
		->check(CLI::ExistingFile);
	cmdArgParser.add_option("-e,--entities", argInfo.entityFilename, "JSON entity table replacing the builtin one")
		->check(CLI::ExistingFile);
	cmdArgParser.add_flag("-p,--positions", argInfo.positions, "Print line spans of every node");
	cmdArgParser.add_flag("--no-blank-lines", argInfo.noBlankLines, "Drop blank line nodes from the tree");
	cmdArgParser.add_flag("-t,--trace", argInfo.trace, "Report killed branches on stderr");
	cmdArgParser.add_flag("--no-references", argInfo.noReferences, "Leave reference-style links unresolved");
	cmdArgParser.add_flag("--single-line-links", argInfo.singleLineLinks, "Reject link text spanning a line break");
	cmdArgParser.add_option("--max-paren-depth", argInfo.parenDepth, "Nesting limit of parentheses in link destinations");
	cmdArgParser.add_option("--max-nesting", argInfo.nestingDepth, "Nesting limit of quotes and list items")
		->check(CLI::PositiveNumber);
}

// Command line flags win over the config file, so only the ones given are applied.
void applyFlags(const CLI::App& argProcessor, const mdbtree::CmdArgInfo& argInfo, md::ParserOptions& opts) {
	const auto given = [&argProcessor](const char* name) {
		return argProcessor.count(name) > 0;
	};
	if (given("--no-blank-lines")) {
		opts.keepBlankLines = false;
	}
	if (given("--no-references")) {
		opts.resolveReferences = false;
	}
	if (given("--single-line-links")) {
		opts.multilineLinkText = false;
	}
	if (given("--max-paren-depth")) {
		opts.maxDestinationParenDepth = argInfo.parenDepth;
	}
	if (given("--max-nesting")) {
		opts.maxNestingDepth = argInfo.nestingDepth;
	}
	if (argInfo.trace) {
		opts.branchTrace = [](std::string_view msg) {
			fmt::print(stderr, "{}\n", msg);
		};
	}
}

bool writeTree(const MDBMNode& doc, const mdbtree::CmdArgInfo& argInfo, std::ostream& out) {
	md::TreeDumpOptions dumpOpts{};
	dumpOpts.includePositions = argInfo.positions;
	switch (argInfo.format) {
	case mdbtree::out_format::SExpr:
		out << md::treeDump(doc, dumpOpts) << "\n";
		break;
	case mdbtree::out_format::Json:
		out << mdbtree::toJson(doc, dumpOpts).dump(2) << "\n";
		break;
	case mdbtree::out_format::Markdown:
		return md::markdownExport(doc, out);
	}
	return static_cast<bool>(out);
}
