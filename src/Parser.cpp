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

#include <istream>
#include <string>
#include <string_view>
#include <fmt/format.h>
#include "md_branchman/MDBranchMan.h"
#include "BlockContext.h"

namespace md = md_branchman;
using type_e = MDBMNode::type_e;

md::GrammarInvariantError::GrammarInvariantError(std::string site, UInt line, const std::string& detail)
	: std::logic_error{ fmt::format("{} at line {}: {}", site, line, detail) },
	site_{ std::move(site) },
	line_{ line }
{}

namespace {
	auto makeContext(md::ParserOptions opts, const char* begin, const char* end) -> md::impl::Context* {
		auto* ctx = new md::impl::Context{ std::move(opts), MDBMNode{ type_e::Document, true, 0, 0 } };
		ctx->stack.push_back(md::impl::OpenBlock{ &ctx->document, {} });
		ctx->srcCur = begin;
		ctx->srcEnd = end;
		return ctx;
	}

	// Feeds one terminated line that may still hold bare '\r' separators.
	// The segment after the last separator is a line of its own, even when empty.
	bool feedLine(md::impl::Context& ctx, std::string_view chunk) {
		if (ctx.finalized) {
			return false;
		}
		size_t start = 0;
		for (size_t i = 0; i < chunk.size(); ++i) {
			if (chunk[i] == '\r' or chunk[i] == '\n') {
				mdbm_impl::incorporateLine(ctx, chunk.substr(start, i - start));
				if (chunk[i] == '\r' and i + 1 < chunk.size() and chunk[i + 1] == '\n') {
					++i;
				}
				start = i + 1;
			}
		}
		mdbm_impl::incorporateLine(ctx, chunk.substr(start));
		return true;
	}

	void removeBlankLines(MDBMNode& node) {
		node.children.remove_if([](const MDBMNode& n) { return n.flavor == type_e::BlankLine; });
		for (auto& child : node.children) {
			if (child.isContainer()) {
				removeBlankLines(child);
			}
		}
	}
}

md::Parser::Parser(md::Parser&& o) noexcept : ctx_{ o.ctx_ } {
	o.ctx_ = nullptr;
}

md::Parser::Parser() : ctx_{ makeContext({}, nullptr, nullptr) } {}

md::Parser::Parser(ParserOptions opts) : ctx_{ makeContext(std::move(opts), nullptr, nullptr) } {}

md::Parser::Parser(const char* begin, const char* end, ParserOptions opts) : ctx_{ makeContext(std::move(opts), begin, end) } {}

md::Parser::~Parser() { delete ctx_; }

bool md::Parser::processLine(std::istream& in) {
	std::string line;
	if (ctx_->finalized or not std::getline(in, line)) {
		return false;
	}
	// getline leaves the '\r' of a CRLF pair behind
	if (not line.empty() and line.back() == '\r') {
		line.pop_back();
	}
	return feedLine(*ctx_, line);
}

bool md::Parser::processLine(const char* data, const size_t len) {
	std::string_view chunk{ data, len };
	if (not chunk.empty() and chunk.back() == '\n') {
		chunk.remove_suffix(1);
	}
	if (not chunk.empty() and chunk.back() == '\r') {
		chunk.remove_suffix(1);
	}
	return feedLine(*ctx_, chunk);
}

bool md::Parser::processLine() {
	if (ctx_->finalized or ctx_->srcCur == nullptr or ctx_->srcCur == ctx_->srcEnd) {
		return false;
	}
	const char* lineEnd = ctx_->srcCur;
	while (lineEnd != ctx_->srcEnd and *lineEnd != '\n' and *lineEnd != '\r') {
		++lineEnd;
	}
	mdbm_impl::incorporateLine(*ctx_, std::string_view{ ctx_->srcCur, static_cast<size_t>(lineEnd - ctx_->srcCur) });
	if (lineEnd != ctx_->srcEnd) {
		if (*lineEnd == '\r' and lineEnd + 1 != ctx_->srcEnd and lineEnd[1] == '\n') {
			++lineEnd;
		}
		++lineEnd;
	}
	ctx_->srcCur = lineEnd;
	return true;
}

void md::Parser::finalizeDocument() {
	if (ctx_->finalized) {
		return;
	}
	mdbm_impl::closeAllBlocks(*ctx_);
	mdbm_impl::collectReferenceDefinitions(*ctx_);
	mdbm_impl::parseAllInlines(*ctx_, ctx_->document);
	if (not ctx_->opts.keepBlankLines) {
		removeBlankLines(ctx_->document);
	}
	ctx_->document.lineEnd = ctx_->lineNumber == 0 ? 0 : ctx_->lineNumber - 1;
	ctx_->finalized = true;
}

const MDBMNode& md::Parser::document() const noexcept {
	return ctx_->document;
}

MDBMNode md::Parser::takeDocument() {
	finalizeDocument();
	return std::move(ctx_->document);
}

MDBMNode::public_iterator md::Parser::begin() const noexcept {
	return { &ctx_->document };
}

MDBMNode::public_iterator md::Parser::end() const noexcept {
	return {};
}

auto md::parseDocument(std::string_view text, const ParserOptions& opts) -> MDBMNode {
	Parser parser{ text.data(), text.data() + text.size(), opts };
	while (parser.processLine()) {}
	return parser.takeDocument();
}

auto md::parseDocument(std::istream& in, const ParserOptions& opts) -> MDBMNode {
	Parser parser{ opts };
	while (parser.processLine(in)) {}
	return parser.takeDocument();
}
