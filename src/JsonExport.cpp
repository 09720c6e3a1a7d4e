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

#include <fstream>
#include <limits>
#include <cstdint>
#include <fmt/format.h>
#include "JsonExport.h"

namespace md = md_branchman;
using type_e = MDBMNode::type_e;
using nlohmann::json;

namespace {
	// Counts and limits: non-negative integers that fit an md::UInt.
	auto getLimit(const std::string& key, const json& value) -> md::UInt {
		if (not value.is_number_unsigned() or value.get<uint64_t>() > std::numeric_limits<md::UInt>::max()) {
			throw mdbtree::ConfigError(fmt::format("configuration key \"{}\" must be a non-negative integer", key));
		}
		return value.get<md::UInt>();
	}

	void addAttributes(const MDBMNode& node, json& j) {
		switch (node.flavor) {
		case type_e::ATXHeading:
		case type_e::SetextHeading:
			j["level"] = static_cast<int>(std::get<Heading>(node.crtrstc).lvl);
			break;
		case type_e::FencedCode:
		{
			const auto& fence = std::get<FencedCode>(node.crtrstc);
			j["info"] = fence.infoStr;
			j["fence"] = std::string(static_cast<size_t>(fence.length), static_cast<char>(fence.type));
			j["closed"] = fence.closed;
			break;
		}
		case type_e::List:
		{
			const auto& list = std::get<ListInfo>(node.crtrstc);
			j["marker"] = std::string(1, static_cast<char>(list.symbolUsed));
			j["ordered"] = list.isOrdered();
			if (list.isOrdered()) {
				j["start"] = list.orderedStart;
			}
			j["tight"] = list.isTight;
			break;
		}
		case type_e::HtmlBlock:
			j["rule"] = std::get<HtmlBlock>(node.crtrstc).rule;
			break;
		case type_e::LinkRefDef:
		{
			const auto& def = std::get<LinkRefDef>(node.crtrstc);
			j["label"] = def.label;
			j["destination"] = def.destination;
			if (def.title) {
				j["title"] = *def.title;
			}
			break;
		}
		case type_e::Link:
		case type_e::Image:
		{
			static const char* const forms[] = { "inline", "full", "collapsed", "shortcut" };
			const auto& link = std::get<LinkInfo>(node.crtrstc);
			j["form"] = forms[static_cast<size_t>(link.form)];
			j["destination"] = link.destination;
			if (link.title) {
				j["title"] = *link.title;
			}
			break;
		}
		case type_e::Autolink:
		{
			const auto& autolink = std::get<Autolink>(node.crtrstc);
			j["destination"] = autolink.destination;
			j["email"] = autolink.isEmail;
			break;
		}
		case type_e::EntityRef:
		case type_e::NumericCharRef:
			j["decoded"] = std::get<CharRef>(node.crtrstc).decoded;
			break;
		case type_e::CodeSpan:
			j["fence_length"] = std::get<CodeSpan>(node.crtrstc).fenceLength;
			break;
		default:
			break;
		}
	}

	auto readJsonFile(const std::string& path, std::string_view what) -> json {
		std::ifstream in{ path };
		if (not in) {
			throw mdbtree::ConfigError(fmt::format("cannot open {} file {}", what, path));
		}
		try {
			return json::parse(in);
		}
		catch (const json::parse_error& e) {
			throw mdbtree::ConfigError(fmt::format("{} file {}: {}", what, path, e.what()));
		}
	}
}

auto mdbtree::toJson(const MDBMNode& node, const md::TreeDumpOptions& opts) -> json {
	json j = json::object();
	j["type"] = md::nodeTypeName(node.flavor);
	if (opts.includePositions) {
		j["lines"] = { node.lineBegin, node.lineEnd };
	}
	if (not node.literal.empty() and not node.isContainer()) {
		j["literal"] = node.literal;
	}
	addAttributes(node, j);
	if (not node.children.empty()) {
		json children = json::array();
		for (const auto& child : node.children) {
			if (opts.includeBlankLines or child.flavor != type_e::BlankLine) {
				children.push_back(toJson(child, opts));
			}
		}
		j["children"] = std::move(children);
	}
	return j;
}

void mdbtree::applyConfig(const json& config, md::ParserOptions& opts) {
	if (not config.is_object()) {
		throw ConfigError("configuration must be a JSON object");
	}
	for (const auto& [key, value] : config.items()) {
		try {
			if (key == "keepBlankLines") {
				opts.keepBlankLines = value.get<bool>();
			}
			else if (key == "resolveReferences") {
				opts.resolveReferences = value.get<bool>();
			}
			else if (key == "multilineLinkText") {
				opts.multilineLinkText = value.get<bool>();
			}
			else if (key == "maxDestinationParenDepth") {
				opts.maxDestinationParenDepth = getLimit(key, value);
			}
			else if (key == "maxLinkLabelLength") {
				opts.maxLinkLabelLength = getLimit(key, value);
			}
			else if (key == "maxNestingDepth") {
				opts.maxNestingDepth = getLimit(key, value);
			}
			else {
				throw ConfigError(fmt::format("unknown configuration key \"{}\"", key));
			}
		}
		catch (const json::type_error& e) {
			throw ConfigError(fmt::format("configuration key \"{}\": {}", key, e.what()));
		}
	}
}

void mdbtree::loadConfigFile(const std::string& path, md::ParserOptions& opts) {
	applyConfig(readJsonFile(path, "config"), opts);
}

auto mdbtree::loadEntityTable(const json& entities) -> md::MapEntityTable {
	if (not entities.is_object()) {
		throw ConfigError("entity table must be a JSON object");
	}
	md::MapEntityTable table;
	for (const auto& [key, value] : entities.items()) {
		// legacy names without the trailing ';' never match a reference
		if (key.size() < 3 or key.front() != '&' or key.back() != ';') {
			continue;
		}
		if (not value.is_object() or not value.contains("characters") or not value["characters"].is_string()) {
			throw ConfigError(fmt::format("entity {} has no characters", key));
		}
		table.insert(key.substr(1, key.size() - 2), value["characters"].get<std::string>());
	}
	return table;
}

auto mdbtree::loadEntityFile(const std::string& path) -> md::MapEntityTable {
	return loadEntityTable(readJsonFile(path, "entity"));
}
