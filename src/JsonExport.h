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

#ifndef MDBTREE_JSON_EXPORT_H
#define MDBTREE_JSON_EXPORT_H
#include <string>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "md_branchman/MDBranchMan.h"

namespace mdbtree {
	class ConfigError : public std::runtime_error {
	public:
		using std::runtime_error::runtime_error;
	};

	auto toJson(const MDBMNode& node, const md_branchman::TreeDumpOptions& opts = {}) -> nlohmann::json;

	// Keys mirror the ParserOptions member names; unknown keys and wrong types raise ConfigError.
	void applyConfig(const nlohmann::json& config, md_branchman::ParserOptions& opts);
	void loadConfigFile(const std::string& path, md_branchman::ParserOptions& opts);

	// WHATWG entities.json: { "&amp;": { "codepoints": [38], "characters": "&" }, ... }
	auto loadEntityTable(const nlohmann::json& entities) -> md_branchman::MapEntityTable;
	auto loadEntityFile(const std::string& path) -> md_branchman::MapEntityTable;
}

#endif
