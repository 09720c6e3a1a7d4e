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

#include <iterator>
#include <stdexcept>
#include <fmt/format.h>
#include "md_branchman/MDBranchMan.h"

MDBMNode::public_iterator::self_type& MDBMNode::public_iterator::operator++() noexcept {
	const MDBMNode& current = **this;
	const bool atRoot = std::holds_alternative<pointer_type>(_valPtr);

	if (not _retracting and not current.children.empty()) {
		if (not atRoot) {
			_parents.push_back(std::get<storage_it_t>(_valPtr));
		}
		_valPtr = current.children.cbegin();
		return *this;
	}
	if (atRoot) {
		// the walk is over
		_valPtr = pointer_type{ nullptr };
		_retracting = false;
		_parents.clear();
		return *this;
	}

	const auto it = std::get<storage_it_t>(_valPtr);
	const MDBMNode& parent = _parents.empty() ? *_root : *_parents.back();
	if (std::next(it) != parent.children.cend()) {
		_valPtr = std::next(it);
		_retracting = false;
		return *this;
	}
	if (_parents.empty()) {
		_valPtr = _root;
	}
	else {
		_valPtr = _parents.back();
		_parents.pop_back();
	}
	_retracting = true;
	return *this;
}

MDBMNode::public_iterator::self_type MDBMNode::public_iterator::operator++(int) noexcept {
	self_type itCopy = *this;
	++(*this);
	return itCopy;
}

bool MDBMNode::endsWithBlankLine() const noexcept {
	const MDBMNode* node = this;
	while (not node->children.empty()) {
		const MDBMNode& last = node->children.back();
		if (last.flavor == type_e::BlankLine) {
			return true;
		}
		if (last.flavor != type_e::List and last.flavor != type_e::ListItem) {
			return false;
		}
		node = &last;
	}
	return false;
}

const MDBMNode& MDBMNode::at(size_t i) const {
	if (i >= children.size()) {
		throw std::out_of_range(fmt::format("child {} of {}", i, children.size()));
	}
	return *std::next(children.begin(), static_cast<std::ptrdiff_t>(i));
}
