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

#ifndef MD_BRANCH_SET_H
#define MD_BRANCH_SET_H
#include <list>
#include <string>
#include <string_view>
#include <fmt/format.h>
#include "md_branchman/Errors.h"
#include "md_branchman/ParserOptions.h"

namespace mdbm_impl {
	/**
	The speculative states of a single ambiguity site. Branches are forked
	with a priority, killed with a reason, and merged at the end of the site.
	References returned by fork() stay valid for the life of the set.
	*/
	template<typename State>
	class BranchSet {
	public:
		struct Branch {
			State state;
			int priority;
			std::string_view name;
			bool alive;
		};

		BranchSet(std::string_view site, const md_branchman::UInt line, const md_branchman::TraceSink* trace) noexcept
			: site_{ site }, line_{ line }, trace_{ trace } {}

		Branch& fork(State state, const int priority, std::string_view name) {
			branches_.push_back(Branch{ std::move(state), priority, name, true });
			return branches_.back();
		}

		void kill(Branch& branch, std::string_view reason) {
			if (not branch.alive) {
				return;
			}
			branch.alive = false;
			emit(fmt::format("line {} {}: killed {} ({})", line_, site_, branch.name, reason));
		}

		size_t survivors() const noexcept {
			size_t n = 0;
			for (const auto& b : branches_) {
				n += b.alive ? 1 : 0;
			}
			return n;
		}

		// The site admits exactly one reading of the input.
		Branch& mergeExactlyOne() {
			Branch* winner = nullptr;
			for (auto& b : branches_) {
				if (not b.alive) {
					continue;
				}
				if (winner) {
					throw md_branchman::GrammarInvariantError(std::string{ site_ }, line_,
						fmt::format("both {} and {} survived", winner->name, b.name));
				}
				winner = &b;
			}
			if (not winner) {
				throw md_branchman::GrammarInvariantError(std::string{ site_ }, line_, "no branch survived");
			}
			emit(fmt::format("line {} {}: merged into {}", line_, site_, winner->name));
			return *winner;
		}

		// Highest priority wins; two live branches on the top priority is a defect.
		Branch& mergeByPriority() {
			Branch* winner = nullptr;
			bool tied = false;
			for (auto& b : branches_) {
				if (not b.alive) {
					continue;
				}
				if (not winner or b.priority > winner->priority) {
					winner = &b;
					tied = false;
				}
				else if (b.priority == winner->priority) {
					tied = true;
				}
			}
			if (not winner) {
				throw md_branchman::GrammarInvariantError(std::string{ site_ }, line_, "no branch survived");
			}
			if (tied) {
				throw md_branchman::GrammarInvariantError(std::string{ site_ }, line_,
					fmt::format("priority tie at {} for {}", winner->priority, winner->name));
			}
			emit(fmt::format("line {} {}: merged into {} (priority {})", line_, site_, winner->name, winner->priority));
			return *winner;
		}

	private:
		void emit(const std::string& message) const {
			if (trace_ and *trace_) {
				(*trace_)(message);
			}
		}

		std::string_view site_;
		md_branchman::UInt line_;
		const md_branchman::TraceSink* trace_;
		std::list<Branch> branches_;
	};
}

#endif
