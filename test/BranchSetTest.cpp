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
#include <vector>
#include <gtest/gtest.h>
#include "BranchSet.h"

using mdbm_impl::BranchSet;
using md_branchman::GrammarInvariantError;

namespace {
	struct BranchSetTest : public ::testing::Test {
		std::vector<std::string> trace;
		md_branchman::TraceSink sink = [this](std::string_view msg) { trace.emplace_back(msg); };
	};
}

TEST_F(BranchSetTest, ExactlyOneSurvivor) {
	BranchSet<int> branches{ "demo", 4, &sink };
	auto& a = branches.fork(1, 0, "first");
	branches.fork(2, 0, "second");
	branches.kill(a, "not applicable");

	EXPECT_EQ(branches.survivors(), 1u);
	EXPECT_EQ(branches.mergeExactlyOne().state, 2);
	ASSERT_EQ(trace.size(), 2u);
	EXPECT_EQ(trace[0], "line 4 demo: killed first (not applicable)");
	EXPECT_EQ(trace[1], "line 4 demo: merged into second");
}

TEST_F(BranchSetTest, KillIsReportedOnce) {
	BranchSet<int> branches{ "demo", 0, &sink };
	auto& a = branches.fork(1, 0, "first");
	branches.fork(2, 0, "second");
	branches.kill(a, "once");
	branches.kill(a, "twice");
	EXPECT_EQ(trace.size(), 1u);
}

TEST_F(BranchSetTest, NoSurvivorIsAnInvariantViolation) {
	BranchSet<int> branches{ "empty-site", 7, nullptr };
	auto& a = branches.fork(1, 0, "only");
	branches.kill(a, "gone");
	try {
		branches.mergeExactlyOne();
		FAIL() << "merge must throw";
	}
	catch (const GrammarInvariantError& e) {
		EXPECT_EQ(e.site(), "empty-site");
		EXPECT_EQ(e.line(), 7u);
		EXPECT_EQ(std::string{ e.what() }, "empty-site at line 7: no branch survived");
	}
}

TEST_F(BranchSetTest, TwoSurvivorsIsAnInvariantViolation) {
	BranchSet<int> branches{ "demo", 0, nullptr };
	branches.fork(1, 0, "first");
	branches.fork(2, 0, "second");
	EXPECT_THROW(branches.mergeExactlyOne(), GrammarInvariantError);
}

TEST_F(BranchSetTest, HighestPriorityWins) {
	BranchSet<std::string> branches{ "demo", 2, &sink };
	branches.fork("low", 1, "low");
	branches.fork("high", 3, "high");
	auto& mid = branches.fork("mid", 2, "mid");
	branches.kill(mid, "no");
	EXPECT_EQ(branches.mergeByPriority().state, "high");
	EXPECT_EQ(trace.back(), "line 2 demo: merged into high (priority 3)");
}

TEST_F(BranchSetTest, PriorityTieThrows) {
	BranchSet<int> branches{ "demo", 0, nullptr };
	branches.fork(1, 5, "a");
	branches.fork(2, 5, "b");
	branches.fork(3, 1, "c");
	EXPECT_THROW(branches.mergeByPriority(), GrammarInvariantError);
}

TEST_F(BranchSetTest, EmptyTraceSinkIsIgnored) {
	md_branchman::TraceSink none;
	BranchSet<int> branches{ "demo", 0, &none };
	auto& a = branches.fork(1, 0, "a");
	branches.fork(2, 0, "b");
	branches.kill(a, "quiet");
	EXPECT_EQ(branches.mergeExactlyOne().state, 2);
}
