//
// BoundRX: a bounded backtracking matcher for compiled regex programs.
// Copyright (C) 2023, 2024, 2025 Michael J. Haertel.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions
// are met:
//
// 1. Redistributions of source code must retain the above copyright
//    notice, this list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright
//    notice, this list of conditions and the following disclaimer in the
//    documentation and/or other materials provided with the distribution.
//
// THIS SOFTWARE IS PROVIDED BY THE AUTHOR AND CONTRIBUTORS “AS IS” AND
// ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
// ARE DISCLAIMED. IN NO EVENT SHALL THE AUTHOR OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS
// OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION)
// HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT
// LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY
// OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF
// SUCH DAMAGE.
//

#include <string>
#include "gtest/gtest.h"
#include "literal.h"

namespace {

using BoundRX::LiteralSearcher;

std::optional<std::pair<std::size_t, std::size_t>>
find(const LiteralSearcher &ls, const std::string &text)
{
	return ls.find(text.data(), text.data() + text.size());
}

TEST(LiteralSearcher, EmptyFindsNothing) {
	LiteralSearcher ls;
	EXPECT_TRUE(ls.empty());
	EXPECT_FALSE(find(ls, "anything").has_value());
}

TEST(LiteralSearcher, IgnoresEmptyAndDuplicateLiterals) {
	LiteralSearcher ls;
	ls.add("").add("ab").add("ab");
	EXPECT_EQ(ls.size(), 1u);
	EXPECT_EQ(ls[0], "ab");
}

TEST(LiteralSearcher, SingleByte) {
	LiteralSearcher ls;
	ls.add("q");
	auto m = find(ls, "abcqq");
	ASSERT_TRUE(m.has_value());
	EXPECT_EQ(m->first, 3u);
	EXPECT_EQ(m->second, 4u);
	EXPECT_FALSE(find(ls, "abc").has_value());
	EXPECT_FALSE(find(ls, "").has_value());
}

TEST(LiteralSearcher, LeftmostOfSeveral) {
	LiteralSearcher ls;
	ls.add("needle").add("hay");
	auto m = find(ls, "xxneedle hay");
	ASSERT_TRUE(m.has_value());
	EXPECT_EQ(m->first, 2u);
	EXPECT_EQ(m->second, 8u);
	m = find(ls, "xhayneedle");
	ASSERT_TRUE(m.has_value());
	EXPECT_EQ(m->first, 1u);
	EXPECT_EQ(m->second, 4u);
}

TEST(LiteralSearcher, TieGoesToFirstAdded) {
	LiteralSearcher ls;
	ls.add("abc").add("ab");
	auto m = find(ls, "zzabcd");
	ASSERT_TRUE(m.has_value());
	EXPECT_EQ(m->first, 2u);
	EXPECT_EQ(m->second, 5u);
}

TEST(LiteralSearcher, LiteralLongerThanText) {
	LiteralSearcher ls;
	ls.add("abcdef");
	EXPECT_FALSE(find(ls, "abc").has_value());
}

TEST(LiteralSearcher, ApproximateSizeCountsBytes) {
	LiteralSearcher ls;
	auto base = ls.approximate_size();
	ls.add("abcd");
	EXPECT_GE(ls.approximate_size(), base + 4);
}

}
