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

#include <cstring>
#include <algorithm>
#include <string_view>
#include "literal.h"

namespace BoundRX {

LiteralSearcher &
LiteralSearcher::add(std::string lit)
{
	if (!lit.empty() && std::find(lits.begin(), lits.end(), lit) == lits.end())
		lits.push_back(std::move(lit));
	return *this;
}

std::optional<std::pair<std::size_t, std::size_t>>
LiteralSearcher::find(const char *bp, const char *ep) const
{
	if (lits.empty() || bp >= ep)
		return std::nullopt;
	std::size_t n = ep - bp;
	if (lits.size() == 1 && lits[0].size() == 1) {
		auto p = static_cast<const char *>(std::memchr(bp, lits[0][0], n));
		if (p == nullptr)
			return std::nullopt;
		return std::make_pair((std::size_t) (p - bp), (std::size_t) (p - bp) + 1);
	}
	std::string_view text(bp, n);
	std::optional<std::pair<std::size_t, std::size_t>> best;
	for (const auto &lit : lits) {
		// only the part before the current best can improve on it
		auto limit = best.has_value() ? std::min(n, best->first + lit.size()) : n;
		auto i = text.substr(0, limit).find(lit);
		if (i != std::string_view::npos && (!best.has_value() || i < best->first))
			best = std::make_pair(i, i + lit.size());
	}
	return best;
}

std::size_t
LiteralSearcher::approximate_size() const
{
	std::size_t size = lits.size() * sizeof (std::string);
	for (const auto &lit : lits)
		size += lit.size();
	return size;
}

}
