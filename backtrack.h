//
// BoundRX: a bounded backtracking matcher for compiled regex programs.
// Copyright (C) 2023, 2024 Michael J. Haertel.
//
// This file is part of BoundRX.
//
// BoundRX is free software; you can redistribute it and/or modify it
// under the terms of the GNU Lesser General Public License as published
// by the Free Software Foundation; either version 3 of the License, or
// (at your option) any later version.
//
// BoundRX is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
// See the GNU Lesser General Public License for more details.
//
// You should have received a copy of the GNU Lesser General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//


#ifndef _BOUNDRX_BACKTRACK_H
#define _BOUNDRX_BACKTRACK_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>
#include "context.h"
#include "program.h"

namespace BoundRX {

// Bounded backtracking: the same capability as a full NFA simulation, but
// it remembers every (instruction, position) state it has explored in a
// bitmap and never explores one twice, so a search costs O(insts * len).
// The bitmap has to be zeroed on each search, which limits this engine to
// small programs on small inputs; see should_exec().

typedef uint32_t Bits;
constexpr std::size_t BitSize = 32;
constexpr std::size_t MaxSizeBytes = 256 * (1 << 10);

// True iff a program of ninsts instructions may be run over textlen bytes
// with reasonable memory use.  Callers must pick another engine otherwise.
bool should_exec(std::size_t ninsts, std::size_t textlen);

// An explicit unit of stack space: resume at instruction ip, input offset at.
struct Job {
	InstPtr ip;
	std::size_t at;
};

// Scratch state reused by consecutive searches on one thread.
struct Cache {
	std::vector<Job> jobs;
	std::vector<Bits> visited;
	std::size_t explored = 0;	// states marked since the last clear
	void clear(std::size_t ninsts, std::size_t textlen);
};

// Hands out one Cache per concurrent caller and keeps released ones for reuse.
class CachePool final {
	std::mutex mutex;
	std::vector<std::unique_ptr<Cache>> freelist;
	void release(std::unique_ptr<Cache> cache);
public:
	class Guard final {
		CachePool *pool;
		std::unique_ptr<Cache> cache;
	public:
		Guard(CachePool &pool, std::unique_ptr<Cache> cache): pool(&pool), cache(std::move(cache)) {}
		Guard(const Guard &) = delete;
		Guard &operator=(const Guard &) = delete;
		Guard(Guard &&g) = default;
		~Guard() { if (cache) pool->release(std::move(cache)); }
		Cache &operator*() const { return *cache; }
		Cache *operator->() const { return cache.get(); }
	};
	CachePool() = default;
	CachePool(const CachePool &) = delete;
	CachePool &operator=(const CachePool &) = delete;
	Guard checkout();
	std::size_t idle();
};

class Bounded final {
	const Program &prog;
	const Context &ctx;
	bool *const matches;
	const std::size_t nm;
	Cache &m;
	Bounded(const Program &prog, Cache &m, bool *matches, std::size_t nm, const Context &ctx)
	: prog(prog), ctx(ctx), matches(matches), nm(nm), m(m) {}
	void clear();
	bool exec_(std::size_t at, std::size_t end);
	bool backtrack(std::size_t at);
	bool step(InstPtr ip, std::size_t at);
	bool has_visited(InstPtr ip, std::size_t at);
public:
	// Search ctx from offset start; unanchored programs also try every later
	// position up to end.  Sets matches[slot] for each alternative found
	// (slots >= nm are dropped, nothing is ever cleared) and returns true iff
	// anything matched.
	static bool exec(const Program &prog, Cache &cache, bool *matches, std::size_t nm, const Context &ctx, std::size_t start, std::size_t end);
};

}

#endif /* _BOUNDRX_BACKTRACK_H */
