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

#include <cstdio>
#include <cstdlib>
#include <algorithm>
#include "backtrack.h"

#ifdef BOUNDRX_DEBUG
#define BOUNDRX_TRACE(...) std::fprintf(stderr, __VA_ARGS__)
#else
#define BOUNDRX_TRACE(...) do { } while (0)
#endif

namespace BoundRX {

// Number of (instruction, position) states; false if it does not fit a size_t.
static bool
nstates(std::size_t ninsts, std::size_t textlen, std::size_t &n)
{
	return !__builtin_add_overflow(textlen, 1, &n) && !__builtin_mul_overflow(ninsts, n, &n);
}

static std::size_t
nwords(std::size_t states)
{
	return states / BitSize + (states % BitSize != 0);
}

bool
should_exec(std::size_t ninsts, std::size_t textlen)
{
	// Total memory use in bytes is
	//
	//   ((ninsts * (textlen + 1) + BitSize - 1) / BitSize) * sizeof (Bits)
	//
	// and the ceiling is a heuristic.
	std::size_t n;
	if (!nstates(ninsts, textlen, n))
		return false;
	return nwords(n) <= MaxSizeBytes / sizeof (Bits);
}

void
Cache::clear(std::size_t ninsts, std::size_t textlen)
{
	jobs.clear();
	explored = 0;
	std::size_t n;
	if (!nstates(ninsts, textlen, n)) {
		std::fprintf(stderr, "BUG: %zu instructions over %zu bytes overflow the visited set\n", ninsts, textlen);
		abort();
	}
	auto len = nwords(n);
	if (visited.size() > len)
		visited.resize(len);
	std::fill(visited.begin(), visited.end(), 0);
	visited.resize(len, 0);
}

CachePool::Guard
CachePool::checkout()
{
	std::unique_ptr<Cache> cache;
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (!freelist.empty()) {
			cache = std::move(freelist.back());
			freelist.pop_back();
		}
	}
	if (!cache)
		cache = std::make_unique<Cache>();
	return Guard(*this, std::move(cache));
}

void
CachePool::release(std::unique_ptr<Cache> cache)
{
	std::lock_guard<std::mutex> lock(mutex);
	freelist.push_back(std::move(cache));
}

std::size_t
CachePool::idle()
{
	std::lock_guard<std::mutex> lock(mutex);
	return freelist.size();
}

bool
Bounded::exec(const Program &prog, Cache &cache, bool *matches, std::size_t nm, const Context &ctx, std::size_t start, std::size_t end)
{
	return Bounded(prog, cache, matches, nm, ctx).exec_(start, end);
}

void
Bounded::clear()
{
	m.clear(prog.size(), ctx.len());
}

bool
Bounded::exec_(std::size_t at, std::size_t end)
{
	clear();
	end = std::min(end, ctx.len());
	// an anchored program either matches here or not at all
	if (prog.is_anchored_start) {
		BOUNDRX_TRACE("boundrx: anchored attempt at %zu\n", at);
		return backtrack(at);
	}
	bool matched = false;
	for (;;) {
		if (!prog.prefixes.empty()) {
			auto p = ctx.prefix_at(prog.prefixes, at);
			if (!p.has_value() || *p > end)
				break;
			if (*p != at)
				BOUNDRX_TRACE("boundrx: prefix skip %zu -> %zu\n", at, *p);
			at = *p;
		}
		BOUNDRX_TRACE("boundrx: attempt at %zu\n", at);
		matched = backtrack(at) || matched;
		if (matched && prog.matches.size() == 1)
			return true;
		if (at >= end)
			break;
		at = ctx.next(at);
	}
	return matched;
}

bool
Bounded::backtrack(std::size_t at)
{
	// N.B. explicit stack, no recursion.  step() only pushes on a Split.
	bool matched = false;
	m.jobs.push_back({prog.start, at});
	while (!m.jobs.empty()) {
		auto job = m.jobs.back();
		m.jobs.pop_back();
		if (step(job.ip, job.at)) {
			// a regex set keeps going to find the other alternatives
			if (prog.matches.size() == 1)
				return true;
			matched = true;
		}
	}
	return matched;
}

bool
Bounded::step(InstPtr ip, std::size_t at)
{
	for (;;) {
		if (has_visited(ip, at))
			return false;
		const auto &inst = prog[ip];
		switch (inst.type) {
		case Inst::Match:
			BOUNDRX_TRACE("boundrx: match slot %zu at %zu\n", inst.slot(), at);
			if (inst.slot() < nm)
				matches[inst.slot()] = true;
			return true;
		case Inst::Split:
			m.jobs.push_back({inst.goto2(), at});
			ip = inst.goto1();
			break;
		case Inst::Zero:
			if (!ctx.is_empty_match(at, inst.look))
				return false;
			ip = inst.args[0];
			break;
		case Inst::One:
		case Inst::Interval:
			if (!inst.matches(ctx[at]))
				return false;
			ip = inst.args[0];
			at = ctx.next(at);
			break;
		default:
			abort();
		}
	}
}

bool
Bounded::has_visited(InstPtr ip, std::size_t at)
{
	std::size_t k;
	if (at > ctx.len() || __builtin_mul_overflow(ip, ctx.len() + 1, &k) || __builtin_add_overflow(k, at, &k) || k / BitSize >= m.visited.size()) {
		std::fprintf(stderr, "BUG: state (%zu, %zu) is outside the visited set\n", ip, at);
		abort();
	}
	Bits bit = (Bits) 1 << (k & (BitSize - 1));
	auto &word = m.visited[k / BitSize];
	if ((word & bit) != 0)
		return true;
	word |= bit;
	++m.explored;
	return false;
}

}
