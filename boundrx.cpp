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
#include <cstring>
#include <algorithm>
#include <memory>
#include <new>
#include <string>
#include "boundrx.h"
#include "backtrack.h"
#include "context.h"
#include "program.h"

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif /* HAVE_CONFIG_H */

#ifdef HAVE_GETTEXT_H
#include <gettext.h>
#define _(msgid)  gettext(msgid)
#else /* ! HAVE_GETTEXT_H */
#define _(msgid)  msgid
#endif /* ! HAVE_GETTEXT_H */

#define N_(msgid) msgid

namespace BoundRX {

// What a boundrx_prog_t points at: the program and the caches searches borrow.
struct Handle {
	Program prog;
	CachePool pool;
};

static Handle *
handle(const boundrx_prog_t *rx)
{
	return reinterpret_cast<Handle *>(rx->bp_program);
}

template <typename F>
static int
append(boundrx_prog_t *rx, std::size_t *index, F inst)
{
	auto h = handle(rx);
	try {
		auto pc = h->prog.push(inst());
		if (index)
			*index = pc;
	} catch (const std::bad_alloc &) {
		return BOUNDRX_ESPACE;
	}
	rx->bp_ninst = h->prog.size();
	rx->bp_nmatch = h->prog.matches.size();
	return BOUNDRX_SUCCESS;
}

}

int
boundrx_prognew(boundrx_prog_t *rx, int flags)
{
	auto h = new (std::nothrow) BoundRX::Handle;
	if (h == nullptr) {
		rx->bp_program = nullptr;
		return BOUNDRX_ESPACE;
	}
	h->prog.is_anchored_start = (flags & BOUNDRX_PROG_ANCHOR_START) != 0;
	h->prog.is_anchored_end = (flags & BOUNDRX_PROG_ANCHOR_END) != 0;
	rx->bp_program = h;
	rx->bp_ninst = 0;
	rx->bp_nmatch = 0;
	rx->bp_flags = (boundrx_prog_flags_t) flags;
	return BOUNDRX_SUCCESS;
}

int
boundrx_progmatch(boundrx_prog_t *rx, size_t slot, size_t *index)
{
	return BoundRX::append(rx, index, [=]() { return BoundRX::Inst::match(slot); });
}

int
boundrx_progsplit(boundrx_prog_t *rx, size_t goto1, size_t goto2, size_t *index)
{
	return BoundRX::append(rx, index, [=]() { return BoundRX::Inst::split(goto1, goto2); });
}

int
boundrx_progzero(boundrx_prog_t *rx, size_t next, int look, size_t *index)
{
	if (look <= BOUNDRX_LOOK_ANY || look > BOUNDRX_LOOK_NOT_WORD_BOUNDARY_ASCII)
		return BOUNDRX_ELOOK;
	return BoundRX::append(rx, index, [=]() { return BoundRX::Inst::zero(next, (BoundRX::Look) look); });
}

int
boundrx_progone(boundrx_prog_t *rx, size_t next, int32_t wc, size_t *index)
{
	if (wc < 0)
		return BOUNDRX_ERANGE;
	return BoundRX::append(rx, index, [=]() { return BoundRX::Inst::one(next, wc); });
}

int
boundrx_proginterval(boundrx_prog_t *rx, size_t next, int32_t lo, int32_t hi, size_t *index)
{
	if (lo < 0 || lo > hi)
		return BOUNDRX_ERANGE;
	return BoundRX::append(rx, index, [=]() { return BoundRX::Inst::interval(next, lo, hi); });
}

int
boundrx_progstart(boundrx_prog_t *rx, size_t index)
{
	auto h = BoundRX::handle(rx);
	if (index >= h->prog.size())
		return BOUNDRX_EBADSTART;
	h->prog.start = index;
	return BOUNDRX_SUCCESS;
}

int
boundrx_progprefix(boundrx_prog_t *rx, size_t n, const char *lit)
{
	try {
		BoundRX::handle(rx)->prog.prefixes.add(std::string(lit, n));
	} catch (const std::bad_alloc &) {
		return BOUNDRX_ESPACE;
	}
	return BOUNDRX_SUCCESS;
}

size_t
boundrx_progdump(const boundrx_prog_t *rx, char *buf, size_t size)
{
	auto text = BoundRX::handle(rx)->prog.dump();
	if (size != 0) {
		auto n = std::min(size - 1, text.size());
		std::memcpy(buf, text.data(), n);
		buf[n] = '\0';
	}
	return text.size() + 1;
}

int
boundrx_should_exec(size_t ninst, size_t textlen)
{
	return BoundRX::should_exec(ninst, textlen);
}

int
boundrx_exec(boundrx_prog_t *rx, const char *s, size_t nm, int *matches, int flags)
{
	auto n = std::strlen(s);
	return boundrx_nexec(rx, n, s, 0, n, nm, matches, flags);
}

int
boundrx_nexec(boundrx_prog_t *rx, size_t ns, const char *s, size_t start, size_t end, size_t nm, int *matches, int flags)
{
	using namespace BoundRX;
	auto h = handle(rx);
	if (auto err = h->prog.validate())
		return err;
	if (start > end || end > ns)
		return BOUNDRX_EPOS;
	if (!should_exec(h->prog.size(), ns))
		return BOUNDRX_ETOOBIG;
	auto enc = (flags & BOUNDRX_EXEC_BYTES) != 0 ? Context::Encoding::Byte
						    : Context::locale_encoding((flags & BOUNDRX_EXEC_NATIVE1B) != 0);
	bool matched;
	try {
		Context ctx(enc, s, s + ns);
		std::unique_ptr<bool[]> found(new bool[nm]());
		auto cache = h->pool.checkout();
		matched = Bounded::exec(h->prog, *cache, found.get(), nm, ctx, start, end);
		for (std::size_t i = 0; i < nm; ++i)
			matches[i] = found[i];
	} catch (const std::bad_alloc &) {
		return BOUNDRX_ESPACE;
	}
	return matched ? BOUNDRX_SUCCESS : BOUNDRX_NOMATCH;
}

void
boundrx_progfree(boundrx_prog_t *rx)
{
	delete BoundRX::handle(rx);
	rx->bp_program = nullptr;
	rx->bp_ninst = 0;
	rx->bp_nmatch = 0;
}

size_t
boundrx_error(int errcode, const boundrx_prog_t *, char *errbuf, size_t errsize)
{
	static const char *const messages[] = {
		N_("success"),
		N_("match not found"),
		N_("instruction successor out of range"),
		N_("start instruction out of range"),
		N_("program has no match instruction"),
		N_("match slot used more than once"),
		N_("invalid interval endpoints"),
		N_("invalid zero-width assertion"),
		N_("search range outside the input"),
		N_("program and input too large for bounded backtracking"),
		N_("memory allocation failed"),
		N_("unknown error code"),
	};
	if (errcode < 0 || errcode > BOUNDRX_UNKNOWN)
		errcode = BOUNDRX_UNKNOWN;
	size_t size = snprintf(errbuf, errsize, "%s", _(messages[errcode]));
	if (errsize != 0 && size == errsize)
		errbuf[errsize - 1] = '\0';
	return size + 1;
}
