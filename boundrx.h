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

#ifndef _BOUNDRX_H
#define _BOUNDRX_H

#include <stddef.h>
#include <stdint.h>
#ifdef __cplusplus
extern "C" {
#endif

/*
 * Programs are built one instruction at a time by an external regex compiler
 * and then executed by the bounded backtracking engine.  Instruction indices
 * are assigned in the order the instructions are appended, starting at 0.
 */

typedef enum {				/* Flags for boundrx_prognew() */
	BOUNDRX_PROG_ANCHOR_START = 1,	/* match must begin at the start position */
	BOUNDRX_PROG_ANCHOR_END = 2	/* match must end at the end of input (informational) */
} boundrx_prog_flags_t;

typedef enum {				/* Flags for boundrx_*exec() */
	BOUNDRX_EXEC_BYTES = 1,		/* treat input as raw bytes regardless of locale */
	BOUNDRX_EXEC_NATIVE1B = 2	/* raw bytes if MB_CUR_MAX == 1 */
} boundrx_exec_flags_t;

typedef enum {				/* Zero-width assertions for boundrx_progzero() */
	BOUNDRX_LOOK_ANY = 0,		/* placeholder; never valid in a finished program */
	BOUNDRX_LOOK_START_LINE,	/* beginning of input or just after \n */
	BOUNDRX_LOOK_END_LINE,		/* end of input or just before \n */
	BOUNDRX_LOOK_START_TEXT,	/* beginning of input */
	BOUNDRX_LOOK_END_TEXT,		/* end of input */
	BOUNDRX_LOOK_WORD_BOUNDARY,	/* locale-aware word boundary */
	BOUNDRX_LOOK_NOT_WORD_BOUNDARY,	/* locale-aware non-word-boundary */
	BOUNDRX_LOOK_WORD_BOUNDARY_ASCII,	/* ASCII-only word boundary */
	BOUNDRX_LOOK_NOT_WORD_BOUNDARY_ASCII	/* ASCII-only non-word-boundary */
} boundrx_look_t;

typedef enum {				/* Return values from boundrx_*() */
	BOUNDRX_SUCCESS = 0,		/* operation succeeded; exec: match found */
	BOUNDRX_NOMATCH,		/* exec: match not found */
	BOUNDRX_EBADGOTO,		/* instruction successor out of range */
	BOUNDRX_EBADSTART,		/* start instruction out of range */
	BOUNDRX_ENOMATCH,		/* program has no Match instruction */
	BOUNDRX_EBADSLOT,		/* two Match instructions share a slot */
	BOUNDRX_ERANGE,			/* invalid interval endpoints */
	BOUNDRX_ELOOK,			/* invalid zero-width assertion */
	BOUNDRX_EPOS,			/* exec: start/end outside the input */
	BOUNDRX_ETOOBIG,		/* exec: program * input too large for this engine */
	BOUNDRX_ESPACE,			/* memory allocation failed */
	BOUNDRX_UNKNOWN			/* unknown error code */
} boundrx_result_t;

typedef struct {
	void *bp_program;
	size_t bp_ninst;
	size_t bp_nmatch;
	boundrx_prog_flags_t bp_flags;
} boundrx_prog_t;

/* Create an empty program; returns boundrx_result_t (as integer) */
int boundrx_prognew(boundrx_prog_t *, int /* boundrx_prog_flags_t */);

/* Append one instruction; its index is stored through the last argument */
int boundrx_progmatch(boundrx_prog_t *, size_t /* slot */, size_t * /* index */);
int boundrx_progsplit(boundrx_prog_t *, size_t /* goto1 */, size_t /* goto2 */, size_t * /* index */);
int boundrx_progzero(boundrx_prog_t *, size_t /* goto */, int /* boundrx_look_t */, size_t * /* index */);
int boundrx_progone(boundrx_prog_t *, size_t /* goto */, int32_t /* element */, size_t * /* index */);
int boundrx_proginterval(boundrx_prog_t *, size_t /* goto */, int32_t /* lo */, int32_t /* hi */, size_t * /* index */);

/* Set the start instruction (default 0) */
int boundrx_progstart(boundrx_prog_t *, size_t /* index */);

/* Add a literal every match is known to begin with */
int boundrx_progprefix(boundrx_prog_t *, size_t /* nliteral */, const char * /* literal[nliteral] */);

/* Render the instruction listing; returns the buffer size needed */
size_t boundrx_progdump(const boundrx_prog_t *, char * /* buf[nbuf] */, size_t /* nbuf */);

/* Nonzero iff the bounded engine may run ninst instructions over textlen bytes */
int boundrx_should_exec(size_t /* ninst */, size_t /* textlen */);

/* Search; matches[i] is set to 1 if alternative i matched, 0 otherwise; returns boundrx_result_t */
int boundrx_exec(boundrx_prog_t *, const char * /* string NUL-terminated */, size_t /* nmatch */, int * /* matches[nmatch] */, int /* boundrx_exec_flags_t */);
int boundrx_nexec(boundrx_prog_t *, size_t /* nstring */, const char * /* string[nstring] */, size_t /* start */, size_t /* end */, size_t /* nmatch */, int * /* matches[nmatch] */, int /* boundrx_exec_flags_t */);

size_t boundrx_error(int /* boundrx_result_t */, const boundrx_prog_t *, char * /* errbuf[nerrbuf] */, size_t /* nerrbuf */);
void boundrx_progfree(boundrx_prog_t *);

#ifdef __cplusplus
} /* extern "C" */
#endif /* __cplusplus */
#endif /* _BOUNDRX_H */
