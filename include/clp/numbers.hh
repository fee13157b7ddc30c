/* SPDX-License-Identifier: Apache-2.0
 *
 * Copyright 2022 Franz Brausse <franz.brausse@manchester.ac.uk>
 * Copyright 2022 The University of Manchester
 */

#pragma once

#include "common.hh"

#include <kay/numbers.hh>

namespace clp {

/* Integer numbers are either NaN, the result of undefined arithmetic, or a
 * value in the range of signed 128-bit integers [zmin, zmax]. Values are kept
 * as arbitrary precision kay::Z so that overflow can be detected exactly: any
 * result leaving the range is NaN.
 *
 * Note that operator== on inum is structural (NaN == NaN), as needed for
 * comparing trees. The relational semantics, under which NaN is neither equal
 * to nor ordered with anything, is implemented by cmp() below. */

struct nan_t {
	bool operator==(const nan_t &) const = default;
};

struct inum : sumtype<nan_t,kay::Z> {

	using sumtype<nan_t,kay::Z>::sumtype;

	bool is_nan() const { return get<nan_t>(); }

	friend str to_string(const inum &v)
	{
		return v.match(
		[](const nan_t &) -> str { return "NaN"; },
		[](const kay::Z &z) { return z.get_str(); }
		);
	}
};

const kay::Z & zmin();
const kay::Z & zmax();

/* NaN if 'z' is outside of [zmin, zmax], otherwise 'z' */
inum in_range(kay::Z z);

enum cmp_t { EQ, NE, GT, LT, };

inline const char *cmp_s[] = { "==", "!=", ">", "<" };

/* Flip a cmp_t */
static inline cmp_t operator-(cmp_t c)
{
	switch (c) {
	case GT: return LT;
	case LT: return GT;
	case EQ:
	case NE:
		return c;
	}
	unreachable();
}

/* Relational comparison: NaN compares false to everything, except under NE */
bool cmp(const inum &l, cmp_t c, const inum &r);

enum aop_t { ADD, SUB, MUL, DIV, MOD, };

inline const char *aop_s[] = { "+", "-", "*", "/", "%" };

/* Arithmetic on inum. DIV truncates towards zero, MOD takes the sign of the
 * dividend. Division and modulo by zero are NaN, as is any operation on a NaN
 * operand or with a result out of range. */
inum arith(const inum &l, aop_t op, const inum &r);
inum negate(const inum &v);

}
