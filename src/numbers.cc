/* SPDX-License-Identifier: Apache-2.0
 *
 * Copyright 2022 Franz Brausse <franz.brausse@manchester.ac.uk>
 * Copyright 2022 The University of Manchester
 */

#include <clp/numbers.hh>

using namespace clp;

const kay::Z & clp::zmin()
{
	static const kay::Z z("-170141183460469231731687303715884105728");
	return z;
}

const kay::Z & clp::zmax()
{
	static const kay::Z z("170141183460469231731687303715884105727");
	return z;
}

inum clp::in_range(kay::Z z)
{
	if (z < zmin() || z > zmax())
		return nan_t {};
	return inum { move(z) };
}

bool clp::cmp(const inum &l, cmp_t c, const inum &r)
{
	const kay::Z *a = l.get<kay::Z>();
	const kay::Z *b = r.get<kay::Z>();
	if (!a || !b)
		return c == NE;
	switch (c) {
	case EQ: return *a == *b;
	case NE: return *a != *b;
	case GT: return *a > *b;
	case LT: return *a < *b;
	}
	unreachable();
}

inum clp::arith(const inum &l, aop_t op, const inum &r)
{
	const kay::Z *a = l.get<kay::Z>();
	const kay::Z *b = r.get<kay::Z>();
	if (!a || !b)
		return nan_t {};
	switch (op) {
	case ADD: return in_range(*a + *b);
	case SUB: return in_range(*a - *b);
	case MUL: return in_range(*a * *b);
	case DIV:
		if (*b == 0)
			return nan_t {};
		/* zmin / -1 is the only quotient out of range */
		return in_range(*a / *b);
	case MOD:
		if (*b == 0)
			return nan_t {};
		return in_range(*a % *b);
	}
	unreachable();
}

inum clp::negate(const inum &v)
{
	const kay::Z *a = v.get<kay::Z>();
	if (!a)
		return nan_t {};
	return in_range(-*a);
}
