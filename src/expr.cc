/* SPDX-License-Identifier: Apache-2.0
 *
 * Copyright 2022 Franz Brausse <franz.brausse@manchester.ac.uk>
 * Copyright 2022 The University of Manchester
 */

#include <clp/expr.hh>

using namespace clp;

template <typename T>
static bool same(const sptr<T> &a, const sptr<T> &b)
{
	return a == b || (a && b && *a == *b);
}

bool icnst::operator==(const icnst &b) const
{
	return value == b.value;
}

bool bbop::operator==(const bbop &b) const
{
	return op == b.op && same(left, b.left) && same(right, b.right);
}

bool buop::operator==(const buop &b) const
{
	return op == b.op && same(operand, b.operand);
}

bool ibop::operator==(const ibop &b) const
{
	return op == b.op && same(left, b.left) && same(right, b.right);
}

bool iuop::operator==(const iuop &b) const
{
	return op == b.op && same(operand, b.operand);
}

bool range::operator==(const range &b) const
{
	return kind == b.kind && same(lo, b.lo) && same(hi, b.hi);
}

bool list::operator==(const list &b) const
{
	if (values == b.values)
		return true;
	if (values.size() != b.values.size())
		return false;
	for (size_t i=0; i<values.size(); i++)
		if (!same(values[i], b.values[i]))
			return false;
	return true;
}

bool dbop::operator==(const dbop &b) const
{
	return op == b.op && same(left, b.left) && same(right, b.right);
}

bool dcompl::operator==(const dcompl &b) const
{
	return same(arg, b.arg);
}

bool domain::operator==(const domain &b) const
{
	if (index() != b.index())
		return false;
	return match(
	[&](const bdom &d) { return d == *b.get<bdom>(); },
	[&](const sptr<idom> &d) { return same(d, *b.get<sptr<idom>>()); }
	);
}

bool prop::operator==(const prop &b) const
{
	return cmp == b.cmp && same(left, b.left) && same(right, b.right);
}

bool member::operator==(const member &b) const
{
	return same(elem, b.elem) && same(dom, b.dom);
}

bool constraint::operator==(const constraint &b) const
{
	if (index() != b.index())
		return false;
	return match(
	[&](const sptr<bform> &f) { return same(f, *b.get<sptr<bform>>()); },
	[&](const sptr<rel> &r) { return same(r, *b.get<sptr<rel>>()); }
	);
}

bool goal_and::operator==(const goal_and &b) const
{
	return g == b.g && same(rest, b.rest);
}

bool constr_and::operator==(const constr_and &b) const
{
	return c == b.c && same(rest, b.rest);
}

size_t clp::size(const sptr<bform> &f)
{
	return f->match(
	[](const symbol &) -> size_t { return 1; },
	[](const bcnst &) -> size_t { return 1; },
	[](const bbop &b) { return 1 + size(b.left) + size(b.right); },
	[](const buop &u) { return 1 + size(u.operand); }
	);
}

size_t clp::size(const sptr<iterm> &t)
{
	return t->match(
	[](const symbol &) -> size_t { return 1; },
	[](const icnst &) -> size_t { return 1; },
	[](const ibop &b) { return 1 + size(b.left) + size(b.right); },
	[](const iuop &u) { return 1 + size(u.operand); }
	);
}

size_t clp::size(const sptr<idom> &d)
{
	return d->match(
	[](const entire &) -> size_t { return 1; },
	[](const none &) -> size_t { return 1; },
	[](const range &r) { return 1 + size(r.lo) + size(r.hi); },
	[](const list &l) {
		size_t n = 1;
		for (const sptr<iterm> &t : l.values)
			n += size(t);
		return n;
	},
	[](const dbop &b) { return 1 + size(b.left) + size(b.right); },
	[](const dcompl &c) { return 1 + size(c.arg); }
	);
}

size_t clp::size(const sptr<rel> &r)
{
	return r->match(
	[](const prop &p) { return 1 + size(p.left) + size(p.right); },
	[](const member &m) { return 1 + size(m.elem) + size(m.dom); }
	);
}

size_t clp::size(const constraint &c)
{
	return c.match([](const auto &e) { return size(e); });
}

size_t clp::size(const sptr<program> &p)
{
	return p->match(
	[](const goal &g) { return 1 + size(g.c); },
	[](const goal_and &a) { return 1 + size(a.g.c) + size(a.rest); },
	[](const constr_and &a) { return 1 + size(a.c) + size(a.rest); }
	);
}
