/* SPDX-License-Identifier: Apache-2.0
 *
 * Copyright 2022 Franz Brausse <franz.brausse@manchester.ac.uk>
 * Copyright 2022 The University of Manchester
 */

#include <clp/domain.hh>
#include <clp/dump.hh>

using namespace clp;

static bool is_nan(const icnst *c)
{
	return c && c->value.is_nan();
}

static bool is_zero(const icnst *c)
{
	const kay::Z *z = c ? c->value.get<kay::Z>() : nullptr;
	return z && *z == 0;
}

static bool is_not(const sptr<bform> &f)
{
	const buop *u = f->get<buop>();
	return u && u->op == buop::NOT;
}

/* Negation of a reduced formula, again reduced */
static sptr<bform> negated(const sptr<bform> &f)
{
	if (const bcnst *c = f->get<bcnst>())
		return c->value ? false1 : true1;
	if (is_not(f))
		return f->get<buop>()->operand;
	return mkb(buop { buop::NOT, f });
}

static const sptr<bform> & truth_cnst(bool v)
{
	return v ? true1 : false1;
}

sptr<iterm> clp::reduce(const sptr<iterm> &e)
{
	return e->match(
	[&](const symbol &) { return e; },
	[&](const icnst &) { return e; },
	[&](const ibop &b) {
		sptr<iterm> l = reduce(b.left);
		sptr<iterm> r = reduce(b.right);
		const icnst *lc = l->get<icnst>();
		const icnst *rc = r->get<icnst>();
		if (lc && rc)
			return mki(icnst { arith(lc->value, b.op, rc->value) });
		/* NaN regardless of the other operand */
		if (is_nan(lc) || is_nan(rc) ||
		    ((b.op == DIV || b.op == MOD) && is_zero(rc)))
			return mki(icnst { nan_t {} });
		if (l == b.left && r == b.right)
			return e;
		return mki(ibop { b.op, move(l), move(r) });
	},
	[&](const iuop &u) {
		sptr<iterm> o = reduce(u.operand);
		if (u.op == iuop::PAREN)
			return o;
		if (const icnst *c = o->get<icnst>())
			return mki(icnst { negate(c->value) });
		return o == u.operand ? e : mki(iuop { u.op, move(o) });
	}
	);
}

sptr<bform> clp::reduce(const sptr<bform> &f)
{
	return f->match(
	[&](const symbol &) { return f; },
	[&](const bcnst &) { return f; },
	[&](const bbop &b) -> sptr<bform> {
		sptr<bform> l = reduce(b.left);
		sptr<bform> r = reduce(b.right);
		const bcnst *lc = l->get<bcnst>();
		const bcnst *rc = r->get<bcnst>();
		switch (b.op) {
		case bbop::AND:
			if (lc)
				return lc->value ? r : false1;
			if (rc)
				return rc->value ? l : false1;
			break;
		case bbop::OR:
			if (lc)
				return lc->value ? true1 : r;
			if (rc)
				return rc->value ? true1 : l;
			break;
		case bbop::IMPLIES:
			if (lc)
				return lc->value ? r : true1;
			if (rc)
				return rc->value ? true1 : negated(l);
			break;
		case bbop::EQUIV:
			if (lc && rc)
				return truth_cnst(lc->value == rc->value);
			if (lc)
				return lc->value ? r : negated(r);
			if (rc)
				return rc->value ? l : negated(l);
			break;
		}
		if (l == b.left && r == b.right)
			return f;
		return mkb(bbop { b.op, move(l), move(r) });
	},
	[&](const buop &u) -> sptr<bform> {
		sptr<bform> o = reduce(u.operand);
		if (u.op == buop::PAREN)
			return o;
		if (o == u.operand && !o->get<bcnst>() && !is_not(o))
			return f;
		return negated(o);
	}
	);
}

sptr<idom> clp::reduce(const sptr<idom> &d)
{
	return d->match(
	[&](const entire &) { return d; },
	[&](const none &) { return d; },
	[&](const range &r) {
		sptr<iterm> lo = reduce(r.lo);
		sptr<iterm> hi = reduce(r.hi);
		return lo == r.lo && hi == r.hi
		     ? d : mkd(range { r.kind, move(lo), move(hi) });
	},
	[&](const list &l) {
		vec<sptr<iterm>> v = l.values;
		for (sptr<iterm> &t : v)
			t = reduce(t);
		return v == l.values ? d : mkd(list { move(v) });
	},
	[&](const dbop &b) {
		sptr<idom> l = reduce(b.left);
		sptr<idom> r = reduce(b.right);
		return l == b.left && r == b.right
		     ? d : mkd(dbop { b.op, move(l), move(r) });
	},
	[&](const dcompl &c) {
		sptr<idom> a = reduce(c.arg);
		return a == c.arg ? d : mkd(dcompl { move(a) });
	}
	);
}

constraint clp::reduce(const sptr<rel> &r)
{
	return r->match(
	[&](const prop &p) -> constraint {
		sptr<iterm> a = reduce(p.left);
		sptr<iterm> b = reduce(p.right);
		const icnst *ac = a->get<icnst>();
		const icnst *bc = b->get<icnst>();
		if (ac && bc)
			return truth_cnst(cmp(ac->value, p.cmp, bc->value));
		if (is_nan(ac) || is_nan(bc))
			return truth_cnst(p.cmp == NE);
		if (a == p.left && b == p.right)
			return r;
		return mkr(prop { p.cmp, move(a), move(b) });
	},
	[&](const member &m) -> constraint {
		sptr<iterm> e = reduce(m.elem);
		sptr<idom> d = reduce(m.dom);
		if (const icnst *c = e->get<icnst>())
			if (opt<bool> in = contains(d, c->value))
				return truth_cnst(*in);
		if (e == m.elem && d == m.dom)
			return r;
		return mkr(member { move(e), move(d) });
	}
	);
}

constraint clp::reduce(const constraint &c)
{
	return c.match([](const auto &e) { return constraint { reduce(e) }; });
}

opt<bool> clp::truth(const constraint &c)
{
	const sptr<bform> *f = c.get<sptr<bform>>();
	if (!f)
		return {};
	if (const bcnst *b = (*f)->get<bcnst>())
		return b->value;
	return {};
}

sptr<program> clp::reduce(const sptr<program> &p)
{
	return p->match(
	[&](const goal &g) {
		constraint c = reduce(g.c);
		return identical(c, g.c) ? p : mkp(goal { g.kind, move(c) });
	},
	[&](const goal_and &a) {
		constraint c = reduce(a.g.c);
		sptr<program> r = reduce(a.rest);
		return identical(c, a.g.c) && r == a.rest
		     ? p : mkp(goal_and { goal { a.g.kind, move(c) }, move(r) });
	},
	[&](const constr_and &a) {
		constraint c = reduce(a.c);
		sptr<program> r = reduce(a.rest);
		if (truth(c) == true) {
			if (logs(mod_red, DEBUG))
				dbg(mod_red,"dropping satisfied conjunct %s\n",
				    to_string(a.c).c_str());
			return r;
		}
		return identical(c, a.c) && r == a.rest
		     ? p : mkp(constr_and { move(c), move(r) });
	}
	);
}
