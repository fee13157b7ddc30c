/* SPDX-License-Identifier: Apache-2.0
 *
 * Copyright 2022 Franz Brausse <franz.brausse@manchester.ac.uk>
 * Copyright 2022 The University of Manchester
 */

#include <clp/expr.hh>

using namespace clp;

namespace {

struct _subst {

	hmap<str,sptr<bform>> brepl;
	hmap<str,sptr<iterm>> irepl;
	hmap<const bform *,sptr<bform>> fs;
	hmap<const iterm *,sptr<iterm>> ts;
	hmap<const idom *,sptr<idom>> ds;

	explicit _subst(const vec<assignment> &a)
	{
		for (const auto &[s,v] : a)
			v.match(
			[&](const bcnst &b) { brepl.emplace(s.id, mkb(b)); },
			[&](const icnst &c) { irepl.emplace(s.id, mki(c)); }
			);
	}

	sptr<iterm> subst(const sptr<iterm> &e)
	{
		auto it = ts.find(e.get());
		if (it == ts.end())
			it = ts.emplace(e.get(), e->match(
			[&](const symbol &n) {
				auto it = irepl.find(n.id);
				return it == irepl.end() ? e : it->second;
			},
			[&](const icnst &) { return e; },
			[&](const ibop &b) {
				sptr<iterm> l = subst(b.left);
				sptr<iterm> r = subst(b.right);
				return l == b.left && r == b.right
				     ? e : mki(ibop { b.op, move(l), move(r) });
			},
			[&](const iuop &u) {
				sptr<iterm> a = subst(u.operand);
				return a == u.operand ? e : mki(iuop { u.op, move(a) });
			}
			)).first;
		return it->second;
	}

	sptr<bform> subst(const sptr<bform> &f)
	{
		auto it = fs.find(f.get());
		if (it == fs.end())
			it = fs.emplace(f.get(), f->match(
			[&](const symbol &n) {
				auto it = brepl.find(n.id);
				return it == brepl.end() ? f : it->second;
			},
			[&](const bcnst &) { return f; },
			[&](const bbop &b) {
				sptr<bform> l = subst(b.left);
				sptr<bform> r = subst(b.right);
				return l == b.left && r == b.right
				     ? f : mkb(bbop { b.op, move(l), move(r) });
			},
			[&](const buop &u) {
				sptr<bform> a = subst(u.operand);
				return a == u.operand ? f : mkb(buop { u.op, move(a) });
			}
			)).first;
		return it->second;
	}

	sptr<idom> subst(const sptr<idom> &d)
	{
		auto it = ds.find(d.get());
		if (it == ds.end())
			it = ds.emplace(d.get(), d->match(
			[&](const entire &) { return d; },
			[&](const none &) { return d; },
			[&](const range &r) {
				sptr<iterm> lo = subst(r.lo);
				sptr<iterm> hi = subst(r.hi);
				return lo == r.lo && hi == r.hi
				     ? d : mkd(range { r.kind, move(lo), move(hi) });
			},
			[&](const list &l) {
				vec<sptr<iterm>> v = l.values;
				for (sptr<iterm> &t : v)
					t = subst(t);
				return v == l.values ? d : mkd(list { move(v) });
			},
			[&](const dbop &b) {
				sptr<idom> l = subst(b.left);
				sptr<idom> r = subst(b.right);
				return l == b.left && r == b.right
				     ? d : mkd(dbop { b.op, move(l), move(r) });
			},
			[&](const dcompl &c) {
				sptr<idom> a = subst(c.arg);
				return a == c.arg ? d : mkd(dcompl { move(a) });
			}
			)).first;
		return it->second;
	}

	sptr<rel> subst(const sptr<rel> &r)
	{
		return r->match(
		[&](const prop &p) {
			sptr<iterm> a = subst(p.left);
			sptr<iterm> b = subst(p.right);
			return a == p.left && b == p.right
			     ? r : mkr(prop { p.cmp, move(a), move(b) });
		},
		[&](const member &m) {
			sptr<iterm> e = subst(m.elem);
			sptr<idom> d = subst(m.dom);
			return e == m.elem && d == m.dom
			     ? r : mkr(member { move(e), move(d) });
		}
		);
	}

	constraint subst(const constraint &c)
	{
		return c.match([&](const auto &e) { return constraint { subst(e) }; });
	}

	sptr<program> subst(const sptr<program> &p)
	{
		return p->match(
		[&](const goal &g) {
			constraint c = subst(g.c);
			return identical(c, g.c) ? p : mkp(goal { g.kind, move(c) });
		},
		[&](const goal_and &a) {
			constraint c = subst(a.g.c);
			sptr<program> r = subst(a.rest);
			return identical(c, a.g.c) && r == a.rest
			     ? p : mkp(goal_and { goal { a.g.kind, move(c) }, move(r) });
		},
		[&](const constr_and &a) {
			constraint c = subst(a.c);
			sptr<program> r = subst(a.rest);
			return identical(c, a.c) && r == a.rest
			     ? p : mkp(constr_and { move(c), move(r) });
		}
		);
	}
};

} // end anon namespace

sptr<iterm> clp::apply(const sptr<iterm> &t, const vec<assignment> &a)
{
	return _subst(a).subst(t);
}

sptr<bform> clp::apply(const sptr<bform> &f, const vec<assignment> &a)
{
	return _subst(a).subst(f);
}

sptr<idom> clp::apply(const sptr<idom> &d, const vec<assignment> &a)
{
	return _subst(a).subst(d);
}

sptr<rel> clp::apply(const sptr<rel> &r, const vec<assignment> &a)
{
	return _subst(a).subst(r);
}

constraint clp::apply(const constraint &c, const vec<assignment> &a)
{
	return _subst(a).subst(c);
}

sptr<program> clp::apply(const sptr<program> &p, const vec<assignment> &a)
{
	return _subst(a).subst(p);
}
