/* SPDX-License-Identifier: Apache-2.0
 *
 * Copyright 2022 Franz Brausse <franz.brausse@manchester.ac.uk>
 * Copyright 2022 The University of Manchester
 */

#include <clp/expr.hh>

using namespace clp;

static void collect_free_vars(const sptr<iterm> &t, vec<variable> &v);
static void collect_free_vars(const sptr<idom> &d, vec<variable> &v);

static void collect_free_vars(const sptr<bform> &f, vec<variable> &v)
{
	f->match(
	[&](const symbol &s) { v.push_back(variable { s, bdom { entire {} } }); },
	[](const bcnst &) {},
	[&](const bbop &b) {
		collect_free_vars(b.left, v);
		collect_free_vars(b.right, v);
	},
	[&](const buop &u) { collect_free_vars(u.operand, v); }
	);
}

static void collect_free_vars(const sptr<iterm> &t, vec<variable> &v)
{
	t->match(
	[&](const symbol &s) { v.push_back(variable { s, mkd(entire {}) }); },
	[](const icnst &) {},
	[&](const ibop &b) {
		collect_free_vars(b.left, v);
		collect_free_vars(b.right, v);
	},
	[&](const iuop &u) { collect_free_vars(u.operand, v); }
	);
}

static void collect_free_vars(const sptr<idom> &d, vec<variable> &v)
{
	d->match(
	[](const entire &) {},
	[](const none &) {},
	[&](const range &r) {
		collect_free_vars(r.lo, v);
		collect_free_vars(r.hi, v);
	},
	[&](const list &l) {
		for (const sptr<iterm> &t : l.values)
			collect_free_vars(t, v);
	},
	[&](const dbop &b) {
		collect_free_vars(b.left, v);
		collect_free_vars(b.right, v);
	},
	[&](const dcompl &c) { collect_free_vars(c.arg, v); }
	);
}

static void collect_free_vars(const sptr<rel> &r, vec<variable> &v)
{
	r->match(
	[&](const prop &p) {
		collect_free_vars(p.left, v);
		collect_free_vars(p.right, v);
	},
	[&](const member &m) {
		collect_free_vars(m.elem, v);
		collect_free_vars(m.dom, v);
	}
	);
}

static void collect_free_vars(const constraint &c, vec<variable> &v)
{
	c.match([&](const auto &e) { collect_free_vars(e, v); });
}

static void collect_free_vars(const sptr<program> &p, vec<variable> &v)
{
	p->match(
	[&](const goal &g) { collect_free_vars(g.c, v); },
	[&](const goal_and &a) {
		collect_free_vars(a.g.c, v);
		collect_free_vars(a.rest, v);
	},
	[&](const constr_and &a) {
		collect_free_vars(a.c, v);
		collect_free_vars(a.rest, v);
	}
	);
}

template <typename T>
static vec<variable> free_vars(const T &t)
{
	vec<variable> v;
	collect_free_vars(t, v);
	return v;
}

vec<variable> clp::get_free(const sptr<bform> &f) { return free_vars(f); }
vec<variable> clp::get_free(const sptr<iterm> &t) { return free_vars(t); }
vec<variable> clp::get_free(const sptr<idom> &d) { return free_vars(d); }
vec<variable> clp::get_free(const sptr<rel> &r) { return free_vars(r); }
vec<variable> clp::get_free(const constraint &c) { return free_vars(c); }
vec<variable> clp::get_free(const goal &g) { return free_vars(g.c); }
vec<variable> clp::get_free(const sptr<program> &p) { return free_vars(p); }

vec<variable> clp::distinct(vec<variable> v)
{
	hset<str> seen;
	vec<variable> r;
	for (variable &x : v)
		if (seen.insert(x.sym.id).second)
			r.emplace_back(move(x));
	return r;
}

bool clp::is_ground(const sptr<iterm> &t)
{
	return t->match(
	[](const symbol &) { return false; },
	[](const icnst &) { return true; },
	[](const ibop &b) { return is_ground(b.left) && is_ground(b.right); },
	[](const iuop &u) { return is_ground(u.operand); }
	);
}

bool clp::is_ground(const sptr<idom> &d)
{
	return d->match(
	[](const entire &) { return true; },
	[](const none &) { return true; },
	[](const range &r) { return is_ground(r.lo) && is_ground(r.hi); },
	[](const list &l) {
		for (const sptr<iterm> &t : l.values)
			if (!is_ground(t))
				return false;
		return true;
	},
	[](const dbop &b) { return is_ground(b.left) && is_ground(b.right); },
	[](const dcompl &c) { return is_ground(c.arg); }
	);
}
