/* SPDX-License-Identifier: Apache-2.0
 *
 * Copyright 2022 Franz Brausse <franz.brausse@manchester.ac.uk>
 * Copyright 2022 The University of Manchester
 */

#include <clp/solver.hh>
#include <clp/dump.hh>

using namespace clp;

template <typename T>
static bool mentions(const T &t, const str &id)
{
	for (const variable &v : get_free(t))
		if (v.sym.id == id)
			return true;
	return false;
}

static const sptr<bform> & unparen(const sptr<bform> &f)
{
	const buop *u = f->get<buop>();
	return u && u->op == buop::PAREN ? unparen(u->operand) : f;
}

static const sptr<iterm> & unparen(const sptr<iterm> &t)
{
	const iuop *u = t->get<iuop>();
	return u && u->op == iuop::PAREN ? unparen(u->operand) : t;
}

static bdom meet(const bdom &a, const bdom &b)
{
	if (a.get<entire>() || b.get<none>())
		return b;
	if (b.get<entire>() || a.get<none>())
		return a;
	if (*a.get<bcnst>() == *b.get<bcnst>())
		return a;
	return none {};
}

namespace {
struct declarator {

	hmap<str,domain> decls;

	void add(const symbol &s, domain d)
	{
		auto [it,ins] = decls.emplace(s.id, d);
		if (ins)
			return;
		if (it->second.index() != d.index()) {
			warn(mod_drv,"variable '%s' is used as boolean and as integer\n",
			     s.id.c_str());
			return;
		}
		it->second = it->second.match(
		[&](const bdom &a) -> domain { return meet(a, *d.get<bdom>()); },
		[&](const sptr<idom> &a) -> domain {
			return ops::intersect(a, *d.get<sptr<idom>>());
		}
		);
	}

	void add(const sptr<bform> &g)
	{
		const sptr<bform> &f = unparen(g);
		f->match(
		[&](const symbol &s) { add(s, bdom { bcnst { true } }); },
		[](const bcnst &) {},
		[&](const bbop &b) {
			switch (b.op) {
			case bbop::AND:
				add(b.left);
				add(b.right);
				return;
			case bbop::EQUIV: {
				const sptr<bform> &l = unparen(b.left);
				const sptr<bform> &r = unparen(b.right);
				if (const symbol *s = l->get<symbol>())
					if (const bcnst *c = r->get<bcnst>())
						add(*s, bdom { *c });
				if (const symbol *s = r->get<symbol>())
					if (const bcnst *c = l->get<bcnst>())
						add(*s, bdom { *c });
				return;
			}
			case bbop::OR:
			case bbop::IMPLIES:
				return;
			}
			unreachable();
		},
		[&](const buop &u) {
			assert(u.op == buop::NOT);
			if (const symbol *s = unparen(u.operand)->get<symbol>())
				add(*s, bdom { bcnst { false } });
		}
		);
	}

	/* x c e */
	void add(const symbol &x, cmp_t c, const sptr<iterm> &e)
	{
		if (mentions(e, x.id))
			return;
		switch (c) {
		case EQ: add(x, ops::set_of({ e })); return;
		case NE: add(x, ops::complement(ops::set_of({ e }))); return;
		case GT: add(x, ops::open_closed(e, ops::zcnst(zmax()))); return;
		case LT: add(x, ops::closed_open(ops::zcnst(zmin()), e)); return;
		}
		unreachable();
	}

	void add(const sptr<rel> &r)
	{
		r->match(
		[&](const prop &p) {
			const sptr<iterm> &a = unparen(p.left);
			const sptr<iterm> &b = unparen(p.right);
			if (const symbol *s = a->get<symbol>())
				add(*s, p.cmp, b);
			if (const symbol *s = b->get<symbol>())
				add(*s, -p.cmp, a);
		},
		[&](const member &m) {
			if (const symbol *s = unparen(m.elem)->get<symbol>())
				if (!mentions(m.dom, s->id))
					add(*s, m.dom);
		}
		);
	}

	void add(const constraint &c)
	{
		c.match([&](const auto &e) { add(e); });
	}

	void add(const sptr<program> &p)
	{
		p->match(
		[&](const goal &g) { add(g.c); },
		[&](const goal_and &a) {
			add(a.g.c);
			add(a.rest);
		},
		[&](const constr_and &a) {
			add(a.c);
			add(a.rest);
		}
		);
	}
};
}

hmap<str,domain> clp::declarations(const sptr<program> &p)
{
	declarator d;
	d.add(p);
	if (logs(mod_drv, DEBUG))
		for (const auto &[id,dom] : d.decls)
			dbg(mod_drv,"declared %s in %s\n", id.c_str(),
			    to_string(dom).c_str());
	return move(d.decls);
}

namespace {
struct occurrences {

	vec<symbol> order;
	hset<str> outside, inside;

	void record(const vec<variable> &v, bool in_domain)
	{
		for (const variable &x : v) {
			if (!outside.contains(x.sym.id) && !inside.contains(x.sym.id))
				order.push_back(x.sym);
			(in_domain ? inside : outside).insert(x.sym.id);
		}
	}

	void add(const constraint &c)
	{
		if (const sptr<rel> *r = c.get<sptr<rel>>())
			if (const member *m = (*r)->get<member>()) {
				record(get_free(m->elem), false);
				record(get_free(m->dom), true);
				return;
			}
		record(get_free(c), false);
	}

	void add(const sptr<program> &p)
	{
		p->match(
		[&](const goal &g) { add(g.c); },
		[&](const goal_and &a) {
			add(a.g.c);
			add(a.rest);
		},
		[&](const constr_and &a) {
			add(a.c);
			add(a.rest);
		}
		);
	}
};
}

vec<symbol> clp::validate(const sptr<program> &p)
{
	occurrences o;
	o.add(p);
	vec<symbol> r;
	for (const symbol &s : o.order)
		if (!o.outside.contains(s.id)) {
			warn(mod_clp,"variable '%s' only occurs in domains\n",
			     s.id.c_str());
			r.push_back(s);
		}
	return r;
}
