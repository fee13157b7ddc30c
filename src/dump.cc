/* SPDX-License-Identifier: Apache-2.0
 *
 * Copyright 2022 Franz Brausse <franz.brausse@manchester.ac.uk>
 * Copyright 2022 The University of Manchester
 */

#include <clp/dump.hh>

using namespace clp;

namespace {
struct infix_output {

	str s;

	template <typename T>
	void out(const sptr<T> &p)
	{
		out(*p);
	}

	template <typename T>
	void out_bin(const char *op, const sptr<T> &l, const sptr<T> &r)
	{
		s += "(";
		out(l);
		s += " ";
		s += op;
		s += " ";
		out(r);
		s += ")";
	}

	void out(const symbol &n) { s += n.id; }
	void out(const bcnst &c) { s += c.value ? "true" : "false"; }
	void out(const icnst &c) { s += to_string(c.value); }

	void out(const bform &e)
	{
		e.match(
		[&](const symbol &n) { out(n); },
		[&](const bcnst &c) { out(c); },
		[&](const bbop &b) { out_bin(bbop_s[b.op], b.left, b.right); },
		[&](const buop &u) {
			s += u.op == buop::NOT ? "not (" : "(";
			out(u.operand);
			s += ")";
		}
		);
	}

	void out(const iterm &e)
	{
		e.match(
		[&](const symbol &n) { out(n); },
		[&](const icnst &c) { out(c); },
		[&](const ibop &b) { out_bin(aop_s[b.op], b.left, b.right); },
		[&](const iuop &u) {
			s += u.op == iuop::NEG ? "-(" : "(";
			out(u.operand);
			s += ")";
		}
		);
	}

	void out(const idom &d)
	{
		d.match(
		[&](const entire &) { s += "int"; },
		[&](const none &) { s += "{}"; },
		[&](const range &r) {
			s += r.lo_open() ? "(" : "[";
			out(r.lo);
			s += ", ";
			out(r.hi);
			s += r.hi_open() ? ")" : "]";
		},
		[&](const list &l) {
			s += "{";
			bool first = true;
			for (const sptr<iterm> &t : l.values) {
				if (!first)
					s += ", ";
				first = false;
				out(t);
			}
			s += "}";
		},
		[&](const dbop &b) { out_bin(dbop_s[b.op], b.left, b.right); },
		[&](const dcompl &c) {
			s += "compl ";
			out(c.arg);
		}
		);
	}

	void out(const bdom &d)
	{
		d.match(
		[&](const entire &) { s += "bool"; },
		[&](const none &) { s += "{}"; },
		[&](const bcnst &c) {
			s += "{";
			out(c);
			s += "}";
		}
		);
	}

	void out(const domain &d)
	{
		d.match([&](const auto &e) { out(e); });
	}

	void out(const rel &r)
	{
		r.match(
		[&](const prop &p) { out_bin(cmp_s[p.cmp], p.left, p.right); },
		[&](const member &m) {
			s += "(";
			out(m.elem);
			s += " in ";
			out(m.dom);
			s += ")";
		}
		);
	}

	void out(const constraint &c)
	{
		c.match([&](const auto &e) { out(e); });
	}

	void out(const goal &g)
	{
		s += goal_s[g.kind];
		s += " ";
		out(g.c);
	}

	void out(const program &p)
	{
		p.match(
		[&](const goal &g) { out(g); },
		[&](const goal_and &a) {
			out(a.g);
			s += "; ";
			out(a.rest);
		},
		[&](const constr_and &a) {
			out(a.c);
			s += "; ";
			out(a.rest);
		}
		);
	}

	void out(const value &v)
	{
		v.match([&](const auto &c) { out(c); });
	}
};
}

template <typename T>
static str infix(const T &e)
{
	infix_output o;
	o.out(e);
	return move(o.s);
}

str clp::to_string(const sptr<bform> &e) { return infix(e); }
str clp::to_string(const sptr<iterm> &e) { return infix(e); }
str clp::to_string(const sptr<idom> &d) { return infix(d); }
str clp::to_string(const bdom &d) { return infix(d); }
str clp::to_string(const domain &d) { return infix(d); }
str clp::to_string(const sptr<rel> &r) { return infix(r); }
str clp::to_string(const constraint &c) { return infix(c); }
str clp::to_string(const goal &g) { return infix(g); }
str clp::to_string(const sptr<program> &p) { return infix(p); }
str clp::to_string(const value &v) { return infix(v); }

str clp::to_string(const variable &v)
{
	return v.sym.id + " in " + to_string(v.dom);
}

str clp::to_string(const assignment &a)
{
	return a.sym.id + " = " + to_string(a.val);
}

str clp::to_string(const vec<assignment> &a)
{
	str r = "{";
	for (size_t i=0; i<a.size(); i++) {
		if (i)
			r += ", ";
		r += to_string(a[i]);
	}
	return r + "}";
}
