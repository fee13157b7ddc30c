/* SPDX-License-Identifier: Apache-2.0
 *
 * Copyright 2022 Franz Brausse <franz.brausse@manchester.ac.uk>
 * Copyright 2022 The University of Manchester
 */

#include <clp/domain.hh>
#include <clp/dump.hh>

using namespace clp;

using kay::Z;

namespace {

/* An idom with all bounds evaluated. Open ends of ranges are closed and NaN
 * bounds or elements are removed. */
struct zset;

struct zival {
	Z lo, hi; /* empty if lo > hi */
};
struct zlist {
	vec<Z> values;
};
struct zbop {
	decltype(dbop::op) op; sptr<zset> left, right;
};
struct zcompl {
	sptr<zset> arg;
};

struct zset : sumtype<entire,none,zival,zlist,zbop,zcompl> {

	using sumtype<entire,none,zival,zlist,zbop,zcompl>::sumtype;
};

template <typename... Ts>
static inline sptr<zset> mkz(Ts &&... ts)
{
	return std::make_shared<zset>(std::forward<Ts>(ts)...);
}

struct probe {
	long left;
	bool exhausted = false;

	bool step()
	{
		if (left <= 0) {
			exhausted = true;
			return false;
		}
		left--;
		return true;
	}
};

}

static opt<inum> eval(const sptr<iterm> &t)
{
	sptr<iterm> r = reduce(t);
	if (const icnst *c = r->get<icnst>())
		return c->value;
	return {};
}

/* nullptr if 'd' is not ground */
static sptr<zset> resolve(const sptr<idom> &d)
{
	return d->match(
	[](const entire &) { return mkz(entire {}); },
	[](const none &) { return mkz(none {}); },
	[](const range &r) -> sptr<zset> {
		opt<inum> lo = eval(r.lo);
		opt<inum> hi = eval(r.hi);
		if (!lo || !hi)
			return nullptr;
		const Z *l = lo->get<Z>();
		const Z *h = hi->get<Z>();
		if (!l || !h)
			return mkz(none {});
		Z a = *l;
		Z b = *h;
		if (r.lo_open())
			a += 1;
		if (r.hi_open())
			b -= 1;
		return mkz(zival { move(a), move(b) });
	},
	[](const list &l) -> sptr<zset> {
		zlist z;
		for (const sptr<iterm> &t : l.values) {
			opt<inum> v = eval(t);
			if (!v)
				return nullptr;
			if (const Z *c = v->get<Z>())
				z.values.push_back(*c);
		}
		return mkz(move(z));
	},
	[](const dbop &b) -> sptr<zset> {
		sptr<zset> l = resolve(b.left);
		sptr<zset> r = l ? resolve(b.right) : nullptr;
		if (!r)
			return nullptr;
		return mkz(zbop { b.op, move(l), move(r) });
	},
	[](const dcompl &c) -> sptr<zset> {
		sptr<zset> a = resolve(c.arg);
		return a ? mkz(zcompl { move(a) }) : nullptr;
	}
	);
}

static bool member_of(const zset &d, const Z &v)
{
	return d.match(
	[](const entire &) { return true; },
	[](const none &) { return false; },
	[&](const zival &i) { return i.lo <= v && v <= i.hi; },
	[&](const zlist &l) {
		for (const Z &z : l.values)
			if (z == v)
				return true;
		return false;
	},
	[&](const zbop &b) {
		switch (b.op) {
		case dbop::UNION:
			return member_of(*b.left, v) || member_of(*b.right, v);
		case dbop::INTERSECT:
			return member_of(*b.left, v) && member_of(*b.right, v);
		case dbop::DIFF:
			return member_of(*b.left, v) && !member_of(*b.right, v);
		}
		unreachable();
	},
	[&](const zcompl &c) { return !member_of(*c.arg, v); }
	);
}

static opt<Z> lower(opt<Z> a, opt<Z> b)
{
	if (!a)
		return b;
	if (!b)
		return a;
	return *b < *a ? b : a;
}

/* Least v >= from with next_a(v) == v and next_b(v) == v */
template <typename A, typename B>
static opt<Z> leapfrog(A &&next_a, B &&next_b, Z v, probe &pr)
{
	while (pr.step()) {
		opt<Z> a = next_a(v);
		if (!a)
			return {};
		opt<Z> b = next_b(*a);
		if (!b)
			return {};
		if (*b == *a)
			return b;
		v = move(*b);
	}
	return {};
}

static opt<Z> next_out(const zset &d, const Z &from, probe &pr);

static opt<Z> next_in(const zset &d, const Z &from, probe &pr)
{
	if (from > zmax())
		return {};
	return d.match(
	[&](const entire &) -> opt<Z> { return from; },
	[&](const none &) -> opt<Z> { return {}; },
	[&](const zival &i) -> opt<Z> {
		const Z &v = from < i.lo ? i.lo : from;
		if (v <= i.hi)
			return v;
		return {};
	},
	[&](const zlist &l) {
		opt<Z> r;
		for (const Z &z : l.values)
			if (z >= from)
				r = lower(move(r), z);
		return r;
	},
	[&](const zbop &b) -> opt<Z> {
		const zset &l = *b.left, &r = *b.right;
		auto in_l = [&](const Z &v) { return next_in(l, v, pr); };
		auto in_r = [&](const Z &v) { return next_in(r, v, pr); };
		auto out_r = [&](const Z &v) { return next_out(r, v, pr); };
		switch (b.op) {
		case dbop::UNION: return lower(in_l(from), in_r(from));
		case dbop::INTERSECT: return leapfrog(in_l, in_r, from, pr);
		case dbop::DIFF: return leapfrog(in_l, out_r, from, pr);
		}
		unreachable();
	},
	[&](const zcompl &c) { return next_out(*c.arg, from, pr); }
	);
}

static opt<Z> next_out(const zset &d, const Z &from, probe &pr)
{
	if (from > zmax())
		return {};
	return d.match(
	[&](const entire &) -> opt<Z> { return {}; },
	[&](const none &) -> opt<Z> { return from; },
	[&](const zival &i) -> opt<Z> {
		if (i.lo > i.hi || from < i.lo || from > i.hi)
			return from;
		if (i.hi < zmax())
			return Z(i.hi + 1);
		return {};
	},
	[&](const zlist &l) -> opt<Z> {
		Z v = from;
		while (member_of(d, v)) {
			if (!pr.step())
				return {};
			v += 1;
		}
		if (v > zmax())
			return {};
		return v;
	},
	[&](const zbop &b) -> opt<Z> {
		const zset &l = *b.left, &r = *b.right;
		auto out_l = [&](const Z &v) { return next_out(l, v, pr); };
		auto out_r = [&](const Z &v) { return next_out(r, v, pr); };
		auto in_r = [&](const Z &v) { return next_in(r, v, pr); };
		switch (b.op) {
		case dbop::UNION: return leapfrog(out_l, out_r, from, pr);
		case dbop::INTERSECT: return lower(out_l(from), out_r(from));
		case dbop::DIFF: return lower(out_l(from), in_r(from));
		}
		unreachable();
	},
	[&](const zcompl &c) { return next_in(*c.arg, from, pr); }
	);
}

static opt<Z> pick(const zset &d, probe &pr)
{
	return d.match(
	[](const entire &) -> opt<Z> { return Z(0); },
	[](const none &) -> opt<Z> { return {}; },
	[](const zival &i) -> opt<Z> {
		if (i.lo <= i.hi)
			return i.lo;
		return {};
	},
	[](const zlist &l) -> opt<Z> {
		if (l.values.empty())
			return {};
		return l.values.front();
	},
	[&](const zbop &b) -> opt<Z> {
		switch (b.op) {
		case dbop::UNION:
			if (opt<Z> a = pick(*b.left, pr))
				return a;
			return pick(*b.right, pr);
		case dbop::INTERSECT:
			if (opt<Z> a = pick(*b.left, pr); a && member_of(*b.right, *a))
				return a;
			if (opt<Z> a = pick(*b.right, pr); a && member_of(*b.left, *a))
				return a;
			break;
		case dbop::DIFF:
			if (opt<Z> a = pick(*b.left, pr); a && !member_of(*b.right, *a))
				return a;
			break;
		}
		return next_in(d, zmin(), pr);
	},
	[&](const zcompl &c) { return next_out(*c.arg, zmin(), pr); }
	);
}

opt<bool> clp::contains(const sptr<idom> &d, const inum &v)
{
	const Z *z = v.get<Z>();
	if (!z)
		return false;
	sptr<zset> s = resolve(d);
	if (!s)
		return {};
	return member_of(*s, *z);
}

bool clp::contains(const bdom &d, bool v)
{
	return d.match(
	[](const entire &) { return true; },
	[](const none &) { return false; },
	[&](const bcnst &c) { return c.value == v; }
	);
}

bool clp::contains(const domain &d, const value &v)
{
	return d.match(
	[&](const bdom &b) {
		const bcnst *c = v.get<bcnst>();
		return c && contains(b, c->value);
	},
	[&](const sptr<idom> &i) {
		const icnst *c = v.get<icnst>();
		return c && contains(i, c->value).value_or(false);
	}
	);
}

template <typename F>
static opt<Z> search(const sptr<idom> &d, const Z &from, long limit, F &&f)
{
	sptr<zset> s = resolve(d);
	if (!s)
		return {};
	probe pr { limit };
	opt<Z> r = f(*s, from < zmin() ? zmin() : from, pr);
	if (pr.exhausted) {
		note(mod_smp,"probe limit %ld exhausted on %s\n",
		     limit, to_string(d).c_str());
		return {};
	}
	return r;
}

opt<Z> clp::next_member(const sptr<idom> &d, const Z &from, long limit)
{
	return search(d, from, limit, next_in);
}

opt<Z> clp::next_nonmember(const sptr<idom> &d, const Z &from, long limit)
{
	return search(d, from, limit, next_out);
}

opt<bcnst> clp::sample(const bdom &d)
{
	return d.match(
	[](const entire &) -> opt<bcnst> { return bcnst { false }; },
	[](const none &) -> opt<bcnst> { return {}; },
	[](const bcnst &c) -> opt<bcnst> { return c; }
	);
}

opt<Z> clp::sample(const sptr<idom> &d, long limit)
{
	return search(d, zmin(), limit, [](const zset &s, const Z &, probe &pr) {
		return pick(s, pr);
	});
}

opt<value> clp::sample(const domain &d, long limit)
{
	opt<value> r = d.match(
	[](const bdom &b) -> opt<value> {
		if (opt<bcnst> c = sample(b))
			return value { *c };
		return {};
	},
	[&](const sptr<idom> &i) -> opt<value> {
		if (opt<Z> z = sample(i, limit))
			return value { icnst { inum { move(*z) } } };
		return {};
	}
	);
	if (logs(mod_smp, DEBUG))
		dbg(mod_smp,"sample of %s: %s\n", to_string(d).c_str(),
		    r ? to_string(*r).c_str() : "none");
	return r;
}
