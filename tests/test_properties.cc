/* SPDX-License-Identifier: Apache-2.0
 *
 * Copyright 2022 Franz Brausse <franz.brausse@manchester.ac.uk>
 * Copyright 2022 The University of Manchester
 */

#include <clp/solver.hh>
#include <clp/dump.hh>

#include <gtest/gtest.h>

#include <random>

using namespace clp;
using namespace clp::ops;

namespace {

/* Random trees over the boolean variables a, b and the integer variables x, y
 * with small constants. */
struct gen {

	std::mt19937 rng;
	bool with_vars = true;

	explicit gen(unsigned seed) : rng(seed) {}

	int pick(int n) { return std::uniform_int_distribution<int>(0, n-1)(rng); }

	sptr<iterm> cnst()
	{
		int v = pick(23) - 11;
		return v == 11 ? nan_cnst() : zcnst(v);
	}

	sptr<iterm> term(int depth)
	{
		int n = depth > 0 ? 8 : 3;
		switch (pick(n)) {
		case 0: return with_vars ? ivar(pick(2) ? "x" : "y") : cnst();
		case 1:
		case 2: return cnst();
		case 3: return -term(depth-1);
		case 4: return par(term(depth-1));
		}
		sptr<iterm> l = term(depth-1), r = term(depth-1);
		return mki(ibop { (aop_t)pick(5), move(l), move(r) });
	}

	sptr<idom> dom(int depth)
	{
		int n = depth > 0 ? 8 : 4;
		switch (pick(n)) {
		case 0: return pick(4) ? closed(term(1), term(1))
		                       : mkd(range { (decltype(range::kind))pick(4),
		                                     term(1), term(1) });
		case 1: return pick(2) ? universe() : empty_set();
		case 2:
		case 3: {
			vec<sptr<iterm>> v;
			for (int i=pick(4); i; i--)
				v.push_back(term(1));
			return set_of(move(v));
		}
		case 4: return complement(dom(depth-1));
		}
		sptr<idom> l = dom(depth-1), r = dom(depth-1);
		return mkd(dbop { (decltype(dbop::op))pick(3), move(l), move(r) });
	}

	sptr<bform> form(int depth)
	{
		int n = depth > 0 ? 7 : 2;
		switch (pick(n)) {
		case 0: return with_vars ? bvar(pick(2) ? "a" : "b")
		                         : (pick(2) ? true1 : false1);
		case 1: return pick(2) ? true1 : false1;
		case 2: return neg(form(depth-1));
		case 3: return par(form(depth-1));
		}
		sptr<bform> l = form(depth-1), r = form(depth-1);
		return mkb(bbop { (decltype(bbop::op))pick(4), move(l), move(r) });
	}

	constraint cons(int depth)
	{
		switch (pick(3)) {
		case 0: return form(depth);
		case 1: return mkr(prop { (cmp_t)pick(4), term(depth), term(depth) });
		}
		return in(term(depth), dom(depth));
	}

	sptr<program> prog(int depth)
	{
		goal g = { (decltype(goal::kind))pick(3), cons(depth) };
		sptr<program> p = solve(g);
		for (int i=pick(4); i; i--)
			p = pick(3) ? constrain_and(cons(depth), p)
			            : solve_and({ (decltype(goal::kind))pick(3),
			                          cons(depth) }, p);
		return p;
	}
};

}

static constexpr int N = 500;

TEST(Properties, Coverage) {
	gen g(42);
	for (int i=0; i<N; i++) {
		sptr<program> p = g.prog(3);
		vec<variable> fv = free_variables(p);
		/* each variable over its entire domain always has a sample */
		opt<vec<assignment>> a = generate_attempt(fv);
		ASSERT_TRUE(a) << to_string(p);
		EXPECT_EQ(a->size(), fv.size());
		EXPECT_TRUE(free_variables(clp::apply(p, *a)).empty()) << to_string(p);
	}
}

TEST(Properties, CoverageFailure) {
	gen g(43);
	for (int i=0; i<N; i++) {
		sptr<program> p = g.prog(3);
		vec<variable> fv = free_variables(p);
		if (fv.empty())
			continue;
		/* no sample for a variable over an empty domain */
		variable &v = fv[g.pick((int)fv.size())];
		if (v.dom.get<bdom>())
			v.dom = bdom { none {} };
		else
			v.dom = empty_set();
		EXPECT_FALSE(generate_attempt(fv)) << to_string(p);
	}
}

TEST(Properties, ReduceIdempotent) {
	gen g(44);
	for (int i=0; i<N; i++) {
		sptr<program> p = g.prog(4);
		sptr<program> r = reduce(p);
		EXPECT_TRUE(*reduce(r) == *r) << to_string(p);
		EXPECT_EQ(reduce(r), r) << to_string(p);
	}
}

TEST(Properties, ReduceGroundTermsToConstants) {
	gen g(45);
	g.with_vars = false;
	for (int i=0; i<N; i++) {
		EXPECT_TRUE(reduce(g.term(4))->get<icnst>());
		EXPECT_TRUE(reduce(g.form(4))->get<bcnst>());
		EXPECT_TRUE(truth(reduce(g.cons(3))).has_value());
	}
}

TEST(Properties, NaNPropagates) {
	gen g(46);
	for (int i=0; i<N; i++) {
		sptr<iterm> t = g.term(3);
		sptr<iterm> n = nan_cnst();
		for (sptr<iterm> u : { t + n, n * t, t / n, -par(n % t) }) {
			sptr<iterm> r = reduce(u);
			const icnst *c = r->get<icnst>();
			ASSERT_TRUE(c) << to_string(u);
			EXPECT_TRUE(c->value.is_nan()) << to_string(u);
		}
	}
}

TEST(Properties, SampleIsMember) {
	gen g(47);
	g.with_vars = false;
	int found = 0;
	for (int i=0; i<N; i++) {
		sptr<idom> d = g.dom(4);
		opt<kay::Z> s = sample(d);
		if (!s)
			continue;
		found++;
		EXPECT_EQ(contains(d, *s), true) << to_string(d) << ": " << s->get_str();
		EXPECT_TRUE(contains(domain { d }, value { icnst { *s } }));
	}
	EXPECT_GT(found, 0);
}

TEST(Properties, SetAlgebra) {
	gen g(48);
	g.with_vars = false;
	for (int i=0; i<N/5; i++) {
		sptr<idom> a = g.dom(3), b = g.dom(3);
		for (long v = -20; v <= 20; v++) {
			inum z = kay::Z(v);
			bool in_a = *contains(a, z);
			bool in_b = *contains(b, z);
			EXPECT_EQ(*contains(unite(a, b), z), in_a || in_b);
			EXPECT_EQ(*contains(intersect(a, b), z), in_a && in_b);
			EXPECT_EQ(*contains(minus(a, b), z), in_a && !in_b);
			EXPECT_EQ(*contains(complement(a), z), !in_a);
			EXPECT_EQ(*contains(complement(complement(a)), z), in_a);
		}
	}
}

TEST(Properties, NextMemberIsLeast) {
	gen g(49);
	g.with_vars = false;
	for (int i=0; i<N/5; i++) {
		sptr<idom> d = g.dom(3);
		for (long v = -20; v <= 20; v += 5) {
			opt<kay::Z> m = next_member(d, kay::Z(v));
			opt<kay::Z> o = next_nonmember(d, kay::Z(v));
			if (m) {
				EXPECT_TRUE(*m >= v);
				EXPECT_EQ(contains(d, *m), true);
			}
			if (o) {
				EXPECT_TRUE(*o >= v);
				EXPECT_EQ(contains(d, *o), false);
			}
			for (long w = v; w <= 25; w++) {
				bool in = *contains(d, kay::Z(w));
				if (in)
					EXPECT_TRUE(m && *m <= w) << to_string(d) << " " << w;
				else
					EXPECT_TRUE(o && *o <= w) << to_string(d) << " " << w;
			}
		}
	}
}
