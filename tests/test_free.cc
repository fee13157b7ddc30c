/* SPDX-License-Identifier: Apache-2.0
 *
 * Copyright 2022 Franz Brausse <franz.brausse@manchester.ac.uk>
 * Copyright 2022 The University of Manchester
 */

#include <clp/solver.hh>

#include <gtest/gtest.h>

using namespace clp;
using namespace clp::ops;

static vec<str> ids(const vec<variable> &v)
{
	vec<str> r;
	for (const variable &x : v)
		r.push_back(x.sym.id);
	return r;
}

TEST(FreeVariables, Constants) {
	EXPECT_TRUE(get_free(true1).empty());
	EXPECT_TRUE(get_free(zcnst(1) + nan_cnst()).empty());
	EXPECT_TRUE(get_free(closed(zcnst(1), zcnst(2))).empty());
	EXPECT_TRUE(free_variables(solve(satisfy(eq(zcnst(1), zcnst(1))))).empty());
}

TEST(FreeVariables, OrderWithDuplicates) {
	sptr<iterm> x = ivar("x"), y = ivar("y");
	sptr<program> p =
		constrain_and(eq(x + y, par(x)),
		solve_and(satisfy(conj(bvar("a"), neg(bvar("a")))),
		solve(minimise(in(ivar("z"), closed(ivar("w"), -x))))));
	EXPECT_EQ(ids(free_variables(p)),
	          (vec<str> { "x", "y", "x", "a", "a", "z", "w", "x" }));
	EXPECT_EQ(ids(distinct(free_variables(p))),
	          (vec<str> { "x", "y", "a", "z", "w" }));
}

TEST(FreeVariables, KindOfDomain) {
	vec<variable> v = get_free(constraint { disj(bvar("b"), bvar("c")) });
	ASSERT_EQ(v.size(), 2u);
	for (const variable &x : v) {
		const bdom *d = x.dom.get<bdom>();
		ASSERT_TRUE(d);
		EXPECT_TRUE(d->get<entire>());
	}

	v = get_free(constraint { gt(ivar("i") % zcnst(2), zcnst(0)) });
	ASSERT_EQ(v.size(), 1u);
	const sptr<idom> *d = v[0].dom.get<sptr<idom>>();
	ASSERT_TRUE(d);
	EXPECT_TRUE((*d)->get<entire>());
}

TEST(FreeVariables, InsideDomains) {
	sptr<idom> d = unite(set_of({ ivar("a"), zcnst(1) }),
	                     complement(open(zcnst(0), ivar("b"))));
	EXPECT_EQ(ids(get_free(d)), (vec<str> { "a", "b" }));
}

TEST(Ground, Terms) {
	EXPECT_TRUE(is_ground(zcnst(1) * -zcnst(2)));
	EXPECT_FALSE(is_ground(zcnst(1) * -ivar("x")));
	EXPECT_TRUE(is_ground(minus(universe(), set_of({ nan_cnst() }))));
	EXPECT_FALSE(is_ground(intersect(universe(), closed_open(zcnst(0), ivar("n")))));
}

TEST(Size, CountsNodes) {
	EXPECT_EQ(size(ivar("x") + zcnst(1)), 3u);
	EXPECT_EQ(size(closed(zcnst(0), zcnst(1))), 3u);
	EXPECT_EQ(size(in(ivar("x"), closed(zcnst(0), zcnst(1)))), 5u);
	EXPECT_EQ(size(solve(satisfy(true1))), 2u);
	EXPECT_EQ(size(constrain_and(true1, solve(satisfy(true1)))), 4u);
}
