/* SPDX-License-Identifier: Apache-2.0
 *
 * Copyright 2022 Franz Brausse <franz.brausse@manchester.ac.uk>
 * Copyright 2022 The University of Manchester
 */

#include <clp/domain.hh>
#include <clp/dump.hh>

#include <gtest/gtest.h>

using namespace clp;
using namespace clp::ops;

static sptr<iterm> n(long v) { return zcnst(v); }

/* the sample as a string, "none" if there is none */
static str smp(const sptr<idom> &d, long limit = probe_limit)
{
	opt<kay::Z> s = sample(d, limit);
	return s ? s->get_str() : "none";
}

static str smp(const domain &d)
{
	opt<value> s = sample(d);
	return s ? to_string(*s) : "none";
}

static bool has(const sptr<idom> &d, long v)
{
	opt<bool> r = contains(d, kay::Z(v));
	EXPECT_TRUE(r.has_value()) << to_string(d);
	return r.value_or(false);
}

TEST(Domain, ContainsRanges) {
	EXPECT_TRUE(has(closed(n(1), n(3)), 1));
	EXPECT_TRUE(has(closed(n(1), n(3)), 3));
	EXPECT_FALSE(has(open(n(1), n(3)), 1));
	EXPECT_TRUE(has(open(n(1), n(3)), 2));
	EXPECT_FALSE(has(open(n(1), n(3)), 3));
	EXPECT_FALSE(has(open_closed(n(1), n(3)), 1));
	EXPECT_TRUE(has(open_closed(n(1), n(3)), 3));
	EXPECT_TRUE(has(closed_open(n(1), n(3)), 1));
	EXPECT_FALSE(has(closed_open(n(1), n(3)), 3));
	EXPECT_FALSE(has(closed(n(3), n(1)), 2));
	EXPECT_FALSE(has(closed(nan_cnst(), n(1)), 0));
}

TEST(Domain, ContainsSetAlgebra) {
	sptr<idom> a = closed(n(0), n(10));
	sptr<idom> b = set_of({ n(5), n(20), nan_cnst() });
	EXPECT_TRUE(has(universe(), -1000));
	EXPECT_FALSE(has(empty_set(), 0));
	EXPECT_TRUE(has(b, 20));
	EXPECT_FALSE(has(b, 6));
	EXPECT_TRUE(has(unite(a, b), 20));
	EXPECT_TRUE(has(unite(a, b), 7));
	EXPECT_TRUE(has(intersect(a, b), 5));
	EXPECT_FALSE(has(intersect(a, b), 7));
	EXPECT_TRUE(has(minus(a, b), 7));
	EXPECT_FALSE(has(minus(a, b), 5));
	EXPECT_TRUE(has(complement(a), -1));
	EXPECT_FALSE(has(complement(a), 0));
}

TEST(Domain, ContainsUnknown) {
	EXPECT_FALSE(contains(closed(n(0), ivar("x")), kay::Z(0)).has_value());
	EXPECT_FALSE(contains(set_of({ ivar("x") }), kay::Z(0)).has_value());
	/* NaN never is a member, even of unknown domains */
	EXPECT_EQ(contains(closed(n(0), ivar("x")), nan_t {}), false);
	EXPECT_EQ(contains(universe(), nan_t {}), false);
}

TEST(Domain, ContainsValues) {
	domain i = unite(set_of({ n(1) }), set_of({ n(2) }));
	EXPECT_TRUE(contains(i, value { icnst { kay::Z(2) } }));
	EXPECT_FALSE(contains(i, value { icnst { kay::Z(3) } }));
	EXPECT_FALSE(contains(i, value { bcnst { true } }));

	domain b = bdom { bcnst { true } };
	EXPECT_TRUE(contains(b, value { bcnst { true } }));
	EXPECT_FALSE(contains(b, value { bcnst { false } }));
	EXPECT_FALSE(contains(b, value { icnst { kay::Z(1) } }));
	EXPECT_TRUE(contains(domain { bdom { entire {} } }, value { bcnst { false } }));
	EXPECT_FALSE(contains(domain { bdom { none {} } }, value { bcnst { false } }));
	EXPECT_FALSE(contains(domain { closed(n(0), ivar("x")) },
	                      value { icnst { kay::Z(0) } }));
}

TEST(Sample, Booleans) {
	EXPECT_EQ(smp(domain { bdom { entire {} } }), "false");
	EXPECT_EQ(smp(domain { bdom { none {} } }), "none");
	EXPECT_EQ(smp(domain { bdom { bcnst { true } } }), "true");
}

TEST(Sample, Basic) {
	EXPECT_EQ(smp(universe()), "0");
	EXPECT_EQ(smp(empty_set()), "none");
	EXPECT_EQ(smp(domain { set_of({ n(3) }) }), "3");
}

TEST(Sample, Ranges) {
	EXPECT_EQ(smp(closed(n(1), n(5))), "1");
	EXPECT_EQ(smp(open(n(1), n(5))), "2");
	EXPECT_EQ(smp(open_closed(n(1), n(5))), "2");
	EXPECT_EQ(smp(closed_open(n(1), n(5))), "1");
	EXPECT_EQ(smp(closed(n(-3) * n(2), n(5))), "-6");
	EXPECT_EQ(smp(open(n(1), n(2))), "none");
	EXPECT_EQ(smp(closed(n(5), n(1))), "none");
	EXPECT_EQ(smp(closed(n(1) / n(0), n(5))), "none");
	EXPECT_EQ(smp(closed(n(1), ivar("x"))), "none");
}

TEST(Sample, Lists) {
	EXPECT_EQ(smp(set_of({ nan_cnst(), n(7), n(3) })), "7");
	EXPECT_EQ(smp(set_of({ nan_cnst() })), "none");
	EXPECT_EQ(smp(set_of({})), "none");
	EXPECT_EQ(smp(set_of({ n(7), ivar("x") })), "none");
}

TEST(Sample, Union) {
	EXPECT_EQ(smp(unite(set_of({ n(9) }), closed(n(4), n(6)))), "9");
	EXPECT_EQ(smp(unite(empty_set(), closed(n(4), n(6)))), "4");
	EXPECT_EQ(smp(unite(open(n(4), n(5)), empty_set())), "none");
}

TEST(Sample, Intersection) {
	EXPECT_EQ(smp(intersect(closed(n(0), n(10)), closed(n(5), n(20)))), "5");
	EXPECT_EQ(smp(intersect(closed(n(5), n(20)), closed(n(0), n(10)))), "5");
	EXPECT_EQ(smp(intersect(set_of({ n(1), n(9) }), set_of({ n(9), n(1) }))), "1");
	/* neither sample is in the other side */
	EXPECT_EQ(smp(intersect(closed(n(0), n(10)), set_of({ n(20), n(7) }))), "7");
	EXPECT_EQ(smp(intersect(closed(n(0), n(10)), closed(n(11), n(20)))), "none");
}

TEST(Sample, Difference) {
	EXPECT_EQ(smp(minus(closed(n(0), n(10)), set_of({ n(1) }))), "0");
	EXPECT_EQ(smp(minus(closed(n(0), n(10)), closed(n(0), n(3)))), "4");
	EXPECT_EQ(smp(minus(closed(n(0), n(3)), closed(n(0), n(3)))), "none");
	EXPECT_EQ(smp(minus(universe(), set_of({ n(0), n(1) }))), "-170141183460469231731687303715884105728");
}

TEST(Sample, Complement) {
	EXPECT_EQ(smp(complement(universe())), "none");
	EXPECT_EQ(smp(complement(empty_set())), "-170141183460469231731687303715884105728");
	EXPECT_EQ(smp(complement(closed(zcnst(zmin()), n(5)))), "6");
	EXPECT_EQ(smp(complement(complement(closed(n(2), n(5))))), "2");
	EXPECT_EQ(smp(complement(unite(closed(zcnst(zmin()), n(5)),
	                               set_of({ n(6), n(8) })))), "7");
}

TEST(Sample, ProbeLimit) {
	kay::Z m = zmin();
	sptr<idom> d = complement(set_of({ zcnst(m), zcnst(kay::Z(m + 1)),
	                                   zcnst(kay::Z(m + 2)) }));
	EXPECT_EQ(smp(d, 2), "none");
	EXPECT_EQ(smp(d, 3), kay::Z(m + 3).get_str());
}

TEST(NextMember, Shapes) {
	auto next = [](const sptr<idom> &d, long from) -> str {
		opt<kay::Z> r = next_member(d, kay::Z(from));
		return r ? r->get_str() : "none";
	};
	EXPECT_EQ(next(closed(n(0), n(10)), -5), "0");
	EXPECT_EQ(next(closed(n(0), n(10)), 4), "4");
	EXPECT_EQ(next(closed(n(0), n(10)), 11), "none");
	EXPECT_EQ(next(set_of({ n(9), n(2), n(5) }), 3), "5");
	EXPECT_EQ(next(unite(set_of({ n(9) }), closed(n(3), n(4))), 5), "9");
	EXPECT_EQ(next(minus(closed(n(0), n(10)), closed(n(2), n(8))), 2), "9");
	EXPECT_EQ(next(complement(closed(n(0), n(10))), 0), "11");
	EXPECT_EQ(next(closed(n(0), ivar("x")), 0), "none");
}

TEST(NextNonMember, Shapes) {
	auto next = [](const sptr<idom> &d, long from) -> str {
		opt<kay::Z> r = next_nonmember(d, kay::Z(from));
		return r ? r->get_str() : "none";
	};
	EXPECT_EQ(next(closed(n(0), n(10)), -5), "-5");
	EXPECT_EQ(next(closed(n(0), n(10)), 4), "11");
	EXPECT_EQ(next(set_of({ n(3), n(4), n(6) }), 3), "5");
	EXPECT_EQ(next(unite(closed(n(0), n(3)), closed(n(4), n(6))), 1), "7");
	EXPECT_EQ(next(intersect(closed(n(0), n(3)), closed(n(2), n(6))), 2), "4");
	EXPECT_EQ(next(universe(), 0), "none");
	EXPECT_EQ(next(complement(set_of({ n(5) })), 0), "5");
}
