/* SPDX-License-Identifier: Apache-2.0
 *
 * Copyright 2022 Franz Brausse <franz.brausse@manchester.ac.uk>
 * Copyright 2022 The University of Manchester
 */

#pragma once

#include "numbers.hh"

namespace clp {

/* Definition of the expression trees making up a constraint program.
 *
 * All trees are immutable once constructed. Children are held by sptr and may
 * be shared between trees; operations that rewrite a tree return the original
 * node whenever nothing below it changed.
 *
 * - bform     : boolean formula
 * - iterm     : integer term
 * - idom      : integer domain, a set of integers with symbolic bounds
 * - rel       : relation between integer terms, or membership in an idom
 * - constraint: a bform or a rel, interpreted as one conjunct
 * - goal      : Satisfy, Minimise or Maximise over a constraint
 * - program   : right-leaning conjunction of goals and constraints
 */

struct bform;
struct iterm;
struct idom;
struct rel;
struct program;

/* The name of a variable; used verbatim as the leaf of bform and iterm */
struct symbol {
	str id;
	bool operator==(const symbol &b) const = default;
};

struct bcnst {
	bool value;
	bool operator==(const bcnst &b) const = default;
};

struct icnst {
	inum value;
	bool operator==(const icnst &b) const;
};

/* A 'bform' boolean formula is either:
 * - symbol: boolean variable
 * - bcnst : boolean constant
 * - bbop  : binary connective AND, OR, IMPLIES or EQUIV
 * - buop  : negation or parenthesis
 */

struct bbop {
	enum { AND, OR, IMPLIES, EQUIV, } op; sptr<bform> left, right;
	bool operator==(const bbop &b) const;
};
struct buop {
	enum { NOT, PAREN, } op; sptr<bform> operand;
	bool operator==(const buop &b) const;
};

inline const char *bbop_s[] = { "and", "or", "=>", "<=>" };

struct bform : sumtype<symbol,bcnst,bbop,buop> {

	using sumtype<symbol,bcnst,bbop,buop>::sumtype;
};

/* An 'iterm' integer term is either:
 * - symbol: integer variable
 * - icnst : integer number, possibly NaN
 * - ibop  : binary arithmetic operation, see aop_t
 * - iuop  : negation or parenthesis
 */

struct ibop {
	aop_t op; sptr<iterm> left, right;
	bool operator==(const ibop &b) const;
};
struct iuop {
	enum { NEG, PAREN, } op; sptr<iterm> operand;
	bool operator==(const iuop &b) const;
};

struct iterm : sumtype<symbol,icnst,ibop,iuop> {

	using sumtype<symbol,icnst,ibop,iuop>::sumtype;
};

/* An 'idom' integer domain denotes a set of integers in [zmin, zmax]:
 * - entire: all of [zmin, zmax]
 * - none  : the empty set
 * - range : interval between two terms, each end open or closed
 * - list  : explicit, ordered sequence of terms
 * - dbop  : union, intersection or difference of two domains
 * - dcompl: complement with respect to [zmin, zmax]
 * NaN is never contained in any domain.
 */

struct entire {
	bool operator==(const entire &) const = default;
};
struct none {
	bool operator==(const none &) const = default;
};

struct range {
	enum { CLOSED, OPEN, OPEN_CLOSED, CLOSED_OPEN, } kind; sptr<iterm> lo, hi;
	bool operator==(const range &b) const;

	bool lo_open() const { return kind == OPEN || kind == OPEN_CLOSED; }
	bool hi_open() const { return kind == OPEN || kind == CLOSED_OPEN; }
};
struct list {
	vec<sptr<iterm>> values;
	bool operator==(const list &b) const;
};
struct dbop {
	enum { UNION, INTERSECT, DIFF, } op; sptr<idom> left, right;
	bool operator==(const dbop &b) const;
};
struct dcompl {
	sptr<idom> arg;
	bool operator==(const dcompl &b) const;
};

inline const char *dbop_s[] = { "union", "inter", "minus" };

struct idom : sumtype<entire,none,range,list,dbop,dcompl> {

	using sumtype<entire,none,range,list,dbop,dcompl>::sumtype;
};

/* Domain of boolean variables: both values, none or a single one */
struct bdom : sumtype<entire,none,bcnst> {

	using sumtype<entire,none,bcnst>::sumtype;
};

struct domain : sumtype<bdom,sptr<idom>> {

	using sumtype<bdom,sptr<idom>>::sumtype;

	bool operator==(const domain &b) const;
};

/* A 'rel' is either:
 * - prop  : two iterm compared using a cmp_t
 * - member: an iterm tested for membership in an idom
 */

struct prop {
	cmp_t cmp; sptr<iterm> left, right;
	bool operator==(const prop &b) const;
};
struct member {
	sptr<iterm> elem; sptr<idom> dom;
	bool operator==(const member &b) const;
};

struct rel : sumtype<prop,member> {

	using sumtype<prop,member>::sumtype;
};

struct constraint : sumtype<sptr<bform>,sptr<rel>> {

	using sumtype<sptr<bform>,sptr<rel>>::sumtype;

	bool operator==(const constraint &b) const;

	/* Whether both hold the very same node */
	friend bool identical(const constraint &a, const constraint &b)
	{
		return a.match([&](const auto &p) {
			const auto *q = b.get<std::remove_cvref_t<decltype(p)>>();
			return q && *q == p;
		});
	}
};

struct goal {
	enum { SATISFY, MINIMISE, MAXIMISE, } kind; constraint c;
	bool operator==(const goal &b) const = default;
};

inline const char *goal_s[] = { "satisfy", "minimise", "maximise" };

/* A 'program' is either:
 * - goal       : the last goal of the conjunction
 * - goal_and   : a goal conjoined with the remaining program
 * - constr_and : a constraint conjoined with the remaining program
 */

struct goal_and {
	goal g; sptr<program> rest;
	bool operator==(const goal_and &b) const;
};
struct constr_and {
	constraint c; sptr<program> rest;
	bool operator==(const constr_and &b) const;
};

struct program : sumtype<goal,goal_and,constr_and> {

	using sumtype<goal,goal_and,constr_and>::sumtype;
};

/* The values a variable can be assigned */
struct value : sumtype<bcnst,icnst> {

	using sumtype<bcnst,icnst>::sumtype;
};

struct variable {
	symbol sym; domain dom;
	bool operator==(const variable &b) const = default;
};

struct assignment {
	symbol sym; value val;
	bool operator==(const assignment &b) const = default;
};

template <typename... Ts>
static inline sptr<bform> mkb(Ts &&... ts)
{
	return std::make_shared<bform>(std::forward<Ts>(ts)...);
}

template <typename... Ts>
static inline sptr<iterm> mki(Ts &&... ts)
{
	return std::make_shared<iterm>(std::forward<Ts>(ts)...);
}

template <typename... Ts>
static inline sptr<idom> mkd(Ts &&... ts)
{
	return std::make_shared<idom>(std::forward<Ts>(ts)...);
}

template <typename... Ts>
static inline sptr<rel> mkr(Ts &&... ts)
{
	return std::make_shared<rel>(std::forward<Ts>(ts)...);
}

template <typename... Ts>
static inline sptr<program> mkp(Ts &&... ts)
{
	return std::make_shared<program>(std::forward<Ts>(ts)...);
}

/* Constants for true and false */
inline const sptr<bform> true1  = mkb(bcnst { true });
inline const sptr<bform> false1 = mkb(bcnst { false });

/* Short forms for building trees */
namespace ops {

static inline sptr<bform> bvar(str id) { return mkb(symbol { move(id) }); }
static inline sptr<iterm> ivar(str id) { return mki(symbol { move(id) }); }
static inline sptr<iterm> zcnst(long v) { return mki(icnst { kay::Z(v) }); }
static inline sptr<iterm> zcnst(kay::Z v) { return mki(icnst { move(v) }); }
static inline sptr<iterm> nan_cnst() { return mki(icnst { nan_t {} }); }

#define BIN_B(name,op)                                                  \
	static inline sptr<bform> name(sptr<bform> l, sptr<bform> r)    \
	{ return mkb(bbop { bbop::op, move(l), move(r) }); }
BIN_B(conj, AND)
BIN_B(disj, OR)
BIN_B(implies, IMPLIES)
BIN_B(equiv, EQUIV)
#undef BIN_B

static inline sptr<bform> neg(sptr<bform> f) { return mkb(buop { buop::NOT, move(f) }); }
static inline sptr<bform> par(sptr<bform> f) { return mkb(buop { buop::PAREN, move(f) }); }

#define BIN_I(op)                                                       \
	static inline sptr<iterm> operator op(sptr<iterm> l, sptr<iterm> r)
BIN_I(+) { return mki(ibop { ADD, move(l), move(r) }); }
BIN_I(-) { return mki(ibop { SUB, move(l), move(r) }); }
BIN_I(*) { return mki(ibop { MUL, move(l), move(r) }); }
BIN_I(/) { return mki(ibop { DIV, move(l), move(r) }); }
BIN_I(%) { return mki(ibop { MOD, move(l), move(r) }); }
#undef BIN_I

static inline sptr<iterm> operator-(sptr<iterm> t) { return mki(iuop { iuop::NEG, move(t) }); }
static inline sptr<iterm> par(sptr<iterm> t) { return mki(iuop { iuop::PAREN, move(t) }); }

#define CMP(name,c)                                                     \
	static inline sptr<rel> name(sptr<iterm> l, sptr<iterm> r)      \
	{ return mkr(prop { c, move(l), move(r) }); }
CMP(eq, EQ)
CMP(ne, NE)
CMP(gt, GT)
CMP(lt, LT)
#undef CMP

static inline sptr<rel> in(sptr<iterm> e, sptr<idom> d)
{
	return mkr(member { move(e), move(d) });
}

#define RANGE(name,kind)                                                \
	static inline sptr<idom> name(sptr<iterm> lo, sptr<iterm> hi)   \
	{ return mkd(range { range::kind, move(lo), move(hi) }); }
RANGE(closed, CLOSED)
RANGE(open, OPEN)
RANGE(open_closed, OPEN_CLOSED)
RANGE(closed_open, CLOSED_OPEN)
#undef RANGE

static inline sptr<idom> universe() { return mkd(entire {}); }
static inline sptr<idom> empty_set() { return mkd(none {}); }
static inline sptr<idom> set_of(vec<sptr<iterm>> v) { return mkd(list { move(v) }); }
static inline sptr<idom> unite(sptr<idom> a, sptr<idom> b) { return mkd(dbop { dbop::UNION, move(a), move(b) }); }
static inline sptr<idom> intersect(sptr<idom> a, sptr<idom> b) { return mkd(dbop { dbop::INTERSECT, move(a), move(b) }); }
static inline sptr<idom> minus(sptr<idom> a, sptr<idom> b) { return mkd(dbop { dbop::DIFF, move(a), move(b) }); }
static inline sptr<idom> complement(sptr<idom> a) { return mkd(dcompl { move(a) }); }

static inline goal satisfy(constraint c) { return goal { goal::SATISFY, move(c) }; }
static inline goal minimise(constraint c) { return goal { goal::MINIMISE, move(c) }; }
static inline goal maximise(constraint c) { return goal { goal::MAXIMISE, move(c) }; }

static inline sptr<program> solve(goal g)
{
	return mkp(move(g));
}

static inline sptr<program> solve_and(goal g, sptr<program> rest)
{
	return mkp(goal_and { move(g), move(rest) });
}

static inline sptr<program> constrain_and(constraint c, sptr<program> rest)
{
	return mkp(constr_and { move(c), move(rest) });
}

} // end namespace ops

/* Number of nodes in a tree, including the nodes of embedded domains */
size_t size(const sptr<bform> &f);
size_t size(const sptr<iterm> &t);
size_t size(const sptr<idom> &d);
size_t size(const sptr<rel> &r);
size_t size(const constraint &c);
size_t size(const sptr<program> &p);

/* Variables occurring in a tree, one entry per occurrence in depth-first,
 * left-to-right order. The analysis is purely syntactic: each entry is declared
 * over the entire domain of its kind, regardless of any constraints on it. */
vec<variable> get_free(const sptr<bform> &f);
vec<variable> get_free(const sptr<iterm> &t);
vec<variable> get_free(const sptr<idom> &d);
vec<variable> get_free(const sptr<rel> &r);
vec<variable> get_free(const constraint &c);
vec<variable> get_free(const goal &g);
vec<variable> get_free(const sptr<program> &p);

/* Keeps the first entry for each symbol */
vec<variable> distinct(vec<variable> v);

/* Ground terms and domains contain no variables */
bool is_ground(const sptr<iterm> &t);
bool is_ground(const sptr<idom> &d);

/* Replace each variable leaf for which an assignment of the same kind exists
 * by the assigned constant. Other leaves are left untouched. No evaluation
 * takes place. If a symbol is assigned more than once, the first assignment
 * counts. */
sptr<iterm> apply(const sptr<iterm> &t, const vec<assignment> &a);
sptr<bform> apply(const sptr<bform> &f, const vec<assignment> &a);
sptr<idom> apply(const sptr<idom> &d, const vec<assignment> &a);
sptr<rel> apply(const sptr<rel> &r, const vec<assignment> &a);
constraint apply(const constraint &c, const vec<assignment> &a);
sptr<program> apply(const sptr<program> &p, const vec<assignment> &a);

/* Constant folding. Arithmetic and relations are evaluated once all their
 * operands are constants, see arith() and cmp(). Logical connectives are
 * short-circuited as soon as one operand is a constant. Membership in a domain
 * is decided once the element is constant and the domain is ground; the bounds
 * of domains are folded as well. Parentheses are dropped. Relations folding to
 * a constant become constant bform constraints; satisfied constraints of a
 * program are removed. reduce() is idempotent. */
sptr<iterm> reduce(const sptr<iterm> &t);
sptr<bform> reduce(const sptr<bform> &f);
sptr<idom> reduce(const sptr<idom> &d);
constraint reduce(const sptr<rel> &r);
constraint reduce(const constraint &c);
sptr<program> reduce(const sptr<program> &p);

/* Returns the constant a constraint folded to, if any */
opt<bool> truth(const constraint &c);

}
