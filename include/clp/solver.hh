/* SPDX-License-Identifier: Apache-2.0
 *
 * Copyright 2022 Franz Brausse <franz.brausse@manchester.ac.uk>
 * Copyright 2022 The University of Manchester
 */

#pragma once

#include "domain.hh"

namespace clp {

struct options {
	/* the driver gives up after iteration_factor * (size(program) + 1)
	 * steps */
	long iteration_factor = 4;
	/* number of bisection rounds per Minimise/Maximise goal */
	long max_rounds = 256;
	/* bound on the steps of the sampler's searches */
	long probe_limit = 1L << 16;
};

struct unsatisfiable {
	symbol sym; str reason;
	bool operator==(const unsatisfiable &b) const = default;
};

/* The value of a free variable in a solution */
struct var_solution {
	symbol sym; value val;
	bool operator==(const var_solution &b) const = default;
};

/* The optimum of the objective of a Minimise or Maximise goal */
struct const_solution {
	symbol sym; value val;
	bool operator==(const const_solution &b) const = default;
};

struct solution : sumtype<unsatisfiable,var_solution,const_solution> {

	using sumtype<unsatisfiable,var_solution,const_solution>::sumtype;
};

str to_string(const solution &s);

/* The free variables of 'p', see get_free() */
vec<variable> free_variables(const sptr<program> &p);

/* Samples the domain of each variable in order. Fails if any of the samples
 * does. */
opt<vec<assignment>> generate_attempt(const vec<variable> &v,
                                      long limit = probe_limit);

/* Domains of variables derived from the conjuncts of 'p' that are required to
 * hold:
 * - boolean: b gives {true}, not b gives {false}, b <=> v gives {v}
 * - integer: x == e, x != e, x > e, x < e and x in d, with 'x' a variable and
 *   'e', 'd' not mentioning 'x', give {e}, compl {e}, (e, zmax], [zmin, e)
 *   and d, respectively, also with the sides swapped
 * Several declarations of one variable are intersected. Variables without any
 * declaration do not appear in the result. */
hmap<str,domain> declarations(const sptr<program> &p);

/* Symbols only occurring in the bounds or elements of domains */
vec<symbol> validate(const sptr<program> &p);

/* Solves 'p'. The result is either a single unsatisfiable record, one per
 * symbol rejected by validate(), or the value of each free variable of 'p' in
 * order of first occurrence followed by the optimum of each Minimise and
 * Maximise goal in program order. */
vec<solution> solve(const sptr<program> &p, const options &o = {});

}
