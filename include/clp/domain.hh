/* SPDX-License-Identifier: Apache-2.0
 *
 * Copyright 2022 Franz Brausse <franz.brausse@manchester.ac.uk>
 * Copyright 2022 The University of Manchester
 */

#pragma once

#include "expr.hh"

namespace clp {

/* Set semantics of domains.
 *
 * The bounds of an idom are terms; they are evaluated by reduce() whenever the
 * set is queried. A domain with variables in its bounds is not ground and its
 * members are unknown. A bound or element evaluating to NaN denotes no integer:
 * a range with a NaN bound is empty and NaN elements of a list are ignored.
 *
 * All searches are bounded by 'limit' steps and fail when it is exhausted. */

/* Membership of 'v' in 'd'; nullopt if 'd' is not ground. NaN is never a
 * member, regardless of 'd'. */
opt<bool> contains(const sptr<idom> &d, const inum &v);
bool contains(const bdom &d, bool v);

/* Whether 'v' is a member of 'd'. False if the kinds of 'd' and 'v' differ or
 * if membership is unknown. */
bool contains(const domain &d, const value &v);

/* Least member of 'd' that is >= 'from' */
opt<kay::Z> next_member(const sptr<idom> &d, const kay::Z &from,
                        long limit = probe_limit);

/* Least integer >= 'from' in [zmin, zmax] that is not a member of 'd' */
opt<kay::Z> next_nonmember(const sptr<idom> &d, const kay::Z &from,
                           long limit = probe_limit);

/* Deterministically picks a representative member of a domain:
 * - entire         : false for booleans, 0 for integers
 * - single value   : that value
 * - range          : its least member
 * - list           : the first element that is not NaN
 * - union          : a sample of the left side, if it has one, else of the right
 * - intersection   : a sample of one side that is a member of the other side,
 *                    else the least member
 * - difference     : a sample of the left side not in the right, else the
 *                    least member
 * - complement     : the least non-member of the argument
 * Returns nullopt for empty domains, for domains that are not ground and when
 * the search exceeds 'limit' steps. */
opt<bcnst> sample(const bdom &d);
opt<kay::Z> sample(const sptr<idom> &d, long limit = probe_limit);
opt<value> sample(const domain &d, long limit = probe_limit);

}
