/* SPDX-License-Identifier: Apache-2.0
 *
 * Copyright 2022 Franz Brausse <franz.brausse@manchester.ac.uk>
 * Copyright 2022 The University of Manchester
 */

#pragma once

#include "expr.hh"

namespace clp {

/* Functions to print trees, domains and assignments in an infix notation.
 * The output is meant for diagnostics and is not read back. */

str to_string(const sptr<bform> &e);
str to_string(const sptr<iterm> &e);
str to_string(const sptr<idom> &d);
str to_string(const bdom &d);
str to_string(const domain &d);
str to_string(const sptr<rel> &r);
str to_string(const constraint &c);
str to_string(const goal &g);
str to_string(const sptr<program> &p);
str to_string(const value &v);
str to_string(const variable &v);
str to_string(const assignment &a);
str to_string(const vec<assignment> &a);

}
