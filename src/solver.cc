/* SPDX-License-Identifier: Apache-2.0
 *
 * Copyright 2022 Franz Brausse <franz.brausse@manchester.ac.uk>
 * Copyright 2022 The University of Manchester
 */

#include <clp/solver.hh>
#include <clp/dump.hh>

#include <algorithm>

using namespace clp;

str clp::to_string(const solution &s)
{
	return s.match(
	[](const unsatisfiable &u) {
		return "unsat " + u.sym.id + ": " + u.reason;
	},
	[](const var_solution &v) {
		return "var " + v.sym.id + " = " + to_string(v.val);
	},
	[](const const_solution &c) {
		return "const " + c.sym.id + " = " + to_string(c.val);
	}
	);
}

vec<variable> clp::free_variables(const sptr<program> &p)
{
	return get_free(p);
}

static opt<vec<assignment>> attempt(const vec<variable> &v, long limit,
                                    const variable **failed)
{
	vec<assignment> a;
	for (const variable &x : v) {
		opt<value> s = sample(x.dom, limit);
		if (!s) {
			info(mod_smp,"no sample in domain %s of %s\n",
			     to_string(x.dom).c_str(), x.sym.id.c_str());
			if (failed)
				*failed = &x;
			return {};
		}
		a.push_back(assignment { x.sym, move(*s) });
	}
	return a;
}

opt<vec<assignment>> clp::generate_attempt(const vec<variable> &v, long limit)
{
	return attempt(v, limit, nullptr);
}

static bool is_ground(const domain &d)
{
	return d.match(
	[](const bdom &) { return true; },
	[](const sptr<idom> &i) { return is_ground(i); }
	);
}

template <typename F>
static void for_each_conjunct(const sptr<program> &p, F &&f)
{
	for (const program *q = p.get(); q;)
		q = q->match(
		[&](const goal &g) -> const program * { f(g.c); return nullptr; },
		[&](const goal_and &a) -> const program * {
			f(a.g.c);
			return a.rest.get();
		},
		[&](const constr_and &a) -> const program * {
			f(a.c);
			return a.rest.get();
		}
		);
}

namespace {

enum state { SEARCHING, SATISFIED, UNSATISFIABLE, STUCK, };

const char *state_s[] = { "searching", "satisfied", "unsatisfiable", "stuck" };

struct outcome {
	state st;
	vec<assignment> model;
	unsatisfiable why;
};

/* Finds a solution of a single program by repeatedly sampling the domains of
 * the resolvable variables, substituting and reducing. */
struct driver {

	const options &o;
	symbol first;

	outcome run(sptr<program> p) const
	{
		vec<variable> fv = distinct(get_free(p));
		outcome r = { SEARCHING, {}, {} };
		size_t bound = o.iteration_factor * (size(p) + 1);
		size_t n;
		for (n = 0; r.st == SEARCHING; n++)
			step(p, r, n < bound);
		note(mod_drv,"%s after %zu steps\n", state_s[r.st], n);
		if (r.st == SATISFIED)
			complete(r.model, fv);
		return r;
	}

private:
	void step(sptr<program> &p, outcome &r, bool may_continue) const
	{
		auto leave = [&](state st, symbol s, str reason) {
			dbg(mod_drv,"-> %s: %s\n", state_s[st], reason.c_str());
			r.st = st;
			r.why = unsatisfiable { move(s), move(reason) };
		};

		p = reduce(p);
		if (logs(mod_drv, DEBUG))
			dbg(mod_drv,"reduced: %s\n", to_string(p).c_str());

		bool contradiction = false;
		bool all_true = true;
		for_each_conjunct(p, [&](const constraint &c) {
			opt<bool> t = truth(c);
			contradiction |= t == false;
			all_true &= t == true;
		});
		if (contradiction)
			return leave(UNSATISFIABLE, first, "contradiction");

		vec<variable> fv = distinct(get_free(p));
		if (empty(fv)) {
			if (all_true)
				r.st = SATISFIED;
			else
				leave(STUCK, first, "stuck: unresolved constraint in " +
				                    to_string(p));
			return;
		}
		if (!may_continue)
			return leave(STUCK, fv.front().sym,
			             "stuck: iteration bound exceeded");

		/* declared variables first, the others only when none of the
		 * declared ones is resolvable */
		hmap<str,domain> decls = declarations(p);
		vec<variable> ready, undeclared, deferred;
		for (variable &v : fv) {
			auto it = decls.find(v.sym.id);
			if (it == end(decls))
				undeclared.push_back(move(v));
			else if (is_ground(it->second))
				ready.push_back(variable { move(v.sym), it->second });
			else {
				dbg(mod_drv,"deferring %s in %s\n", v.sym.id.c_str(),
				    to_string(it->second).c_str());
				deferred.push_back(move(v));
			}
		}
		if (empty(ready))
			ready = move(undeclared);
		if (empty(ready)) {
			/* the declarations depend on each other, as in x == y: the
			 * first deferred variable is taken from its entire domain */
			assert(!empty(deferred));
			dbg(mod_drv,"breaking cycle on %s\n",
			    deferred.front().sym.id.c_str());
			ready.push_back(move(deferred.front()));
		}

		const variable *failed = nullptr;
		opt<vec<assignment>> a = attempt(ready, o.probe_limit, &failed);
		if (!a) {
			assert(failed);
			return leave(UNSATISFIABLE, failed->sym, "empty domain");
		}
		if (logs(mod_drv, DEBUG))
			dbg(mod_drv,"attempt: %s\n", to_string(*a).c_str());

		p = clp::apply(p, *a);
		r.model.insert(end(r.model), begin(*a), end(*a));
	}

	/* Variables eliminated by reduction before being assigned take the
	 * sample of their kind's entire domain. */
	void complete(vec<assignment> &model, const vec<variable> &fv) const
	{
		hset<str> assigned;
		for (const assignment &a : model)
			assigned.insert(a.sym.id);
		for (const variable &v : fv) {
			if (assigned.contains(v.sym.id))
				continue;
			opt<value> s = sample(v.dom, o.probe_limit);
			assert(s);
			dbg(mod_drv,"%s is unconstrained\n", v.sym.id.c_str());
			model.push_back(assignment { v.sym, move(*s) });
		}
	}
};

/* Bisection over the values of an objective strictly better than the best one
 * found so far. */
struct search_z {

	kay::Z lo, hi;
	bool minimise;

	bool has_next() const { return lo <= hi; }

	/* minimise: is there a solution with obj <= query()?
	 * maximise: is there a solution with obj >= query()? */
	kay::Z query() const
	{
		kay::Z d = hi - lo;
		d /= 2;
		return minimise ? kay::Z(lo + d) : kay::Z(hi - d);
	}

	void found(const kay::Z &v)
	{
		if (minimise)
			hi = v - 1;
		else
			lo = v + 1;
	}

	void failed(const kay::Z &q)
	{
		if (minimise)
			lo = q + 1;
		else
			hi = q - 1;
	}
};

}

static sptr<iterm> objective(const goal &g)
{
	const sptr<rel> *r = g.c.get<sptr<rel>>();
	if (!r)
		return nullptr;
	return (*r)->match(
	[](const prop &p) { return p.left; },
	[](const member &m) { return m.elem; }
	);
}

static opt<inum> evaluate(const sptr<iterm> &t, const vec<assignment> &model)
{
	sptr<iterm> v = reduce(clp::apply(t, model));
	if (const icnst *c = v->get<icnst>())
		return c->value;
	return {};
}

/* Improves 'r', a solution of 'p', with respect to the objective 'obj' of goal
 * 'g'. Returns the optimum of 'obj'. */
static inum optimise(const driver &drv, const sptr<program> &p,
                     const goal &g, const sptr<iterm> &obj, outcome &r,
                     long max_rounds)
{
	opt<inum> best = evaluate(obj, r.model);
	assert(best);
	const kay::Z *b = best->get<kay::Z>();
	if (!b) {
		warn(mod_opt,"objective %s of goal '%s' is NaN\n",
		     to_string(obj).c_str(), to_string(g).c_str());
		return *best;
	}
	bool minimise = g.kind == goal::MINIMISE;
	search_z s = minimise ? search_z { zmin(), *b - 1, true }
	                      : search_z { *b + 1, zmax(), false };
	long round;
	for (round = 0; round < max_rounds && s.has_next(); round++) {
		kay::Z q = s.query();
		/* obj <= q resp. obj >= q */
		sptr<rel> bound = minimise
		                ? ops::lt(obj, ops::zcnst(kay::Z(q + 1)))
		                : ops::gt(obj, ops::zcnst(kay::Z(q - 1)));
		note(mod_opt,"round %ld: searching %s %s %s\n", round,
		     to_string(obj).c_str(), minimise ? "<=" : ">=",
		     q.get_str().c_str());
		timing t0;
		outcome o = drv.run(ops::constrain_and(bound, p));
		info(mod_opt,"round %ld: %s in %5.3fs\n", round,
		     state_s[o.st], (double)(timing() - t0));
		if (o.st != SATISFIED) {
			s.failed(q);
			continue;
		}
		opt<inum> v = evaluate(obj, o.model);
		const kay::Z *z = v ? v->get<kay::Z>() : nullptr;
		assert(z);
		s.found(*z);
		best = *v;
		r = move(o);
	}
	if (s.has_next())
		warn(mod_opt,"optimisation of %s stopped after %ld rounds\n",
		     to_string(obj).c_str(), round);
	info(mod_opt,"optimum of %s: %s\n", to_string(obj).c_str(),
	     to_string(*best).c_str());
	return *best;
}

static vec<goal> goals(const sptr<program> &p)
{
	vec<goal> r;
	for (const program *q = p.get(); q;)
		q = q->match(
		[&](const goal &g) -> const program * {
			r.push_back(g);
			return nullptr;
		},
		[&](const goal_and &a) -> const program * {
			r.push_back(a.g);
			return a.rest.get();
		},
		[&](const constr_and &a) -> const program * {
			return a.rest.get();
		}
		);
	return r;
}

vec<solution> clp::solve(const sptr<program> &p, const options &o)
{
	timing t0;
	vec<solution> res;

	for (symbol &s : validate(p))
		res.push_back(unsatisfiable { move(s),
		                              "undeclared variable in domain" });
	if (!empty(res))
		return res;

	vec<variable> fv = distinct(free_variables(p));
	driver drv { o, empty(fv) ? symbol {} : fv.front().sym };
	info(mod_drv,"solving program of size %zu with %zu variables\n",
	     size(p), size(fv));

	outcome r = drv.run(p);
	if (r.st != SATISFIED) {
		info(mod_clp,"%s in %5.3fs: %s\n", state_s[r.st],
		     (double)(timing() - t0), r.why.reason.c_str());
		return { move(r.why) };
	}

	hset<str> taken;
	for (const variable &v : fv)
		taken.insert(v.sym.id);

	vec<const_solution> optima;
	sptr<program> q = p;
	for (const goal &g : goals(p)) {
		if (g.kind == goal::SATISFY)
			continue;
		sptr<iterm> obj = objective(g);
		if (!obj) {
			dbg(mod_opt,"boolean goal '%s' is satisfied\n",
			    to_string(g).c_str());
			continue;
		}
		inum best = optimise(drv, q, g, obj, r, o.max_rounds);
		str name = fresh(taken, "objective");
		taken.insert(name);
		optima.push_back(const_solution { symbol { name },
		                                  icnst { best } });
		if (!best.is_nan())
			q = ops::constrain_and(ops::eq(obj, mki(icnst { best })), q);
	}

	for (const variable &v : fv) {
		auto it = std::find_if(begin(r.model), end(r.model),
		                       [&](const assignment &a) {
			return a.sym == v.sym;
		});
		assert(it != end(r.model));
		res.push_back(var_solution { v.sym, it->val });
	}
	for (const_solution &c : optima)
		res.push_back(move(c));

	info(mod_clp,"satisfied in %5.3fs\n", (double)(timing() - t0));
	if (logs(mod_clp, NOTE))
		for (const solution &s : res)
			note(mod_clp,"%s\n", to_string(s).c_str());
	return res;
}
