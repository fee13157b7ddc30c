/* SPDX-License-Identifier: Apache-2.0
 *
 * Copyright 2022 Franz Brausse <franz.brausse@manchester.ac.uk>
 * Copyright 2022 The University of Manchester
 */

#pragma once

#include <clp/config.h>

#include <cassert>
#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <cstdarg>

#include <string>
#include <vector>
#include <memory>
#include <variant>
#include <functional>
#include <unordered_set>
#include <unordered_map>
#include <optional>
#include <system_error>

#include <time.h>

#ifdef NDEBUG
# define unreachable() __builtin_unreachable()
#else
# define unreachable() abort()
#endif

namespace clp {

/* Common definitions to allow for a more concise language than that of the C++
 * std library:
 *
 * - hmap<K,V>   : hash-map (std::unordered_map)
 * - hset<K>     : hash-set (std::unordered_set)
 * - str         : std::string
 * - vec         : std::vector
 * - sptr<T>     : std::shared_ptr, reference-counted heap-allocated T
 * - opt         : std::optional
 * - sumtype<...>: std::variant with a more intuitive name and '.match()' member
 *                 function to access its contents
 *
 * Imports with the same name as in std:
 * - move
 * - to_string
 */

template <typename K, typename V,
          typename Hash = std::hash<K>,
          typename Eq = std::equal_to<K>>
using hmap = std::unordered_map<K,V,Hash,Eq>;

template <typename K,
          typename Hash = std::hash<K>,
          typename Eq = std::equal_to<K>>
using hset = std::unordered_set<K,Hash,Eq>;

using str = std::string;

template <typename T>
using vec = std::vector<T>;

template <typename T>
using sptr = std::shared_ptr<T>;

using std::move;

template <typename T>
using opt = std::optional<T>;

using std::to_string;

using std::swap;

using strview = std::string_view;

// helper type for the visitor #4
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
// explicit deduction guide (not needed as of C++20)
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

template <typename... Ts>
struct sumtype : std::variant<Ts...> {

	using std::variant<Ts...>::variant;

	template <typename... As>
	auto match(As &&... o) const
	{
		return std::visit(overloaded { std::forward<As>(o)... },
		                  static_cast<const std::variant<Ts...> &>(*this));
	}

	template <typename R, typename... As>
	R match(As &&... o) const
	{
		return std::visit<R>(overloaded { std::forward<As>(o)... },
		                     static_cast<const std::variant<Ts...> &>(*this));
	}

	template <typename T>
	const T * get() const
	{
		return std::get_if<T>(this);
	}

	template <typename T>
	T * get()
	{
		return std::get_if<T>(this);
	}
};

struct timing : timespec {

	timing()
	{
		if (clock_gettime(CLOCK_MONOTONIC, this) == -1)
			throw std::error_code(errno, std::system_category());
	}

	friend timing & operator-=(timing &a, const timing &b)
	{
		a.tv_sec -= b.tv_sec;
		if ((a.tv_nsec -= b.tv_nsec) < 0) {
			a.tv_sec--;
			a.tv_nsec += 1e9;
		}
		return a;
	}

	friend timing operator-(timing a, const timing &b)
	{
		return a -= b;
	}

	operator double() const { return tv_sec + tv_nsec / 1e9; }
};

enum loglvl : int {
	QUIET,
	ERROR,
	WARN,
	INFO,
	NOTE,
	DEBUG,
};

struct Module {

	static hmap<strview,Module *> modules;

	const char *name;
	const char *color;
	loglvl lvl;

	explicit Module(const char *name, const char *color = "", loglvl lvl = WARN);

	bool logs(loglvl l) const { return l <= lvl; }
	friend bool logs(const Module &m, loglvl l) { return m.logs(l); }

	bool vlog(loglvl, const char *fmt, va_list) const;

#define BODY(level) { \
		va_list ap;                      \
		va_start(ap,fmt);                \
		bool r = m.vlog(level, fmt, ap); \
		va_end(ap);                      \
		return r;                        \
	}
	[[gnu::format(printf,3,4)]] friend bool log(const Module &m, loglvl level, const char *fmt, ...) BODY(level)
	[[gnu::format(printf,2,3)]] friend bool err(const Module &m, const char *fmt, ...) BODY(ERROR)
	[[gnu::format(printf,2,3)]] friend bool warn(const Module &m, const char *fmt, ...) BODY(WARN)
	[[gnu::format(printf,2,3)]] friend bool info(const Module &m, const char *fmt, ...) BODY(INFO)
	[[gnu::format(printf,2,3)]] friend bool note(const Module &m, const char *fmt, ...) BODY(NOTE)
	[[gnu::format(printf,2,3)]] friend bool dbg(const Module &m, const char *fmt, ...) BODY(DEBUG)
#undef BODY

	static bool log_color;
};

extern Module mod_clp, mod_drv, mod_smp, mod_red, mod_opt;

/* Upper bound on the number of steps the sampler takes when searching for the
 * next (non-)member of a domain. */
extern long probe_limit;

/* Sets the log-level of all modules or of single ones. 'arg' is either a
 * level ("none", "error", "warn", "info", "note", "debug") or a comma-separated
 * list of "module=level" pairs. A NULL 'arg' raises the level of each module by
 * one. Returns false if 'arg' names an unknown level or module. */
bool set_loglvl(const char *arg);

/* Returns 'base' if it is not in 'taken', otherwise the first of "base_",
 * "base_0", "base_1", ... that is not. */
str fresh(const hset<str> &taken, str base);

} // end namespace clp

extern "C" const char CLP_VERSION[];

namespace std {

template <typename... Ts>
struct variant_size<clp::sumtype<Ts...>>
: variant_size<variant<Ts...>> {};

template <size_t n, typename... Ts>
struct variant_alternative<n,clp::sumtype<Ts...>>
: variant_alternative<n,variant<Ts...>> {};

}
