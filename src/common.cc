/* SPDX-License-Identifier: Apache-2.0
 *
 * Copyright 2022 Franz Brausse <franz.brausse@manchester.ac.uk>
 * Copyright 2022 The University of Manchester
 */

#include <clp/common.hh>

#include <unistd.h>

#define CSI		"\x1b["
#define SGR_DFL		CSI "m"
#define SGR_BOLD	CSI "1m"
#define COL_FG		"3"
#define COL_BG		"4"
#define COL_FG_B	"9"
#define COL_BG_B	"10"
#define COL_BLACK	"0"
#define COL_RED		"1"
#define COL_GREEN	"2"
#define COL_YELLOW	"3"
#define COL_BLUE	"4"
#define COL_MAGENTA	"5"
#define COL_CYAN	"6"
#define COL_WHITE	"7"

using namespace clp;

hmap<strview,Module *> Module::modules;

bool Module::log_color = isatty(STDERR_FILENO);

Module::Module(const char *name, const char *color, loglvl lvl)
: name(name)
, color(color)
, lvl(lvl)
{
	auto [it,ins] = modules.emplace(name, this);
	assert(ins);
}

bool Module::vlog(loglvl l, const char *fmt, va_list ap) const
{
	if (!logs(l))
		return false;
	const char *lvl = nullptr;
	const char *col = "";
	switch (l) {
	case QUIET: break;
	case ERROR: lvl = "error"; col = CSI COL_FG_B COL_RED "m"; break;
	case WARN : lvl = "warn" ; col = CSI COL_FG_B COL_YELLOW "m"; break;
	case INFO : lvl = "info" ; col = CSI COL_FG_B COL_WHITE "m"; break;
	case NOTE : lvl = "note" ; break;
	case DEBUG: lvl = "debug"; col = CSI COL_FG   COL_GREEN "m"; break;
	}
	fprintf(stderr, "%s[%-4s]%s %s%-5s%s: ",
	        log_color ? color : "", name, log_color ? SGR_DFL : "",
	        log_color ? col : "", lvl, log_color ? SGR_DFL : "");
	vfprintf(stderr, fmt, ap);
	return true;
}

Module clp::mod_clp { "clp" ,                                       };
Module clp::mod_drv { "drv" ,          CSI COL_FG   COL_GREEN   "m" };
Module clp::mod_smp { "smp" ,          CSI COL_FG   COL_YELLOW  "m" };
Module clp::mod_red { "red" ,          CSI COL_FG   COL_CYAN    "m" };
Module clp::mod_opt { "opt" ,          CSI COL_FG_B COL_MAGENTA "m" };

long clp::probe_limit = 1L << 16;

#define STR(x)	#x
#define XSTR(x)	STR(x)
extern "C" {
const char CLP_VERSION[] = XSTR(CLP_VERSION_MAJOR) "."
                           XSTR(CLP_VERSION_MINOR) "."
                           XSTR(CLP_VERSION_PATCH);
}

bool clp::set_loglvl(const char *arg)
{
	if (!arg) {
		for (const auto &[n,m] : Module::modules)
			if (m->lvl < DEBUG)
				m->lvl = (loglvl)((int)m->lvl + 1);
		return true;
	}
	hmap<strview,loglvl> values = {
		{ "none" , QUIET },
		{ "error", ERROR },
		{ "warn" , WARN },
		{ "info" , INFO },
		{ "note" , NOTE },
		{ "debug", DEBUG },
	};
	str buf = arg;
	for (char *s = NULL, *t = strtok_r(buf.data(), ",", &s); t;
	     t = strtok_r(NULL, ",", &s)) {
		char *ss, *mod = strtok_r(t, "=", &ss);
		if (!mod)
			continue;
		char *lvl = strtok_r(NULL, "=", &ss);
		if (!lvl)
			swap(mod, lvl);
		if (mod)
			dbg(mod_clp,"setting log-level of '%s' to '%s'\n",
			            mod, lvl);
		else
			dbg(mod_clp,"setting log-level to '%s'\n", lvl);
		auto jt = values.find(lvl);
		if (jt == end(values)) {
			err(mod_clp,"unknown log level '%s'\n", lvl);
			return false;
		}
		if (mod) {
			auto it = Module::modules.find(mod);
			if (it == end(Module::modules)) {
				err(mod_clp,"unknown module '%s'\n", mod);
				return false;
			}
			it->second->lvl = jt->second;
		} else
			for (const auto &[n,m] : Module::modules)
				m->lvl = jt->second;
	}
	return true;
}

str clp::fresh(const hset<str> &taken, str base)
{
	if (!taken.contains(base))
		return base;
	base += "_";
	if (!taken.contains(base))
		return base;
	for (size_t i=0;; i++) {
		str n = base + to_string(i);
		if (!taken.contains(n))
			return n;
	}
}
