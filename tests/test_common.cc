/* SPDX-License-Identifier: Apache-2.0
 *
 * Copyright 2022 Franz Brausse <franz.brausse@manchester.ac.uk>
 * Copyright 2022 The University of Manchester
 */

#include <clp/common.hh>

#include <gtest/gtest.h>

#include <algorithm>

using namespace clp;

namespace {
struct LogLevels : ::testing::Test {

	hmap<strview,loglvl> saved;

	void SetUp() override
	{
		for (const auto &[n,m] : Module::modules)
			saved[n] = m->lvl;
	}

	void TearDown() override
	{
		for (const auto &[n,m] : Module::modules)
			m->lvl = saved[n];
	}
};
}

TEST_F(LogLevels, Global) {
	EXPECT_TRUE(set_loglvl("info"));
	EXPECT_EQ(mod_drv.lvl, INFO);
	EXPECT_EQ(mod_smp.lvl, INFO);
	EXPECT_TRUE(logs(mod_red, INFO));
	EXPECT_FALSE(logs(mod_red, NOTE));
}

TEST_F(LogLevels, PerModule) {
	EXPECT_TRUE(set_loglvl("none"));
	EXPECT_TRUE(set_loglvl("red=debug,opt=note"));
	EXPECT_EQ(mod_red.lvl, DEBUG);
	EXPECT_EQ(mod_opt.lvl, NOTE);
	EXPECT_EQ(mod_drv.lvl, QUIET);
}

TEST_F(LogLevels, Raise) {
	EXPECT_TRUE(set_loglvl("warn"));
	EXPECT_TRUE(set_loglvl(nullptr));
	EXPECT_EQ(mod_clp.lvl, INFO);
	EXPECT_TRUE(set_loglvl("debug"));
	EXPECT_TRUE(set_loglvl(nullptr));
	EXPECT_EQ(mod_clp.lvl, DEBUG);
}

TEST_F(LogLevels, Unknown) {
	EXPECT_TRUE(set_loglvl("none"));
	EXPECT_FALSE(set_loglvl("verbose"));
	EXPECT_FALSE(set_loglvl("nomodule=debug"));
}

TEST(Fresh, Names) {
	EXPECT_EQ(fresh({}, "objective"), "objective");
	EXPECT_EQ(fresh({ "objective" }, "objective"), "objective_");
	EXPECT_EQ(fresh({ "objective", "objective_" }, "objective"), "objective_0");
	EXPECT_EQ(fresh({ "objective", "objective_", "objective_0" }, "objective"),
	          "objective_1");
}

TEST(Version, Format) {
	str v = CLP_VERSION;
	EXPECT_EQ(std::count(v.begin(), v.end(), '.'), 2);
}
