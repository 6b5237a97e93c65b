// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/environment.hpp"
#include "sigroute/errors.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

namespace sigroute::test {

TEST(EnvironmentTest, ExpandsBothPlaceholderForms) {
    Environment env({{"ELASTIC_APM_TOKEN", "secret"}, {"REGION", "eu"}});
    EXPECT_EQ(env.expand("Bearer ${env:ELASTIC_APM_TOKEN}"), "Bearer secret");
    EXPECT_EQ(env.expand("api.${REGION}.example.com"), "api.eu.example.com");
    EXPECT_EQ(env.expand("${REGION}-${REGION}"), "eu-eu");
    EXPECT_EQ(env.expand("no placeholders"), "no placeholders");
}

TEST(EnvironmentTest, MissingVariablesExpandToEmptyAndAreCounted) {
    Environment env;
    std::map<std::string, int> missing;
    EXPECT_EQ(env.expand("key=${env:HONEYCOMB_API_KEY};${HONEYCOMB_API_KEY}", &missing), "key=;");
    ASSERT_EQ(missing.size(), 1u);
    EXPECT_EQ(missing["HONEYCOMB_API_KEY"], 2);

    EXPECT_EQ(env.expand("${UNSET}"), "");
}

TEST(EnvironmentTest, DollarEscapesAndStrayDollars) {
    Environment env(std::map<std::string, std::string>{{"A", "x"}});
    EXPECT_EQ(env.expand("$$A"), "$A");
    EXPECT_EQ(env.expand("cost: 5$"), "cost: 5$");
    EXPECT_EQ(env.expand("$A"), "$A");
}

TEST(EnvironmentTest, MalformedPlaceholdersAreConfigErrors) {
    Environment env;
    EXPECT_THROW(env.expand("${UNTERMINATED"), ConfigError);
    EXPECT_THROW(env.expand("${}"), ConfigError);
    EXPECT_THROW(env.expand("${env:}"), ConfigError);
}

TEST(EnvironmentTest, SnapshotOfProcessEnvironment) {
    ::setenv("SIGROUTE_TEST_VARIABLE", "value=with=equals", 1);
    Environment env = Environment::from_process();
    ::unsetenv("SIGROUTE_TEST_VARIABLE");

    ASSERT_TRUE(env.get("SIGROUTE_TEST_VARIABLE").has_value());
    EXPECT_EQ(*env.get("SIGROUTE_TEST_VARIABLE"), "value=with=equals");
    EXPECT_FALSE(env.get("SIGROUTE_TEST_UNSET_VARIABLE").has_value());
}

}  // namespace sigroute::test
