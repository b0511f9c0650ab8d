#include <gtest/gtest.h>

#include <string>

#include <fmt/format.h>

#include "../core/Exception.hpp"

using namespace bigtwo::core;

TEST(Errors, ThrowPicksTheTypeForTheCode)
{
    EXPECT_THROW(BIGTWO_THROW(error::Code::State, "bad state"), error::StateError);
    EXPECT_THROW(BIGTWO_THROW(error::Code::Rules, "bad rules"), error::RulesError);
    EXPECT_THROW(BIGTWO_THROW(error::Code::InvalidAction, "bad seat"), error::InvalidActionError);
    EXPECT_THROW(BIGTWO_THROW(error::Code::Network, "no port"), error::NetworkError);
    EXPECT_THROW(BIGTWO_ASSERT(1 + 1 == 3, "arithmetic"), error::AssertionError);
    EXPECT_NO_THROW(BIGTWO_ASSERT(1 + 1 == 2, "arithmetic"));
}

TEST(Errors, CarryCodeMessageAndThrowSite)
{
    try
    {
        BIGTWO_THROW(error::Code::State, "Unknown room 'x'");
        FAIL() << "nothing thrown";
    }
    catch (error::StateError const& e)
    {
        EXPECT_EQ(e.code(), error::Code::State);
        EXPECT_EQ(e.message(), "Unknown room 'x'");
        EXPECT_STREQ(e.what(), "Unknown room 'x'");
        EXPECT_NE(std::string{e.where().file_name()}.find("ErrorTests.cpp"), std::string::npos);
        EXPECT_NE(e.location().find("ErrorTests.cpp:"), std::string::npos);

        OmegaException<error::Code> const& base = e;
        EXPECT_EQ(fmt::format("{}", base).rfind("[code 1] Unknown room 'x' (", 0), 0u);
    }
}

TEST(Errors, CatchableAsStandardExceptions)
{
    EXPECT_THROW(BIGTWO_THROW(error::Code::Rules, "x"), std::exception);
}
