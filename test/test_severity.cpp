#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

#include <applog/severity.hpp>

using applog::severity;

TEST(severity, ordering) {
    EXPECT_LT(severity::debug, severity::info);
    EXPECT_LT(severity::info, severity::warning);
    EXPECT_LT(severity::warning, severity::error);
    EXPECT_LT(severity::error, severity::critical);

    EXPECT_GE(severity::info, severity::info);
    EXPECT_GE(severity::error, severity::info);
    EXPECT_FALSE(severity::debug>=severity::info);
}

TEST(severity, level_name) {
    EXPECT_EQ("DEBUG", applog::level_name(severity::debug));
    EXPECT_EQ("INFO", applog::level_name(severity::info));
    EXPECT_EQ("WARNING", applog::level_name(severity::warning));
    EXPECT_EQ("ERROR", applog::level_name(severity::error));
    EXPECT_EQ("CRITICAL", applog::level_name(severity::critical));
    EXPECT_EQ("Level 25", applog::level_name(static_cast<severity>(25)));

    std::stringstream ss;
    ss << severity::error;
    EXPECT_EQ("ERROR", ss.str());
}

TEST(severity, parse) {
    EXPECT_EQ(severity::info, applog::parse_severity("INFO"));
    EXPECT_EQ(severity::info, applog::parse_severity("info"));
    EXPECT_EQ(severity::error, applog::parse_severity("Error"));
    EXPECT_EQ(severity::warning, applog::parse_severity("warn"));
    EXPECT_EQ(severity::error, applog::parse_severity("40"));
    EXPECT_EQ(static_cast<severity>(25), applog::parse_severity("25"));

    EXPECT_THROW(applog::parse_severity(""), std::invalid_argument);
    EXPECT_THROW(applog::parse_severity("loud"), std::invalid_argument);
    EXPECT_THROW(applog::parse_severity("20x"), std::invalid_argument);
    EXPECT_THROW(applog::parse_severity("4294967316"), std::invalid_argument);
    EXPECT_THROW(applog::parse_severity("-4294967296"), std::invalid_argument);
    EXPECT_THROW(applog::parse_severity("99999999999999999999999"), std::invalid_argument);
}
