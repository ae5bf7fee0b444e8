/**
 * @file test_report.cpp
 * @brief Unit tests for the CLI's JSON result report
 */

#include "../report.hpp"

#include <gtest/gtest.h>

#include <string>

class ReportTest : public ::testing::Test
{
};

TEST_F(ReportTest, ResultEntryCarriesAllFields)
{
    nlohmann::json entry = result_entry("a.png", "whole_image", "abcd", 12);

    EXPECT_EQ(entry["file"], "a.png");
    EXPECT_EQ(entry["recognizer"], "whole_image");
    EXPECT_EQ(entry["captcha"], "abcd");
    EXPECT_EQ(entry["latency_ms"], 12);
}

TEST_F(ReportTest, DumpsValidUtf8Unchanged)
{
    nlohmann::json results = nlohmann::json::array();
    results.push_back(result_entry("caf\xc3\xa9.png", "segmentation", "xyz", 3));

    std::string text = dump_report(results);

    EXPECT_NE(text.find("caf\xc3\xa9.png"), std::string::npos);
    EXPECT_EQ(nlohmann::json::parse(text), results);
}

TEST_F(ReportTest, InvalidUtf8FileNameIsReplacedNotThrown)
{
    const std::string latin1 = "caf\xe9.png";
    nlohmann::json results = nlohmann::json::array();
    results.push_back(error_entry(latin1, "cannot open " + latin1));
    results.push_back(result_entry("ok.png", "whole_image", "abc", 1));

    std::string text;
    ASSERT_NO_THROW(text = dump_report(results));

    // every entry survives and the output parses back
    nlohmann::json parsed = nlohmann::json::parse(text);
    ASSERT_EQ(parsed.size(), 2u);
    EXPECT_EQ(parsed[0]["file"], "caf\xef\xbf\xbd.png");
    EXPECT_EQ(parsed[0]["error"], "cannot open caf\xef\xbf\xbd.png");
    EXPECT_EQ(parsed[1]["captcha"], "abc");
}
