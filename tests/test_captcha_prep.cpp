/**
 * @file test_captcha_prep.cpp
 * @brief Unit tests for image decoding and the binarization table
 */

#include "test_helpers.h"
#include "../captcha_prep.hpp"
#include "../errors.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

static_assert(binary_level(155) == 0, "155 is below the threshold");
static_assert(binary_level(156) == 1, "156 is the threshold");

class CaptchaPrepTest : public ::testing::Test
{
protected:
    CaptchaPrep prep;

    static cv::Mat gradient()
    {
        cv::Mat image(1, 256, CV_8UC1);
        for (int i = 0; i < 256; ++i)
        {
            image.at<unsigned char>(0, i) = static_cast<unsigned char>(i);
        }
        return image;
    }
};

TEST_F(CaptchaPrepTest, TableIsPiecewiseConstant)
{
    const auto& table = prep.table();
    for (int i = 0; i < 156; ++i)
    {
        EXPECT_EQ(table[i], 0) << "entry " << i;
    }
    for (int i = 156; i < 256; ++i)
    {
        EXPECT_EQ(table[i], 1) << "entry " << i;
    }
}

TEST_F(CaptchaPrepTest, AllZeroImageIsLevelZero)
{
    cv::Mat black(20, 40, CV_8UC1, cv::Scalar(0));
    cv::Mat binary = prep.binarize(black);

    EXPECT_EQ(cv::countNonZero(binary), 0);
}

TEST_F(CaptchaPrepTest, AllWhiteImageIsLevelOne)
{
    cv::Mat white(20, 40, CV_8UC1, cv::Scalar(255));
    cv::Mat binary = prep.binarize(white);

    cv::Mat level_one;
    cv::compare(binary, cv::Scalar(255), level_one, cv::CMP_EQ);
    EXPECT_EQ(cv::countNonZero(level_one), 20 * 40);
}

TEST_F(CaptchaPrepTest, ThresholdBoundary)
{
    cv::Mat binary = prep.binarize(gradient());

    EXPECT_EQ(binary.at<unsigned char>(0, 155), 0);
    EXPECT_EQ(binary.at<unsigned char>(0, 156), 255);
    EXPECT_EQ(cv::countNonZero(binary), 100);
}

TEST_F(CaptchaPrepTest, BinarizationIsIdempotent)
{
    cv::Mat once = prep.binarize(gradient());
    cv::Mat twice = prep.binarize(once);

    EXPECT_EQ(cv::countNonZero(once != twice), 0);
}

TEST_F(CaptchaPrepTest, PrepareDecodesAndThresholds)
{
    cv::Mat binary = prep.prepare(encode_png(gradient()));

    ASSERT_EQ(binary.rows, 1);
    ASSERT_EQ(binary.cols, 256);
    EXPECT_EQ(binary.at<unsigned char>(0, 0), 0);
    EXPECT_EQ(binary.at<unsigned char>(0, 155), 0);
    EXPECT_EQ(binary.at<unsigned char>(0, 156), 255);
    EXPECT_EQ(binary.at<unsigned char>(0, 255), 255);
}

TEST_F(CaptchaPrepTest, DecodeConvertsColorToSingleChannel)
{
    cv::Mat color(10, 12, CV_8UC3, cv::Scalar(255, 255, 255));
    cv::Mat gray = prep.decode(encode_png(color));

    EXPECT_EQ(gray.type(), CV_8UC1);
    EXPECT_EQ(gray.rows, 10);
    EXPECT_EQ(gray.cols, 12);
}

TEST_F(CaptchaPrepTest, CorruptBytesThrowDecodeError)
{
    std::vector<unsigned char> garbage = {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e'};

    EXPECT_THROW(prep.decode(garbage), DecodeError);
    EXPECT_THROW(prep.prepare(garbage), DecodeError);
}

TEST_F(CaptchaPrepTest, EmptyBytesThrowDecodeError)
{
    EXPECT_THROW(prep.decode({}), DecodeError);
}

TEST_F(CaptchaPrepTest, BinarizeRejectsMultiChannelInput)
{
    cv::Mat color(4, 4, CV_8UC3, cv::Scalar(0, 0, 0));

    EXPECT_THROW(prep.binarize(color), DecodeError);
}
