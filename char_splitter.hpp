#ifndef CHAR_SPLITTER_HPP
#define CHAR_SPLITTER_HPP

#include <opencv2/core.hpp>
#include <vector>

struct SplitOptions {
    int min_char_width = 2;   // narrower ink runs are noise
    int max_char_width = 0;   // wider runs are cut into equal pieces, 0 disables
    int out_width = 16;
    int out_height = 20;
};

// Splits a binary captcha (levels stored as 0/255) into per-character images.
class CharSplitter {
public:
    explicit CharSplitter(const SplitOptions& options = SplitOptions());

    // ordered left to right
    std::vector<cv::Mat> h_split(const cv::Mat& binary) const;

    cv::Mat v_split(const cv::Mat& segment) const;

    // out_width x out_height, ink 0 and background 255
    cv::Mat normalize(const cv::Mat& segment) const;

    const SplitOptions& options() const { return opts; }

private:
    static unsigned char ink_value(const cv::Mat& binary);
    static cv::Mat ink_mask(const cv::Mat& binary, unsigned char ink);
    std::vector<cv::Range> column_runs(const cv::Mat& mask) const;

    SplitOptions opts;
};

#endif // CHAR_SPLITTER_HPP
