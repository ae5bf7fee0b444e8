#include "char_splitter.hpp"
#include "errors.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>

CharSplitter::CharSplitter(const SplitOptions& options) : opts(options) {
    if (opts.out_width <= 0 || opts.out_height <= 0) {
        throw ConfigError("split output size must be positive");
    }
    if (opts.max_char_width < 0) {
        throw ConfigError("max_char_width must not be negative");
    }
    opts.min_char_width = std::max(1, opts.min_char_width);
}

unsigned char CharSplitter::ink_value(const cv::Mat& binary) {
    // ink is whichever level covers fewer pixels
    const int high = cv::countNonZero(binary);
    const int low = static_cast<int>(binary.total()) - high;
    return high < low ? 255 : 0;
}

cv::Mat CharSplitter::ink_mask(const cv::Mat& binary, unsigned char ink) {
    cv::Mat mask;
    cv::compare(binary, cv::Scalar(ink), mask, cv::CMP_EQ);
    return mask;
}

std::vector<cv::Range> CharSplitter::column_runs(const cv::Mat& mask) const {
    const int w = mask.cols;

    // vertical projection: ink pixels per column
    std::vector<int> col_sum(w, 0);
    for (int x = 0; x < w; ++x) {
        col_sum[x] = cv::countNonZero(mask.col(x));
    }

    std::vector<cv::Range> runs;
    int x = 0;
    while (x < w) {
        if (col_sum[x] == 0) {
            ++x;
            continue;
        }
        int x0 = x;
        while (x < w && col_sum[x] > 0) ++x;
        int width = x - x0;

        if (width < opts.min_char_width) continue;

        if (opts.max_char_width > 0 && width > opts.max_char_width) {
            // glued characters: cut into equal slices
            int pieces = (width + opts.max_char_width - 1) / opts.max_char_width;
            for (int i = 0; i < pieces; ++i) {
                runs.emplace_back(x0 + i * width / pieces, x0 + (i + 1) * width / pieces);
            }
        } else {
            runs.emplace_back(x0, x);
        }
    }
    return runs;
}

std::vector<cv::Mat> CharSplitter::h_split(const cv::Mat& binary) const {
    CV_Assert(binary.type() == CV_8UC1);

    std::vector<cv::Mat> segments;
    if (binary.empty()) return segments;

    cv::Mat mask = ink_mask(binary, ink_value(binary));

    // canonical polarity for the segments: ink 0, background 255
    cv::Mat canonical;
    cv::bitwise_not(mask, canonical);

    for (const cv::Range& r : column_runs(mask)) {
        segments.push_back(canonical.colRange(r).clone());
    }
    return segments;
}

cv::Mat CharSplitter::v_split(const cv::Mat& segment) const {
    CV_Assert(segment.type() == CV_8UC1);

    int top = -1;
    int bottom = -1;
    for (int y = 0; y < segment.rows; ++y) {
        if (cv::countNonZero(segment.row(y)) < segment.cols) {
            if (top < 0) top = y;
            bottom = y;
        }
    }

    if (top < 0) return segment.clone();
    return segment.rowRange(top, bottom + 1).clone();
}

cv::Mat CharSplitter::normalize(const cv::Mat& segment) const {
    CV_Assert(!segment.empty() && segment.type() == CV_8UC1);

    cv::Mat resized;
    cv::resize(segment, resized, cv::Size(opts.out_width, opts.out_height), 0, 0, cv::INTER_NEAREST);

    // keep it strictly two-level
    cv::Mat out;
    cv::threshold(resized, out, 127, 255, cv::THRESH_BINARY);
    return out;
}
