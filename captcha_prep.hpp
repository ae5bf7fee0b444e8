#ifndef CAPTCHA_PREP_HPP
#define CAPTCHA_PREP_HPP

#include <opencv2/core.hpp>
#include <array>
#include <string>
#include <vector>

// Grayscale intensities at or above this value are binary level 1.
constexpr int BINARY_THRESHOLD = 156;

constexpr unsigned char binary_level(int intensity) {
    return intensity >= BINARY_THRESHOLD ? 1 : 0;
}

class CaptchaPrep {
public:
    CaptchaPrep();

    // bytes -> single channel 8-bit image, throws DecodeError
    cv::Mat decode(const std::vector<unsigned char>& image_bytes) const;

    // Level 0 pixels are stored as 0 and level 1 pixels as 255, so
    // binarizing an already binary image leaves it unchanged.
    cv::Mat binarize(const cv::Mat& gray) const;

    cv::Mat prepare(const std::vector<unsigned char>& image_bytes) const;

    const std::array<unsigned char, 256>& table() const { return levels; }

private:
    std::array<unsigned char, 256> levels;
    cv::Mat lut;
};

#endif // CAPTCHA_PREP_HPP
