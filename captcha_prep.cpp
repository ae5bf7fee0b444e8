#include "captcha_prep.hpp"
#include "errors.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

CaptchaPrep::CaptchaPrep() : lut(1, 256, CV_8U) {
    for (int i = 0; i < 256; ++i) {
        levels[i] = binary_level(i);
        lut.at<unsigned char>(0, i) = levels[i] ? 255 : 0;
    }
}

cv::Mat CaptchaPrep::decode(const std::vector<unsigned char>& image_bytes) const {
    if (image_bytes.empty()) {
        throw DecodeError("empty image buffer");
    }

    cv::Mat gray;
    try {
        gray = cv::imdecode(image_bytes, cv::IMREAD_GRAYSCALE);
    } catch (const cv::Exception& e) {
        throw DecodeError(std::string("cannot decode image: ") + e.what());
    }
    if (gray.empty()) {
        throw DecodeError("cannot decode image (" + std::to_string(image_bytes.size()) + " bytes)");
    }
    return gray;
}

cv::Mat CaptchaPrep::binarize(const cv::Mat& gray) const {
    if (gray.empty() || gray.type() != CV_8UC1) {
        throw DecodeError("binarize expects a non-empty 8-bit single channel image");
    }

    cv::Mat binary;
    cv::LUT(gray, lut, binary);
    return binary;
}

cv::Mat CaptchaPrep::prepare(const std::vector<unsigned char>& image_bytes) const {
    return binarize(decode(image_bytes));
}
