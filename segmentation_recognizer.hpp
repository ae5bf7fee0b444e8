#ifndef SEGMENTATION_RECOGNIZER_HPP
#define SEGMENTATION_RECOGNIZER_HPP

#include "recognizer.hpp"
#include "captcha_prep.hpp"
#include "char_splitter.hpp"
#include "inference_session.hpp"
#include "onnx_session.hpp"

#include <memory>
#include <string>
#include <vector>

/**
 * Classical pipeline: binarize, split the captcha into characters and
 * classify each character with a compact classifier (an SVM exported to
 * ONNX). Cheap on memory and CPU; around 90% accurate on the captchas it
 * was trained for.
 */
class SegmentationRecognizer : public Recognizer {
public:
    explicit SegmentationRecognizer(const std::string& model_path = "svm_model.onnx",
                                    const SplitOptions& split = SplitOptions(),
                                    const SessionOptions& session_options = SessionOptions());
    SegmentationRecognizer(std::unique_ptr<InferenceSession> session, const SplitOptions& split = SplitOptions());

    std::string name() const override { return "segmentation"; }
    std::string recognize(const std::vector<unsigned char>& image_bytes) override;

    // normalized character images, left to right
    std::vector<cv::Mat> segments(const cv::Mat& binary) const;

private:
    std::string classify(const cv::Mat& normalized);

    std::unique_ptr<InferenceSession> session;
    CaptchaPrep prep;
    CharSplitter splitter;
};

#endif // SEGMENTATION_RECOGNIZER_HPP
