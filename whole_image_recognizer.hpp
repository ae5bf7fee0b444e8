#ifndef WHOLE_IMAGE_RECOGNIZER_HPP
#define WHOLE_IMAGE_RECOGNIZER_HPP

#include "recognizer.hpp"
#include "captcha_prep.hpp"
#include "inference_session.hpp"
#include "onnx_session.hpp"

#include <memory>
#include <string>
#include <vector>

/**
 * Convolutional pipeline: the binarized image goes straight into a
 * ResNet-20 exported to ONNX. The model has one output per character
 * slot; class indices past 'z' mean "no character". Heavier than
 * SegmentationRecognizer, around 98% accurate.
 */
class WholeImageRecognizer : public Recognizer {
public:
    explicit WholeImageRecognizer(const std::string& model_path = "nn_model.onnx",
                                  const SessionOptions& session_options = SessionOptions());
    explicit WholeImageRecognizer(std::unique_ptr<InferenceSession> session);

    std::string name() const override { return "whole_image"; }
    std::string recognize(const std::vector<unsigned char>& image_bytes) override;

    // (1, 1, H, W) with level values 0.0 / 1.0
    static Tensor to_input(const cv::Mat& binary);

    static std::string tensor_to_captcha(const std::vector<Tensor>& tensors);

private:
    static int argmax(const Tensor& tensor);

    std::unique_ptr<InferenceSession> session;
    CaptchaPrep prep;
};

#endif // WHOLE_IMAGE_RECOGNIZER_HPP
