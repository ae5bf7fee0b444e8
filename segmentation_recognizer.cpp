#include "segmentation_recognizer.hpp"
#include "errors.hpp"

#include <cmath>

SegmentationRecognizer::SegmentationRecognizer(const std::string& model_path, const SplitOptions& split,
                                               const SessionOptions& session_options)
    : session(std::make_unique<OnnxSession>(model_path, session_options)), splitter(split) {}

SegmentationRecognizer::SegmentationRecognizer(std::unique_ptr<InferenceSession> session, const SplitOptions& split)
    : session(std::move(session)), splitter(split) {
    if (!this->session) {
        throw ModelLoadError("segmentation recognizer needs a session");
    }
}

std::vector<cv::Mat> SegmentationRecognizer::segments(const cv::Mat& binary) const {
    std::vector<cv::Mat> out;
    for (const cv::Mat& segment : splitter.h_split(binary)) {
        out.push_back(splitter.normalize(splitter.v_split(segment)));
    }
    return out;
}

std::string SegmentationRecognizer::classify(const cv::Mat& normalized) {
    // 0.0 / 255.0 feature values, row-major
    cv::Mat features;
    normalized.reshape(1, 1).convertTo(features, CV_32F);

    Tensor input;
    input.data.assign(features.ptr<float>(0), features.ptr<float>(0) + features.cols);
    const int64_t n = static_cast<int64_t>(input.data.size());

    std::vector<int64_t> declared = session->input_shape();
    if (declared.size() == 2) {
        input.shape = {1, n};
    } else {
        input.shape = {n};
    }
    if (!declared.empty() && declared.back() > 0 && declared.back() != n) {
        throw InferenceError("classifier expects " + std::to_string(declared.back())
                             + " features, segment has " + std::to_string(n));
    }

    std::vector<std::string> names = session->output_names();
    if (names.empty()) {
        throw InferenceError("classifier has no outputs");
    }

    std::vector<Tensor> outputs = session->run({names.front()}, {{session->input_name(), input}});
    if (outputs.empty()) {
        throw InferenceError("classifier returned no output");
    }

    const Tensor& label = outputs.front();
    if (!label.labels.empty()) {
        return label.labels.front();
    }
    if (!label.data.empty()) {
        // numeric class ids are printed as integers
        if (!std::isfinite(label.data.front())) {
            throw InferenceError("classifier returned a non-finite label");
        }
        return std::to_string(std::lround(label.data.front()));
    }
    throw InferenceError("classifier returned an empty label tensor");
}

std::string SegmentationRecognizer::recognize(const std::vector<unsigned char>& image_bytes) {
    cv::Mat binary = prep.prepare(image_bytes);

    std::string captcha;
    for (const cv::Mat& segment : segments(binary)) {
        captcha += classify(segment);
    }
    return captcha;
}
