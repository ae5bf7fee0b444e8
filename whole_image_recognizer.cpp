#include "whole_image_recognizer.hpp"
#include "errors.hpp"

#include <algorithm>
#include <iterator>

namespace {
const int ALPHABET_SIZE = 26;
}

WholeImageRecognizer::WholeImageRecognizer(const std::string& model_path, const SessionOptions& session_options)
    : session(std::make_unique<OnnxSession>(model_path, session_options)) {}

WholeImageRecognizer::WholeImageRecognizer(std::unique_ptr<InferenceSession> session)
    : session(std::move(session)) {
    if (!this->session) {
        throw ModelLoadError("whole image recognizer needs a session");
    }
}

Tensor WholeImageRecognizer::to_input(const cv::Mat& binary) {
    cv::Mat levels;
    binary.convertTo(levels, CV_32F, 1.0 / 255.0);

    Tensor input;
    input.shape = {1, 1, levels.rows, levels.cols};
    input.data.reserve(levels.total());
    for (int y = 0; y < levels.rows; ++y) {
        const float* row = levels.ptr<float>(y);
        input.data.insert(input.data.end(), row, row + levels.cols);
    }
    return input;
}

int WholeImageRecognizer::argmax(const Tensor& tensor) {
    if (tensor.data.empty()) {
        throw InferenceError("character slot output has no scores");
    }

    // scores of the first (only) batch row
    size_t classes = tensor.data.size();
    if (tensor.shape.size() >= 2 && tensor.shape[0] > 0) {
        classes = tensor.data.size() / static_cast<size_t>(tensor.shape[0]);
    }

    auto first = tensor.data.begin();
    return static_cast<int>(std::distance(first, std::max_element(first, first + classes)));
}

std::string WholeImageRecognizer::tensor_to_captcha(const std::vector<Tensor>& tensors) {
    std::string captcha;
    for (const Tensor& tensor : tensors) {
        int index = argmax(tensor);
        if (index < ALPHABET_SIZE) {
            captcha += static_cast<char>('a' + index);
        }
    }
    return captcha;
}

std::string WholeImageRecognizer::recognize(const std::vector<unsigned char>& image_bytes) {
    cv::Mat binary = prep.prepare(image_bytes);

    std::vector<Tensor> outputs = session->run({}, {{session->input_name(), to_input(binary)}});
    return tensor_to_captcha(outputs);
}
