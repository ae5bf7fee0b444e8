/**
 * @file test_helpers.h
 * @brief Synthetic captcha images and a scripted inference session for tests
 */

#pragma once

#include "../inference_session.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <map>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Encode an 8-bit image as PNG bytes (lossless, so pixel values survive decoding)
 */
inline std::vector<unsigned char> encode_png(const cv::Mat& image)
{
    std::vector<unsigned char> bytes;
    cv::imencode(".png", image, bytes);
    return bytes;
}

/**
 * @brief Draw solid "characters" as column blocks spanning rows [top, bottom)
 * @param blocks Column ranges [start, end) of each block
 */
inline cv::Mat make_blocks_image(int width, int height, const std::vector<std::pair<int, int>>& blocks,
                                 unsigned char ink = 0, unsigned char background = 255,
                                 int top = 4, int bottom = 16)
{
    cv::Mat image(height, width, CV_8UC1, cv::Scalar(background));
    for (const auto& b : blocks)
    {
        image(cv::Range(top, bottom), cv::Range(b.first, b.second)).setTo(cv::Scalar(ink));
    }
    return image;
}

/**
 * @brief One-row score tensor of shape (1, classes) with its maximum at hot
 */
inline Tensor one_hot(int classes, int hot)
{
    Tensor t;
    t.shape = {1, classes};
    t.data.assign(classes, 0.01f);
    t.data[hot] = 0.9f;
    return t;
}

/**
 * @brief InferenceSession that records its calls and replays scripted outputs
 *
 * When a responder is set it computes the outputs from the input tensor,
 * otherwise responses are returned in order, wrapping around.
 */
class FakeSession : public InferenceSession
{
public:
    std::string input = "input";
    std::vector<int64_t> shape;
    std::vector<std::string> outputs{"output_label", "output_probability"};
    std::vector<std::vector<Tensor>> responses;
    std::vector<Tensor> (*responder)(const Tensor&) = nullptr;

    int calls = 0;
    std::vector<Tensor> seen_inputs;
    std::vector<std::vector<std::string>> seen_output_names;

    std::string input_name() const override { return input; }
    std::vector<int64_t> input_shape() const override { return shape; }
    std::vector<std::string> output_names() const override { return outputs; }

    std::vector<Tensor> run(const std::vector<std::string>& output_names,
                            const std::map<std::string, Tensor>& inputs) override
    {
        const Tensor& in = inputs.at(input);
        seen_inputs.push_back(in);
        seen_output_names.push_back(output_names);
        ++calls;

        if (responder)
        {
            return responder(in);
        }
        return responses[(calls - 1) % responses.size()];
    }
};

inline Tensor label_tensor(const std::string& label)
{
    Tensor t;
    t.shape = {1};
    t.labels.push_back(label);
    return t;
}
