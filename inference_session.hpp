#ifndef INFERENCE_SESSION_HPP
#define INFERENCE_SESSION_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>

struct Tensor {
    std::vector<int64_t> shape;
    std::vector<float> data;           // float tensors
    std::vector<std::string> labels;   // integer and string label tensors
};

// A loaded model. Read-only after construction.
class InferenceSession {
public:
    virtual ~InferenceSession() = default;

    virtual std::string input_name() const = 0;

    // declared shape of the first input, -1 for dynamic dimensions
    virtual std::vector<int64_t> input_shape() const = 0;

    virtual std::vector<std::string> output_names() const = 0;

    // An empty output_names list requests every output of the model.
    virtual std::vector<Tensor> run(const std::vector<std::string>& output_names,
                                    const std::map<std::string, Tensor>& inputs) = 0;
};

#endif // INFERENCE_SESSION_HPP
