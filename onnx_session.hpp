#ifndef ONNX_SESSION_HPP
#define ONNX_SESSION_HPP

#include "inference_session.hpp"

#include <onnxruntime_cxx_api.h>
#include <memory>
#include <string>
#include <vector>

struct SessionOptions {
    int intra_op_threads = 1;
    bool use_cuda = false;
};

class OnnxSession : public InferenceSession {
    public:
        // throws ModelLoadError
        explicit OnnxSession(const std::string& model_path, const SessionOptions& options = SessionOptions());

        std::string input_name() const override { return input_names.front(); }
        std::vector<int64_t> input_shape() const override { return first_input_shape; }
        std::vector<std::string> output_names() const override { return all_output_names; }

        std::vector<Tensor> run(const std::vector<std::string>& output_names,
                                const std::map<std::string, Tensor>& inputs) override;

    private:
        static Ort::Env& env();
        static Tensor to_tensor(Ort::Value& value, const std::string& name);

        std::unique_ptr<Ort::Session> session;
        std::vector<std::string> input_names;
        std::vector<std::string> all_output_names;
        std::vector<int64_t> first_input_shape;
};

#endif // ONNX_SESSION_HPP
