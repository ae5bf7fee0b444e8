#include "onnx_session.hpp"
#include "errors.hpp"

#include <iostream>

Ort::Env& OnnxSession::env() {
    static Ort::Env instance(ORT_LOGGING_LEVEL_WARNING, "captcha-ocr");
    return instance;
}

OnnxSession::OnnxSession(const std::string& model_path, const SessionOptions& options) {
    try {
        Ort::SessionOptions sess_opt;
        sess_opt.SetIntraOpNumThreads(options.intra_op_threads);
        sess_opt.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
        if (options.use_cuda) {
            OrtCUDAProviderOptions cuda_opt;
            sess_opt.AppendExecutionProvider_CUDA(cuda_opt);
        }

        session = std::make_unique<Ort::Session>(env(), model_path.c_str(), sess_opt);

        Ort::AllocatorWithDefaultOptions allocator;
        for (size_t i = 0; i < session->GetInputCount(); ++i) {
            Ort::AllocatedStringPtr name = session->GetInputNameAllocated(i, allocator);
            input_names.emplace_back(name.get());
        }
        for (size_t i = 0; i < session->GetOutputCount(); ++i) {
            Ort::AllocatedStringPtr name = session->GetOutputNameAllocated(i, allocator);
            all_output_names.emplace_back(name.get());
        }

        if (input_names.empty()) {
            throw ModelLoadError("model has no inputs: " + model_path);
        }

        Ort::TypeInfo type_info = session->GetInputTypeInfo(0);
        if (type_info.GetONNXType() == ONNX_TYPE_TENSOR) {
            first_input_shape = type_info.GetTensorTypeAndShapeInfo().GetShape();
        }
    } catch (const Ort::Exception& e) {
        throw ModelLoadError("failed to load model " + model_path + ": " + e.what());
    }

    std::cerr << "[ONNX] loaded " << model_path << " (inputs: " << input_names.size()
              << ", outputs: " << all_output_names.size() << ")" << std::endl;
}

Tensor OnnxSession::to_tensor(Ort::Value& value, const std::string& name) {
    if (!value.IsTensor()) {
        throw InferenceError("output " + name + " is not a tensor");
    }

    Ort::TensorTypeAndShapeInfo info = value.GetTensorTypeAndShapeInfo();
    const size_t count = info.GetElementCount();

    Tensor out;
    out.shape = info.GetShape();

    switch (info.GetElementType()) {
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT: {
            const float* p = value.GetTensorData<float>();
            out.data.assign(p, p + count);
            break;
        }
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_DOUBLE: {
            const double* p = value.GetTensorData<double>();
            out.data.reserve(count);
            for (size_t i = 0; i < count; ++i) out.data.push_back(static_cast<float>(p[i]));
            break;
        }
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64: {
            const int64_t* p = value.GetTensorData<int64_t>();
            for (size_t i = 0; i < count; ++i) out.labels.push_back(std::to_string(p[i]));
            break;
        }
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32: {
            const int32_t* p = value.GetTensorData<int32_t>();
            for (size_t i = 0; i < count; ++i) out.labels.push_back(std::to_string(p[i]));
            break;
        }
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_STRING: {
            for (size_t i = 0; i < count; ++i) {
                std::string s(value.GetStringTensorElementLength(i), '\0');
                value.GetStringTensorElement(s.size(), i, &s[0]);
                out.labels.push_back(s);
            }
            break;
        }
        default:
            throw InferenceError("output " + name + " has unsupported element type "
                                 + std::to_string(static_cast<int>(info.GetElementType())));
    }
    return out;
}

std::vector<Tensor> OnnxSession::run(const std::vector<std::string>& output_names,
                                     const std::map<std::string, Tensor>& inputs) {
    const std::vector<std::string>& requested = output_names.empty() ? all_output_names : output_names;

    std::vector<const char*> in_names;
    std::vector<const char*> out_names;
    std::vector<Ort::Value> in_values;
    std::vector<Tensor> results;

    try {
        Ort::MemoryInfo mem = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
        for (const auto& kv : inputs) {
            const Tensor& t = kv.second;
            in_names.push_back(kv.first.c_str());
            // ORT does not write to input buffers
            in_values.push_back(Ort::Value::CreateTensor<float>(mem, const_cast<float*>(t.data.data()), t.data.size(),
                                                                t.shape.data(), t.shape.size()));
        }
        for (const std::string& name : requested) out_names.push_back(name.c_str());

        std::vector<Ort::Value> outputs = session->Run(Ort::RunOptions{nullptr},
                                                       in_names.data(), in_values.data(), in_values.size(),
                                                       out_names.data(), out_names.size());

        results.reserve(outputs.size());
        for (size_t i = 0; i < outputs.size(); ++i) {
            results.push_back(to_tensor(outputs[i], requested[i]));
        }
    } catch (const Ort::Exception& e) {
        throw InferenceError(std::string("inference failed: ") + e.what());
    }
    return results;
}
