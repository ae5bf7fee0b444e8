#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "char_splitter.hpp"
#include "onnx_session.hpp"

#include <string>

struct CaptchaConfig {
    std::string recognizer = "whole_image";   // "segmentation" or "whole_image"
    std::string segmentation_model = "svm_model.onnx";
    std::string whole_image_model = "nn_model.onnx";
    SessionOptions session;
    SplitOptions split;
};

// Missing keys keep their defaults. Throws ConfigError.
CaptchaConfig parse_config(const std::string& json_text);
CaptchaConfig load_config(const std::string& path);

// non-negative decimal, throws ConfigError
int parse_thread_count(const std::string& text);

#endif // CONFIG_HPP
