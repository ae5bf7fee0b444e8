#include "config.hpp"
#include "errors.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace {

void read_string(const json& obj, const char* key, std::string& out) {
    if (!obj.contains(key)) return;
    if (!obj[key].is_string()) {
        throw ConfigError(std::string("\"") + key + "\" is not a string");
    }
    out = obj[key].get<std::string>();
}

void read_int(const json& obj, const char* key, int& out) {
    if (!obj.contains(key)) return;
    if (!obj[key].is_number_integer()) {
        throw ConfigError(std::string("\"") + key + "\" is not an integer");
    }
    const int64_t value = obj[key].get<int64_t>();
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw ConfigError(std::string("\"") + key + "\" is out of range");
    }
    out = static_cast<int>(value);
}

void read_bool(const json& obj, const char* key, bool& out) {
    if (!obj.contains(key)) return;
    if (!obj[key].is_boolean()) {
        throw ConfigError(std::string("\"") + key + "\" is not a boolean");
    }
    out = obj[key].get<bool>();
}

} // namespace

CaptchaConfig parse_config(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("config is not valid JSON: ") + e.what());
    }
    if (!root.is_object()) {
        throw ConfigError("config root is not an object");
    }

    CaptchaConfig config;
    read_string(root, "recognizer", config.recognizer);
    read_string(root, "segmentation_model", config.segmentation_model);
    read_string(root, "whole_image_model", config.whole_image_model);
    read_int(root, "intra_op_threads", config.session.intra_op_threads);
    read_bool(root, "use_cuda", config.session.use_cuda);

    if (root.contains("split")) {
        const json& split = root["split"];
        if (!split.is_object()) {
            throw ConfigError("\"split\" is not an object");
        }
        read_int(split, "min_char_width", config.split.min_char_width);
        read_int(split, "max_char_width", config.split.max_char_width);
        read_int(split, "out_width", config.split.out_width);
        read_int(split, "out_height", config.split.out_height);
    }

    if (config.session.intra_op_threads < 0) {
        throw ConfigError("\"intra_op_threads\" must not be negative");
    }
    return config;
}

CaptchaConfig load_config(const std::string& path) {
    std::ifstream ifs(path, std::ios::in | std::ios::binary);
    if (!ifs.is_open()) {
        throw ConfigError("failed to open config file: " + path);
    }

    std::ostringstream oss;
    oss << ifs.rdbuf();
    return parse_config(oss.str());
}

int parse_thread_count(const std::string& text) {
    size_t used = 0;
    int threads = -1;
    try {
        threads = std::stoi(text, &used);
    } catch (const std::logic_error&) {
        throw ConfigError("invalid thread count: " + text);
    }
    if (used != text.size() || threads < 0) {
        throw ConfigError("invalid thread count: " + text);
    }
    return threads;
}
