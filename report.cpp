#include "report.hpp"

using json = nlohmann::json;

json result_entry(const std::string& file, const std::string& recognizer,
                  const std::string& captcha, long long latency_ms) {
    return {
        {"file", file},
        {"recognizer", recognizer},
        {"captcha", captcha},
        {"latency_ms", latency_ms}
    };
}

json error_entry(const std::string& file, const std::string& message) {
    return {{"file", file}, {"error", message}};
}

std::string dump_report(const json& results) {
    return results.dump(2, ' ', false, json::error_handler_t::replace);
}
