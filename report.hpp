#ifndef REPORT_HPP
#define REPORT_HPP

#include <nlohmann/json.hpp>
#include <string>

// One entry of the CLI's JSON result array.
nlohmann::json result_entry(const std::string& file, const std::string& recognizer,
                            const std::string& captcha, long long latency_ms);
nlohmann::json error_entry(const std::string& file, const std::string& message);

// File names and messages may carry arbitrary bytes; invalid UTF-8 is
// written as U+FFFD instead of throwing.
std::string dump_report(const nlohmann::json& results);

#endif // REPORT_HPP
