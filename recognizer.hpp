#ifndef RECOGNIZER_HPP
#define RECOGNIZER_HPP

#include <memory>
#include <string>
#include <vector>

struct CaptchaConfig;

class Recognizer {
public:
    virtual ~Recognizer() = default;

    virtual std::string name() const = 0;

    // Encoded image bytes in, lowercase captcha text out.
    // Throws DecodeError or InferenceError.
    virtual std::string recognize(const std::vector<unsigned char>& image_bytes) = 0;
};

// Builds the pipeline named by config.recognizer and loads its model.
// Throws ConfigError for an unknown pipeline, ModelLoadError otherwise.
std::unique_ptr<Recognizer> make_recognizer(const CaptchaConfig& config);

#endif // RECOGNIZER_HPP
