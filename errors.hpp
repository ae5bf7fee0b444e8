#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

class CaptchaError : public std::runtime_error {
    public:
        explicit CaptchaError(const std::string& what) : std::runtime_error(what) {}
};

// input bytes are not a decodable image
class DecodeError : public CaptchaError {
    public:
        explicit DecodeError(const std::string& what) : CaptchaError(what) {}
};

// model file missing, corrupt or rejected by the runtime
class ModelLoadError : public CaptchaError {
    public:
        explicit ModelLoadError(const std::string& what) : CaptchaError(what) {}
};

// tensor shape/type mismatch or runtime failure while running a model
class InferenceError : public CaptchaError {
    public:
        explicit InferenceError(const std::string& what) : CaptchaError(what) {}
};

class ConfigError : public CaptchaError {
    public:
        explicit ConfigError(const std::string& what) : CaptchaError(what) {}
};

#endif // ERRORS_HPP
