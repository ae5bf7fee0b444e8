#include "recognizer.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "segmentation_recognizer.hpp"
#include "whole_image_recognizer.hpp"

std::unique_ptr<Recognizer> make_recognizer(const CaptchaConfig& config) {
    if (config.recognizer == "segmentation") {
        return std::make_unique<SegmentationRecognizer>(config.segmentation_model, config.split, config.session);
    }
    if (config.recognizer == "whole_image") {
        return std::make_unique<WholeImageRecognizer>(config.whole_image_model, config.session);
    }
    throw ConfigError("unknown recognizer \"" + config.recognizer + "\" (expected segmentation or whole_image)");
}
