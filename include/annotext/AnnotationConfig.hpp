#pragma once

#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace annotext {

// Thrown when analyzer settings cannot be turned into a filter configuration.
class InvalidConfiguration : public std::invalid_argument {
public:
    InvalidConfiguration(std::string analyzer, std::string option, const std::string& detail);

    const std::string& analyzer() const { return analyzer_; }
    const std::string& option() const { return option_; }

private:
    std::string analyzer_;
    std::string option_;
};

// Settings of one inline annotation filter. Immutable once built; every
// filter holds its own copy. Delimiters are single characters stored as
// their UTF-8 encoding, so "«" is a valid start delimiter.
struct AnnotationConfig {
    std::string startDelimiter = "[";
    std::string endDelimiter = "]";
    std::string synonymDelimiter = ";";
    std::string synonymPrefix = "[";
    std::string synonymSuffix = "]";
    std::string synonymType = "synonym";

    // Recognised keys: start, end, delimiter, prefix, suffix, token-type.
    // Unset keys keep their defaults; other keys are ignored.
    static AnnotationConfig fromSettings(const nlohmann::json& settings, const std::string& analyzerName);

    nlohmann::json toJson() const;
};

} // namespace annotext
