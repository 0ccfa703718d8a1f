#include "annotext/AnnotationConfig.hpp"

#include <cstddef>
#include <optional>
#include <utility>

using json = nlohmann::json;

namespace annotext {

InvalidConfiguration::InvalidConfiguration(std::string analyzer, std::string option, const std::string& detail)
    : std::invalid_argument("Analyzer " + analyzer + " has invalid settings: " + detail),
      analyzer_(std::move(analyzer)),
      option_(std::move(option)) {
}

namespace {

std::optional<std::string> stringOption(const json& settings, const char* key, const std::string& analyzer) {
    auto it = settings.find(key);
    if (it == settings.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
        throw InvalidConfiguration(analyzer, key, std::string(key) + " must be a string");
    }
    return it->get<std::string>();
}

// True if s is exactly one well-formed UTF-8 encoded code point.
bool isSingleCharacter(const std::string& s) {
    if (s.empty()) return false;
    auto lead = static_cast<unsigned char>(s[0]);
    std::size_t length;
    if (lead < 0x80) length = 1;
    else if ((lead & 0xE0) == 0xC0) length = 2;
    else if ((lead & 0xF0) == 0xE0) length = 3;
    else if ((lead & 0xF8) == 0xF0) length = 4;
    else return false;

    if (s.size() != length) return false;
    for (std::size_t i = 1; i < length; ++i) {
        if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) return false;
    }
    return true;
}

std::optional<std::string> charOption(const json& settings, const char* key, const char* what, const std::string& analyzer) {
    auto value = stringOption(settings, key, analyzer);
    if (!value) return std::nullopt;
    if (!isSingleCharacter(*value)) {
        throw InvalidConfiguration(analyzer, key, std::string(what) + " is limited to be single character");
    }
    return value;
}

} // namespace

AnnotationConfig AnnotationConfig::fromSettings(const json& settings, const std::string& analyzerName) {
    AnnotationConfig config;
    if (settings.is_null()) return config;
    if (!settings.is_object()) {
        throw InvalidConfiguration(analyzerName, "", "settings must be an object");
    }

    if (auto c = charOption(settings, "start", "start delimiter", analyzerName)) config.startDelimiter = *c;
    if (auto c = charOption(settings, "end", "end delimiter", analyzerName)) config.endDelimiter = *c;
    if (auto c = charOption(settings, "delimiter", "delimiter", analyzerName)) config.synonymDelimiter = *c;
    if (auto s = stringOption(settings, "prefix", analyzerName)) config.synonymPrefix = *s;
    if (auto s = stringOption(settings, "suffix", analyzerName)) config.synonymSuffix = *s;
    if (auto s = stringOption(settings, "token-type", analyzerName)) config.synonymType = *s;

    return config;
}

json AnnotationConfig::toJson() const {
    return json{
        {"start", startDelimiter},
        {"end", endDelimiter},
        {"delimiter", synonymDelimiter},
        {"prefix", synonymPrefix},
        {"suffix", synonymSuffix},
        {"token-type", synonymType}
    };
}

} // namespace annotext
