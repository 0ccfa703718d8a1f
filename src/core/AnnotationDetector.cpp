#include "annotext/AnnotationDetector.hpp"

#include <cstddef>

namespace annotext {

namespace {

// Strips code points <= 0x20 from both ends.
std::string trim(std::string_view s) {
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && static_cast<unsigned char>(s[begin]) <= ' ') ++begin;
    while (end > begin && static_cast<unsigned char>(s[end - 1]) <= ' ') --end;
    return std::string(s.substr(begin, end - begin));
}

} // namespace

std::vector<std::string> splitSynonyms(std::string_view payload, std::string_view delimiter) {
    std::vector<std::string> segments;
    std::size_t begin = 0;
    std::size_t end;
    while (!delimiter.empty() && (end = payload.find(delimiter, begin)) != std::string_view::npos) {
        segments.push_back(trim(payload.substr(begin, end - begin)));
        begin = end + delimiter.size();
    }
    // "city;Austria;" leaves begin == size, so no empty tail is added
    if (begin < payload.size()) {
        segments.push_back(trim(payload.substr(begin)));
    }
    return segments;
}

AnnotationMatch detectAnnotation(std::string_view text, const AnnotationConfig& config) {
    AnnotationMatch match;
    const std::string& open = config.startDelimiter;
    const std::string& close = config.endDelimiter;

    auto start = open.empty() ? std::string_view::npos : text.find(open);
    if (start == std::string_view::npos || close.empty()) {
        match.prefix = std::string(text);
        return match;
    }
    const std::size_t payloadBegin = start + open.size();
    auto end = text.find(close, payloadBegin);
    if (end == std::string_view::npos) {
        match.prefix = std::string(text);
        return match;
    }

    match.prefix = std::string(text.substr(0, start));
    match.synonyms = splitSynonyms(text.substr(payloadBegin, end - payloadBegin), config.synonymDelimiter);
    return match;
}

} // namespace annotext
