#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "annotext/AnnotationConfig.hpp"

namespace annotext {

struct AnnotationMatch {
    // Token text before the start delimiter, or the whole text when nothing matched.
    std::string prefix;
    // Set when a start/end pair was found; may be empty ("word[]").
    std::optional<std::vector<std::string>> synonyms;

    bool found() const { return synonyms.has_value(); }
};

// Looks for the first start delimiter and the first end delimiter after it.
// A later start delimiter is never tried, so "a[x" or "a[x]b[y]" only ever
// see the first region. Never throws.
AnnotationMatch detectAnnotation(std::string_view text, const AnnotationConfig& config);

// Splits an annotation payload on the configured delimiter. Segments are
// trimmed; a trailing delimiter does not produce an empty last segment.
// An empty delimiter leaves the payload in one segment.
std::vector<std::string> splitSynonyms(std::string_view payload, std::string_view delimiter);

} // namespace annotext
