#include "annotext/AnnotationDetector.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using annotext::AnnotationConfig;
using annotext::detectAnnotation;
using annotext::splitSynonyms;

static void expect(bool cond, const std::string& msg) {
    if (!cond) {
        std::cerr << "Test failed: " << msg << std::endl;
        std::exit(1);
    }
}

using Synonyms = std::vector<std::string>;

int main() {
    const AnnotationConfig defaults;

    // Single synonym
    auto m = detectAnnotation("Mozart[artist]", defaults);
    expect(m.found(), "Mozart[artist] should match");
    expect(m.prefix == "Mozart", "prefix should be Mozart");
    expect(*m.synonyms == Synonyms{"artist"}, "one synonym artist");

    // Several synonyms keep encounter order here; reversal is the filter's business
    m = detectAnnotation("Salzburg[city;Austria]", defaults);
    expect(m.prefix == "Salzburg", "prefix should be Salzburg");
    expect(*m.synonyms == (Synonyms{"city", "Austria"}), "city, Austria");

    // Empty payload still truncates
    m = detectAnnotation("word[]", defaults);
    expect(m.found(), "word[] counts as an annotation");
    expect(m.prefix == "word", "word[] truncates to word");
    expect(m.synonyms->empty(), "word[] has no synonyms");

    // Trailing separator
    m = detectAnnotation("x[a;b;]", defaults);
    expect(*m.synonyms == (Synonyms{"a", "b"}), "trailing separator adds nothing");

    // No annotation at all
    m = detectAnnotation("plain", defaults);
    expect(!m.found(), "plain has no annotation");
    expect(m.prefix == "plain", "plain text untouched");

    // Unmatched start delimiter
    m = detectAnnotation("a[x", defaults);
    expect(!m.found(), "a[x has no end delimiter");
    expect(m.prefix == "a[x", "a[x untouched");

    // End delimiter before the start delimiter does not count
    m = detectAnnotation("a]x[", defaults);
    expect(!m.found(), "a]x[ has no end after start");
    expect(m.prefix == "a]x[", "a]x[ untouched");

    // Only the first region is handled
    m = detectAnnotation("a[x]b[y]", defaults);
    expect(m.prefix == "a", "a[x]b[y] truncates at first region");
    expect(*m.synonyms == Synonyms{"x"}, "only x from a[x]b[y]");

    // Only the first start delimiter is considered
    m = detectAnnotation("a[b[c]", defaults);
    expect(m.prefix == "a", "a[b[c] prefix");
    expect(*m.synonyms == Synonyms{"b[c"}, "payload runs from first start to first end");

    // Annotation at the very beginning
    m = detectAnnotation("[only]", defaults);
    expect(m.found() && m.prefix.empty(), "[only] leaves an empty base");
    expect(*m.synonyms == Synonyms{"only"}, "[only] yields only");

    // Whitespace around segments is trimmed
    m = detectAnnotation("Salzburg[ city ;\tAustria ]", defaults);
    expect(*m.synonyms == (Synonyms{"city", "Austria"}), "segments are trimmed");

    // Interior empty segment is kept
    m = detectAnnotation("a[x;;y]", defaults);
    expect(*m.synonyms == (Synonyms{"x", "", "y"}), "interior empty segment kept");

    // Custom delimiters
    AnnotationConfig braces;
    braces.startDelimiter = "{";
    braces.endDelimiter = "}";
    braces.synonymDelimiter = ",";
    m = detectAnnotation("Paris{capital,France}", braces);
    expect(m.prefix == "Paris", "custom delimiters prefix");
    expect(*m.synonyms == (Synonyms{"capital", "France"}), "custom delimiters synonyms");
    m = detectAnnotation("Paris[capital]", braces);
    expect(!m.found(), "default brackets ignored under custom config");

    // Multi-byte delimiters
    const std::string open = "\xC2\xAB";     // U+00AB
    const std::string close = "\xC2\xBB";    // U+00BB
    const std::string dot = "\xC2\xB7";      // U+00B7
    AnnotationConfig guillemets;
    guillemets.startDelimiter = open;
    guillemets.endDelimiter = close;
    guillemets.synonymDelimiter = dot;
    m = detectAnnotation("Mozart" + open + "artist" + dot + " composer" + close, guillemets);
    expect(m.prefix == "Mozart", "multi-byte delimiters prefix");
    expect(*m.synonyms == (Synonyms{"artist", "composer"}), "multi-byte delimiters synonyms");
    m = detectAnnotation("x" + open + "a" + dot + close, guillemets);
    expect(*m.synonyms == Synonyms{"a"}, "multi-byte trailing separator adds nothing");
    m = detectAnnotation("x" + open + close, guillemets);
    expect(m.found() && m.prefix == "x" && m.synonyms->empty(), "multi-byte empty annotation");
    m = detectAnnotation("Wien" + open + "city", guillemets);
    expect(!m.found(), "multi-byte unmatched start");

    // splitSynonyms directly
    expect(splitSynonyms("", ";").empty(), "empty payload yields no segments");
    expect(splitSynonyms("  solo  ", ";") == Synonyms{"solo"}, "single segment trimmed");
    expect(splitSynonyms(";", ";") == Synonyms{""}, "lone separator yields one empty segment");
    expect(splitSynonyms("a;b", "") == Synonyms{"a;b"}, "empty separator keeps one segment");

    std::cout << "All tests passed." << std::endl;
    return 0;
}
