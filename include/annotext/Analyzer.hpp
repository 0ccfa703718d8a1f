//Analyzer.hpp
#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "annotext/AnnotationConfig.hpp"
#include "annotext/Token.hpp"
#include "annotext/TokenStream.hpp"

namespace annotext {

// Whitespace tokenizer followed by the inline annotation filter.
class Analyzer {
public:
    Analyzer(std::string name, AnnotationConfig config, bool keepAnnotationsWhole = true);

    // Fresh stream per call; analyzers are shared read-only.
    std::unique_ptr<TokenStream> tokenStream(const std::string& text) const;

    std::vector<Token> analyze(const std::string& text) const;

    const std::string& name() const { return name_; }
    const AnnotationConfig& config() const { return config_; }
    bool keepAnnotationsWhole() const { return keepAnnotationsWhole_; }

private:
    std::string name_;
    AnnotationConfig config_;
    bool keepAnnotationsWhole_;
};

// Named analyzers declared under "analysis.analyzer" in a settings document:
//
//     {"analysis": {"analyzer": {
//         "tags": {"type": "inline_annotation", "start": "{", "end": "}"}
//     }}}
//
// A "default" analyzer with default settings is always present unless the
// settings define one.
class AnalyzerRegistry {
public:
    static constexpr const char* kAnalyzerType = "inline_annotation";
    static constexpr const char* kDefaultAnalyzer = "default";

    AnalyzerRegistry();

    // Throws InvalidConfiguration on bad analyzer definitions.
    static AnalyzerRegistry fromSettings(const nlohmann::json& settings);

    void add(Analyzer analyzer);

    bool contains(const std::string& name) const;
    // Throws std::out_of_range for unknown names.
    const Analyzer& get(const std::string& name) const;
    std::vector<std::string> names() const;
    std::size_t size() const { return analyzers_.size(); }

private:
    std::map<std::string, Analyzer> analyzers_;
};

// Renders tokens the way an _analyze response lists them.
nlohmann::json tokensToJson(const std::vector<Token>& tokens);

} // namespace annotext
