//Analyzer.cpp
#include "annotext/Analyzer.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>
#include "annotext/InlineAnnotationFilter.hpp"
#include "annotext/Tokenizer.hpp"

using json = nlohmann::json;

namespace annotext {

// -----------------------------------------------------------
// Analyzer
// -----------------------------------------------------------
Analyzer::Analyzer(std::string name, AnnotationConfig config, bool keepAnnotationsWhole)
    : name_(std::move(name)), config_(std::move(config)), keepAnnotationsWhole_(keepAnnotationsWhole) {
}

std::unique_ptr<TokenStream> Analyzer::tokenStream(const std::string& text) const {
    TokenizerOptions options;
    if (keepAnnotationsWhole_) {
        options.groupOpen = config_.startDelimiter;
        options.groupClose = config_.endDelimiter;
    }
    auto tokenizer = std::make_unique<WhitespaceTokenizer>(text, options);
    return std::make_unique<InlineAnnotationFilter>(std::move(tokenizer), config_);
}

std::vector<Token> Analyzer::analyze(const std::string& text) const {
    std::vector<Token> tokens;
    auto stream = tokenStream(text);
    while (auto token = stream->next()) {
        tokens.push_back(std::move(*token));
    }
    return tokens;
}

// -----------------------------------------------------------
// AnalyzerRegistry
// -----------------------------------------------------------
AnalyzerRegistry::AnalyzerRegistry() {
    add(Analyzer(kDefaultAnalyzer, AnnotationConfig{}));
}

AnalyzerRegistry AnalyzerRegistry::fromSettings(const json& settings) {
    AnalyzerRegistry registry;
    if (settings.is_null()) return registry;

    auto analysis = settings.find("analysis");
    if (analysis == settings.end()) return registry;
    if (!analysis->is_object()) {
        throw InvalidConfiguration("analysis", "analysis", "analysis must be an object");
    }
    auto analyzers = analysis->find("analyzer");
    if (analyzers == analysis->end()) return registry;
    if (!analyzers->is_object()) {
        throw InvalidConfiguration("analysis", "analyzer", "analysis.analyzer must be an object");
    }

    for (const auto& it : analyzers->items()) {
        const std::string& name = it.key();
        const json& def = it.value();
        if (!def.is_object()) {
            throw InvalidConfiguration(name, "", "definition must be an object");
        }

        std::string type = kAnalyzerType;
        if (def.contains("type")) {
            if (!def["type"].is_string()) {
                throw InvalidConfiguration(name, "type", "type must be a string");
            }
            type = def["type"].get<std::string>();
        }
        if (type != kAnalyzerType) {
            throw InvalidConfiguration(name, "type", "unsupported analyzer type " + type);
        }

        bool keepWhole = true;
        if (def.contains("keep_whole")) {
            if (!def["keep_whole"].is_boolean()) {
                throw InvalidConfiguration(name, "keep_whole", "keep_whole must be a boolean");
            }
            keepWhole = def["keep_whole"].get<bool>();
        }

        registry.add(Analyzer(name, AnnotationConfig::fromSettings(def, name), keepWhole));
        std::cerr << "AnalyzerRegistry: registered analyzer " << name << "\n";
    }

    return registry;
}

void AnalyzerRegistry::add(Analyzer analyzer) {
    auto name = analyzer.name();
    analyzers_.insert_or_assign(std::move(name), std::move(analyzer));
}

bool AnalyzerRegistry::contains(const std::string& name) const {
    return analyzers_.count(name) > 0;
}

const Analyzer& AnalyzerRegistry::get(const std::string& name) const {
    auto it = analyzers_.find(name);
    if (it == analyzers_.end()) {
        throw std::out_of_range("analyzer not found: " + name);
    }
    return it->second;
}

std::vector<std::string> AnalyzerRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(analyzers_.size());
    for (const auto& kv : analyzers_) {
        out.push_back(kv.first);
    }
    return out;
}

// -----------------------------------------------------------
// JSON rendering
// -----------------------------------------------------------
json tokensToJson(const std::vector<Token>& tokens) {
    json out = json::array();
    long position = -1;
    for (const auto& token : tokens) {
        position += token.positionIncrement;
        // a leading co-located token still sits at position 0
        if (position < 0) position = 0;
        json entry = {
            {"token", token.text},
            {"start_offset", token.startOffset},
            {"end_offset", token.endOffset},
            {"type", token.type},
            {"position", position}
        };
        if (token.attributes.is_object() && !token.attributes.empty()) {
            entry["attributes"] = token.attributes;
        }
        out.push_back(std::move(entry));
    }
    return out;
}

} // namespace annotext
