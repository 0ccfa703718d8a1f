#pragma once

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace annotext {

// One unit of an analyzed stream. Anything besides text, type and
// positionIncrement is carried through filters untouched.
struct Token {
    std::string text;
    int positionIncrement = 1;
    std::string type = "word";
    std::size_t startOffset = 0;
    std::size_t endOffset = 0;
    nlohmann::json attributes = nlohmann::json::object();
};

} // namespace annotext
