#include "utils/word.hpp"

namespace finite_automata {

Word to_word(const std::string& text) {
    Word word;
    word.reserve(text.size());
    for (char ch : text) {
        word.emplace_back(1, ch);
    }
    return word;
}

std::string to_text(const Word& word) {
    std::string text;
    for (const auto& symbol : word) {
        text += symbol;
    }
    return text;
}

}  // namespace finite_automata
