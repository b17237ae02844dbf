#pragma once

#include <string>

#include "automata/automaton.hpp"

namespace finite_automata {

// Splits `text` into one-character symbols: "aba" -> {"a", "b", "a"}.
Word to_word(const std::string& text);

// Inverse of to_word for display; multi-character symbols are joined as is.
std::string to_text(const Word& word);

}  // namespace finite_automata
