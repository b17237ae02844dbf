#pragma once

#include <cstddef>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "automata/automaton.hpp"
#include "utils/word.hpp"

namespace finite_automata::test_support {

// True iff fn() throws an AutomatonError of the given kind.
template <typename Fn>
bool throws_error(ErrorKind kind, Fn&& fn) {
    try {
        fn();
    } catch (const AutomatonError& ex) {
        return ex.kind() == kind;
    }
    return false;
}

// Every word over `alphabet` of length <= max_length, shortest first.
inline std::vector<Word> all_words(const Alphabet& alphabet, std::size_t max_length) {
    std::vector<Word> words = {Word{}};
    std::size_t layer_begin = 0;
    for (std::size_t length = 1; length <= max_length; ++length) {
        const std::size_t layer_end = words.size();
        for (std::size_t i = layer_begin; i < layer_end; ++i) {
            for (const auto& symbol : alphabet.symbols()) {
                Word longer = words[i];
                longer.push_back(symbol);
                words.push_back(std::move(longer));
            }
        }
        layer_begin = layer_end;
    }
    return words;
}

// Compares acceptance on all words up to max_length and prints the first
// word the two automata disagree on.
template <typename First, typename Second>
bool same_language(const First& first, const Second& second, std::size_t max_length) {
    for (const auto& word : all_words(*first.alphabet(), max_length)) {
        if (first.accepts(word) != second.accepts(word)) {
            std::cerr << "  languages differ on \"" << to_text(word) << "\"\n";
            return false;
        }
    }
    return true;
}

}  // namespace finite_automata::test_support
