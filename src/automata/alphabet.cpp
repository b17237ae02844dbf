#include "automata/alphabet.hpp"

#include <algorithm>
#include <utility>

#include "automata/error.hpp"

namespace finite_automata {

Alphabet::Alphabet(std::vector<Symbol> symbols) : symbols_(std::move(symbols)) {}

AlphabetPtr Alphabet::create(const std::vector<Symbol>& symbols) {
    std::vector<Symbol> sorted(symbols.begin(), symbols.end());
    std::sort(sorted.begin(), sorted.end());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());

    if (sorted.empty()) {
        throw AutomatonError(ErrorKind::EmptyAlphabet, "An alphabet needs at least one symbol.");
    }

    // The constructor is private, so make_shared cannot reach it.
    return AlphabetPtr(new Alphabet(std::move(sorted)));
}

AlphabetPtr Alphabet::from_characters(const std::string& characters) {
    std::vector<Symbol> symbols;
    symbols.reserve(characters.size());
    for (char ch : characters) {
        symbols.emplace_back(1, ch);
    }
    return create(symbols);
}

bool Alphabet::contains(const Symbol& symbol) const {
    return std::binary_search(symbols_.begin(), symbols_.end(), symbol);
}

}  // namespace finite_automata
