#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace finite_automata {

using Symbol = std::string;

class Alphabet;
using AlphabetPtr = std::shared_ptr<const Alphabet>;

// Immutable, non-empty set of symbols. Automata hold it through AlphabetPtr
// so one instance is shared by an automaton and everything derived from it.
class Alphabet {
public:
    static AlphabetPtr create(const std::vector<Symbol>& symbols);

    // One symbol per character of `characters`, e.g. "ab" -> {a, b}.
    static AlphabetPtr from_characters(const std::string& characters);

    bool contains(const Symbol& symbol) const;

    // Sorted, without duplicates. This is the iteration order of every
    // algorithm working over the alphabet.
    const std::vector<Symbol>& symbols() const { return symbols_; }
    std::size_t size() const { return symbols_.size(); }

    bool operator==(const Alphabet& other) const { return symbols_ == other.symbols_; }
    bool operator!=(const Alphabet& other) const { return !(*this == other); }

private:
    explicit Alphabet(std::vector<Symbol> symbols);

    std::vector<Symbol> symbols_;
};

}  // namespace finite_automata
