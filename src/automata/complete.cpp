#include "automata/complete.hpp"

#include <limits>
#include <utility>
#include <vector>

namespace finite_automata {
namespace {

// Largest label + 1, or the smallest unused label if that would overflow.
template <Determinism D>
StateLabel fresh_label(const Automaton<D>& automaton) {
    const auto& states = automaton.states();
    if (states.empty()) {
        return 0;
    }
    const StateLabel largest = states.rbegin()->first;
    if (largest < std::numeric_limits<StateLabel>::max()) {
        return largest + 1;
    }
    StateLabel candidate = 0;
    while (states.count(candidate)) {
        ++candidate;
    }
    return candidate;
}

}  // namespace

template <Determinism D>
Automaton<D> complete(const Automaton<D>& automaton) {
    const auto& alphabet = automaton.alphabet()->symbols();

    std::vector<std::pair<StateLabel, Symbol>> missing;
    for (const auto& [label, state] : automaton.states()) {
        for (const auto& symbol : alphabet) {
            auto it = state.transitions.find(symbol);
            if (it == state.transitions.end() || it->second.empty()) {
                missing.emplace_back(label, symbol);
            }
        }
    }

    Automaton<D> completed = automaton;
    if (!missing.empty()) {
        // The sink is non-accepting and loops on every symbol, so once a run
        // falls into it the word is rejected.
        const StateLabel sink = fresh_label(automaton);
        completed.add_state(sink);
        completed.add_transition(alphabet, sink, sink);

        for (const auto& [label, symbol] : missing) {
            completed.add_transition({symbol}, label, sink);
        }
    }
    completed.completed_ = true;
    return completed;
}

template DFA complete<Determinism::Deterministic>(const DFA& automaton);
template NFA complete<Determinism::Nondeterministic>(const NFA& automaton);

}  // namespace finite_automata
