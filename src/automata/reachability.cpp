#include "automata/reachability.hpp"

#include <queue>

namespace finite_automata {

template <Determinism D>
Automaton<D> reachable_part(const Automaton<D>& automaton) {
    // Breadth-first search from every initial state.
    LabelSet marked(automaton.initial_states());
    std::queue<StateLabel> pending;
    for (auto label : marked) {
        pending.push(label);
    }

    while (!pending.empty()) {
        const StateLabel current = pending.front();
        pending.pop();

        for (const auto& [symbol, targets] : automaton.state(current).transitions) {
            for (auto target : targets) {
                if (marked.insert(target).second) {
                    pending.push(target);
                }
            }
        }
    }

    Automaton<D> reachable(automaton.alphabet());
    for (auto label : marked) {
        const auto& state = automaton.state(label);
        reachable.add_state(label, state.initial, state.final);
    }
    // Every target of a marked state is marked as well.
    for (auto label : marked) {
        for (const auto& [symbol, targets] : automaton.state(label).transitions) {
            for (auto target : targets) {
                reachable.add_transition({symbol}, label, target);
            }
        }
    }
    return reachable;
}

template DFA reachable_part<Determinism::Deterministic>(const DFA& automaton);
template NFA reachable_part<Determinism::Nondeterministic>(const NFA& automaton);

}  // namespace finite_automata
