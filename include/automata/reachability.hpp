#pragma once

#include "automata/automaton.hpp"

namespace finite_automata {

// Copy of `automaton` restricted to the states reachable from its initial
// states. Labels are kept.
template <Determinism D>
Automaton<D> reachable_part(const Automaton<D>& automaton);

extern template DFA reachable_part<Determinism::Deterministic>(const DFA& automaton);
extern template NFA reachable_part<Determinism::Nondeterministic>(const NFA& automaton);

}  // namespace finite_automata
