#pragma once

#include "automata/automaton.hpp"

namespace finite_automata {

// Returns a copy of `automaton` in which every (state, symbol) pair has a
// target. Missing transitions are redirected to one new non-final sink state
// that loops on every symbol. An automaton that is already total is returned
// unchanged, so complete(complete(a)) == complete(a).
template <Determinism D>
Automaton<D> complete(const Automaton<D>& automaton);

extern template DFA complete<Determinism::Deterministic>(const DFA& automaton);
extern template NFA complete<Determinism::Nondeterministic>(const NFA& automaton);

}  // namespace finite_automata
