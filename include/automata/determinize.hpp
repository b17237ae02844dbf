#pragma once

#include "automata/automaton.hpp"

namespace finite_automata {

// Subset construction. DFA labels are 0, 1, 2, ... in discovery order, the
// initial subset being 0. Empty subsets get no state, so the result may be
// partial; run complete() on it when a total DFA is needed.
//
// The number of reachable subsets is bounded by 2^n for an n-state NFA and
// can reach that bound.
DFA determinize(const NFA& nfa);

}  // namespace finite_automata
