#pragma once

#include <utility>
#include <vector>

#include "automata/automaton.hpp"

namespace finite_automata {

// Minimal complete DFA for the language of `dfa`, which must be complete.
// Unreachable states are dropped, the rest are merged by Moore partition
// refinement. Output labels follow breadth-first order from the initial
// state (label 0) over the sorted alphabet, so two minimal DFAs for the same
// language compare equal.
DFA minimize(const DFA& dfa);

// All pairs (p, q), p < q, of Myhill-Nerode equivalent states of a complete
// DFA, unreachable states included. Sorted.
std::vector<std::pair<StateLabel, StateLabel>> equivalent_state_pairs(const DFA& dfa);

}  // namespace finite_automata
