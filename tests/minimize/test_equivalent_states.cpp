#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "automata/automaton.hpp"
#include "automata/minimize.hpp"
#include "../test_support.hpp"

using namespace finite_automata;
using test_support::throws_error;

int main() {
    DFA dfa(Alphabet::from_characters("01"));
    dfa.add_state(0, true, true);
    dfa.add_state(1);
    dfa.add_state(2);
    dfa.add_state(3);
    dfa.add_transition({"0"}, 0, 0);
    dfa.add_transition({"1"}, 0, 1);
    dfa.add_transition({"1"}, 1, 1);
    dfa.add_transition({"0"}, 1, 0);
    dfa.add_transition({"0"}, 2, 0);
    dfa.add_transition({"1"}, 2, 1);
    dfa.add_transition({"0"}, 3, 0);
    dfa.add_transition({"1"}, 3, 1);

    const std::vector<std::pair<StateLabel, StateLabel>> expected = {{1, 2}, {1, 3}, {2, 3}};
    const auto pairs = equivalent_state_pairs(dfa);
    if (pairs != expected) {
        std::cerr << "Unexpected equivalent pairs:";
        for (const auto& [p, q] : pairs) {
            std::cerr << " (" << p << ", " << q << ")";
        }
        std::cerr << "\n";
        return 1;
    }

    if (minimize(dfa).size() != 2) {
        std::cerr << "Expected 2 states after minimization, got " << minimize(dfa).size() << "\n";
        return 1;
    }

    DFA partial(Alphabet::from_characters("01"));
    partial.add_state(0, true);
    partial.add_transition({"0"}, 0, 0);
    if (!throws_error(ErrorKind::IncompleteAutomaton, [&] { equivalent_state_pairs(partial); })) {
        std::cerr << "Expected IncompleteAutomaton for a partial DFA\n";
        return 1;
    }

    std::cout << "test_equivalent_states: PASS\n";
    return 0;
}
