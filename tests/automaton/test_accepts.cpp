#include <iostream>
#include <string>

#include "automata/automaton.hpp"
#include "../test_support.hpp"

using namespace finite_automata;
using test_support::throws_error;

int main() {
    int failures = 0;
    auto check = [&](bool ok, const std::string& what) {
        if (!ok) {
            std::cerr << "FAIL: " << what << "\n";
            ++failures;
        }
    };

    // Words over {0, 1} that are empty or end with '0'.
    DFA dfa(Alphabet::from_characters("01"));
    dfa.add_state(0, true, true);
    dfa.add_state(1);
    dfa.add_transition({"0"}, 0, 0);
    dfa.add_transition({"1"}, 0, 1);
    dfa.add_transition({"1"}, 1, 1);
    dfa.add_transition({"0"}, 1, 0);

    check(!dfa.accepts(to_word("01001")), "DFA rejects 01001");
    check(dfa.accepts(to_word("01000")), "DFA accepts 01000");
    check(dfa.accepts(to_word("")), "DFA accepts the empty word");
    check(throws_error(ErrorKind::SymbolNotInAlphabet, [&] { dfa.accepts(to_word("zizi")); }),
          "DFA reports symbols outside the alphabet");

    // Words over {a, b} ending with 'a'.
    NFA nfa(Alphabet::from_characters("ab"));
    nfa.add_state(0, true);
    nfa.add_state(1, false, true);
    nfa.add_state(2);
    nfa.add_transition({"a", "b"}, 0, 0);
    nfa.add_transition({"a"}, 0, 1);
    nfa.add_transition({"a", "b"}, 1, 2);
    nfa.add_transition({"a", "b"}, 2, 2);

    check(nfa.accepts(to_word("ababba")), "NFA accepts ababba");
    check(!nfa.accepts(to_word("ababbababb")), "NFA rejects ababbababb");
    check(!nfa.accepts(to_word("")), "NFA rejects the empty word");
    check(throws_error(ErrorKind::SymbolNotInAlphabet, [&] { nfa.accepts(to_word("test")); }),
          "NFA reports symbols outside the alphabet");
    // The alphabet is checked before the run, even when the run dies first.
    check(throws_error(ErrorKind::SymbolNotInAlphabet, [&] { dfa.accepts(to_word("1c")); }),
          "whole word is checked up front");

    // Partial DFA: a missing transition kills the run.
    DFA partial(Alphabet::from_characters("ab"));
    partial.add_state(0, true);
    partial.add_state(1, false, true);
    partial.add_transition({"a"}, 0, 1);
    check(partial.accepts(to_word("a")), "partial DFA accepts a");
    check(!partial.accepts(to_word("b")), "partial DFA dies on b");
    check(!partial.accepts(to_word("ab")), "partial DFA dies after a");

    // NFA whose run set empties out.
    NFA dying(Alphabet::from_characters("ab"));
    dying.add_state(0, true);
    dying.add_state(1, true, true);
    dying.add_transition({"a"}, 0, 1);
    check(dying.accepts(to_word("")), "one of two initial states is final");
    check(dying.accepts(to_word("a")), "reaches final state");
    check(!dying.accepts(to_word("ab")), "empty run set rejects");

    // A single state that is both initial and final, without a self-loop.
    DFA lone(Alphabet::from_characters("ab"));
    lone.add_state(0, true, true);
    check(lone.accepts(Word{}), "lone state accepts the empty word");
    check(!lone.accepts(to_word("a")) && !lone.accepts(to_word("ba")),
          "lone state rejects non-empty words");

    NFA lone_nfa(Alphabet::from_characters("ab"));
    lone_nfa.add_state(0, true, true);
    check(lone_nfa.accepts(Word{}) && !lone_nfa.accepts(to_word("b")),
          "lone NFA state behaves the same");

    DFA headless(Alphabet::from_characters("ab"));
    headless.add_state(0, false, true);
    check(throws_error(ErrorKind::NoInitialState, [&] { headless.accepts(Word{}); }),
          "running without an initial state fails");
    NFA headless_nfa(Alphabet::from_characters("ab"));
    check(throws_error(ErrorKind::NoInitialState, [&] { headless_nfa.accepts(to_word("a")); }),
          "running an empty NFA fails");

    // Token symbols.
    DFA tokens(Alphabet::create({"open", "close"}));
    tokens.add_state(0, true, true);
    tokens.add_state(1);
    tokens.add_transition({"open"}, 0, 1);
    tokens.add_transition({"close"}, 1, 0);
    check(tokens.accepts({"open", "close", "open", "close"}), "token word accepted");
    check(!tokens.accepts({"open"}), "unbalanced token word rejected");

    if (failures != 0) {
        return 1;
    }
    std::cout << "test_accepts: PASS\n";
    return 0;
}
