#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <type_traits>
#include <vector>

#include "automata/alphabet.hpp"
#include "automata/error.hpp"

namespace finite_automata {

enum class Determinism {
    Deterministic,
    Nondeterministic,
};

using StateLabel = std::size_t;
using LabelSet = std::set<StateLabel>;
using Word = std::vector<Symbol>;

struct State {
    StateLabel label{0};
    bool initial{false};
    bool final{false};
    // symbol -> targets. A DFA never stores more than one target per symbol.
    std::map<Symbol, LabelSet> transitions;

    bool operator==(const State& other) const {
        return label == other.label && initial == other.initial && final == other.final &&
               transitions == other.transitions;
    }
    bool operator!=(const State& other) const { return !(*this == other); }
};

template <Determinism D>
class Automaton;

template <Determinism D>
Automaton<D> complete(const Automaton<D>& automaton);

template <Determinism D>
class Automaton {
public:
    static constexpr bool kDeterministic = D == Determinism::Deterministic;

    explicit Automaton(AlphabetPtr alphabet);

    void add_state(StateLabel label, bool initial = false, bool final = false);

    // Adds from -> to for every symbol in `symbols`. Nothing is inserted
    // unless the whole call is valid.
    void add_transition(const std::vector<Symbol>& symbols, StateLabel from, StateLabel to);

    bool accepts(const Word& word) const;

    // Exactly one initial state and at most one target per (state, symbol).
    bool is_deterministic() const;
    // Every (state, symbol) pair has at least one target.
    bool is_complete() const;
    // True when this automaton was produced by complete().
    bool has_been_completed() const { return completed_; }

    bool has_state(StateLabel label) const { return states_.count(label) != 0; }
    const State& state(StateLabel label) const;

    // Targets of `label` on `symbol`; empty when no transition exists.
    const LabelSet& successors(StateLabel label, const Symbol& symbol) const;

    template <Determinism E = D, typename = std::enable_if_t<E == Determinism::Deterministic>>
    std::optional<StateLabel> successor(StateLabel label, const Symbol& symbol) const {
        const auto& targets = successors(label, symbol);
        if (targets.empty()) {
            return std::nullopt;
        }
        return *targets.begin();
    }

    const AlphabetPtr& alphabet() const { return alphabet_; }
    const std::map<StateLabel, State>& states() const { return states_; }
    const LabelSet& initial_states() const { return initial_states_; }
    const LabelSet& final_states() const { return final_states_; }
    std::size_t size() const { return states_.size(); }
    std::size_t transition_count() const;

    // Same alphabet contents, labels, flags and transitions.
    bool operator==(const Automaton& other) const;
    bool operator!=(const Automaton& other) const { return !(*this == other); }

private:
    friend Automaton<D> complete<D>(const Automaton<D>& automaton);

    void require_state(StateLabel label) const;
    void validate_word(const Word& word) const;

    AlphabetPtr alphabet_;
    std::map<StateLabel, State> states_;
    LabelSet initial_states_;
    LabelSet final_states_;
    bool completed_{false};
};

using DFA = Automaton<Determinism::Deterministic>;
using NFA = Automaton<Determinism::Nondeterministic>;

extern template class Automaton<Determinism::Deterministic>;
extern template class Automaton<Determinism::Nondeterministic>;

// Every DFA is an NFA: same states, labels and transitions.
NFA to_nfa(const DFA& dfa);

}  // namespace finite_automata
