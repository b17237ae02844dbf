#include "automata/automaton.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace finite_automata {
namespace {

const LabelSet kNoTargets{};

std::string label_text(StateLabel label) {
    return std::to_string(label);
}

}  // namespace

template <Determinism D>
Automaton<D>::Automaton(AlphabetPtr alphabet) : alphabet_(std::move(alphabet)) {
    if (!alphabet_) {
        throw AutomatonError(ErrorKind::EmptyAlphabet, "Automaton requires an alphabet.");
    }
}

template <Determinism D>
void Automaton<D>::add_state(StateLabel label, bool initial, bool final) {
    if (states_.count(label)) {
        throw AutomatonError(ErrorKind::DuplicateLabel,
                             "A state with label " + label_text(label) + " already exists.");
    }
    if constexpr (kDeterministic) {
        if (initial && !initial_states_.empty()) {
            throw AutomatonError(ErrorKind::MultipleInitialStates,
                                 "DFAs must have a single initial state; state " +
                                     label_text(*initial_states_.begin()) +
                                     " is already initial.");
        }
    }

    State state;
    state.label = label;
    state.initial = initial;
    state.final = final;
    states_.emplace(label, std::move(state));

    if (initial) {
        initial_states_.insert(label);
    }
    if (final) {
        final_states_.insert(label);
    }
}

template <Determinism D>
void Automaton<D>::add_transition(const std::vector<Symbol>& symbols,
                                  StateLabel from,
                                  StateLabel to) {
    require_state(from);
    require_state(to);

    for (const auto& symbol : symbols) {
        if (!alphabet_->contains(symbol)) {
            throw AutomatonError(ErrorKind::InvalidSymbol,
                                 "Symbol '" + symbol + "' is not in the automaton's alphabet.");
        }
    }

    auto& transitions = states_.at(from).transitions;

    if constexpr (kDeterministic) {
        for (const auto& symbol : symbols) {
            auto it = transitions.find(symbol);
            if (it != transitions.end() && !it->second.empty() && !it->second.count(to)) {
                std::ostringstream message;
                message << "Transition " << from << " -" << symbol << "-> "
                        << *it->second.begin() << " already exists; DFAs cannot add "
                        << from << " -" << symbol << "-> " << to << ".";
                throw AutomatonError(ErrorKind::NondeterministicTransition, message.str());
            }
        }
    }

    for (const auto& symbol : symbols) {
        transitions[symbol].insert(to);
    }
}

template <Determinism D>
bool Automaton<D>::accepts(const Word& word) const {
    validate_word(word);

    if (initial_states_.empty()) {
        throw AutomatonError(ErrorKind::NoInitialState,
                             "Cannot run an automaton without an initial state.");
    }

    if constexpr (kDeterministic) {
        StateLabel current = *initial_states_.begin();
        for (const auto& symbol : word) {
            const auto& transitions = states_.at(current).transitions;
            auto it = transitions.find(symbol);
            if (it == transitions.end() || it->second.empty()) {
                if (completed_) {
                    throw AutomatonError(ErrorKind::IncompleteAutomaton,
                                         "Completed DFA has no transition from state " +
                                             label_text(current) + " on '" + symbol + "'.");
                }
                return false;
            }
            current = *it->second.begin();
        }
        return states_.at(current).final;
    } else {
        LabelSet current = initial_states_;
        for (const auto& symbol : word) {
            LabelSet next;
            for (auto label : current) {
                const auto& transitions = states_.at(label).transitions;
                auto it = transitions.find(symbol);
                if (it != transitions.end()) {
                    next.insert(it->second.begin(), it->second.end());
                }
            }
            if (next.empty()) {
                return false;
            }
            current = std::move(next);
        }
        return std::any_of(current.begin(), current.end(),
                           [this](StateLabel label) { return final_states_.count(label) != 0; });
    }
}

template <Determinism D>
bool Automaton<D>::is_deterministic() const {
    if (initial_states_.size() != 1) {
        return false;
    }
    for (const auto& [label, state] : states_) {
        for (const auto& [symbol, targets] : state.transitions) {
            if (targets.size() > 1) {
                return false;
            }
        }
    }
    return true;
}

template <Determinism D>
bool Automaton<D>::is_complete() const {
    for (const auto& [label, state] : states_) {
        for (const auto& symbol : alphabet_->symbols()) {
            auto it = state.transitions.find(symbol);
            if (it == state.transitions.end() || it->second.empty()) {
                return false;
            }
        }
    }
    return true;
}

template <Determinism D>
const State& Automaton<D>::state(StateLabel label) const {
    require_state(label);
    return states_.at(label);
}

template <Determinism D>
const LabelSet& Automaton<D>::successors(StateLabel label, const Symbol& symbol) const {
    require_state(label);
    if (!alphabet_->contains(symbol)) {
        throw AutomatonError(ErrorKind::InvalidSymbol,
                             "Symbol '" + symbol + "' is not in the automaton's alphabet.");
    }
    const auto& transitions = states_.at(label).transitions;
    auto it = transitions.find(symbol);
    if (it == transitions.end()) {
        return kNoTargets;
    }
    return it->second;
}

template <Determinism D>
std::size_t Automaton<D>::transition_count() const {
    std::size_t count = 0;
    for (const auto& [label, state] : states_) {
        for (const auto& [symbol, targets] : state.transitions) {
            count += targets.size();
        }
    }
    return count;
}

template <Determinism D>
bool Automaton<D>::operator==(const Automaton& other) const {
    return *alphabet_ == *other.alphabet_ && states_ == other.states_;
}

template <Determinism D>
void Automaton<D>::require_state(StateLabel label) const {
    if (!states_.count(label)) {
        throw AutomatonError(ErrorKind::UnknownState,
                             "State with label " + label_text(label) + " doesn't exist.");
    }
}

template <Determinism D>
void Automaton<D>::validate_word(const Word& word) const {
    for (std::size_t i = 0; i < word.size(); ++i) {
        if (!alphabet_->contains(word[i])) {
            std::ostringstream message;
            message << "Symbol '" << word[i] << "' at position " << i
                    << " is not in the automaton's alphabet.";
            throw AutomatonError(ErrorKind::SymbolNotInAlphabet, message.str());
        }
    }
}

template class Automaton<Determinism::Deterministic>;
template class Automaton<Determinism::Nondeterministic>;

NFA to_nfa(const DFA& dfa) {
    NFA nfa(dfa.alphabet());
    for (const auto& [label, state] : dfa.states()) {
        nfa.add_state(label, state.initial, state.final);
    }
    for (const auto& [label, state] : dfa.states()) {
        for (const auto& [symbol, targets] : state.transitions) {
            for (auto target : targets) {
                nfa.add_transition({symbol}, label, target);
            }
        }
    }
    return nfa;
}

}  // namespace finite_automata
