#include "automata/determinize.hpp"

#include <algorithm>
#include <map>
#include <queue>
#include <utility>
#include <vector>

namespace finite_automata {

DFA determinize(const NFA& nfa) {
    if (nfa.initial_states().empty()) {
        throw AutomatonError(ErrorKind::NoInitialState,
                             "Cannot determinize an NFA without an initial state.");
    }

    // A subset of NFA states in canonical (sorted) form.
    using Subset = std::vector<StateLabel>;

    DFA dfa(nfa.alphabet());
    std::map<Subset, StateLabel> discovered;
    std::queue<Subset> work;

    const auto& nfa_finals = nfa.final_states();
    auto discover = [&](Subset subset) -> StateLabel {
        auto it = discovered.find(subset);
        if (it != discovered.end()) {
            return it->second;
        }

        const StateLabel label = discovered.size();
        const bool accepting =
            std::any_of(subset.begin(), subset.end(),
                        [&](StateLabel state) { return nfa_finals.count(state) != 0; });
        dfa.add_state(label, label == 0, accepting);
        discovered.emplace(subset, label);
        work.push(std::move(subset));
        return label;
    };

    const auto& initials = nfa.initial_states();
    discover(Subset(initials.begin(), initials.end()));

    while (!work.empty()) {
        Subset current = std::move(work.front());
        work.pop();
        const StateLabel from = discovered.at(current);

        for (const auto& symbol : nfa.alphabet()->symbols()) {
            // Union of the targets of every member of `current` on `symbol`.
            // LabelSet keeps it sorted, which makes it canonical.
            LabelSet targets;
            for (auto state : current) {
                const auto& successors = nfa.successors(state, symbol);
                targets.insert(successors.begin(), successors.end());
            }
            if (targets.empty()) {
                continue;
            }

            const StateLabel to = discover(Subset(targets.begin(), targets.end()));
            dfa.add_transition({symbol}, from, to);
        }
    }

    return dfa;
}

}  // namespace finite_automata
