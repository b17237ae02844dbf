#include "automata/minimize.hpp"

#include <iterator>
#include <map>
#include <queue>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "automata/reachability.hpp"

namespace finite_automata {
namespace {

// state label -> index of the block containing it
using StatePartition = std::map<StateLabel, std::size_t>;

void require_complete(const DFA& dfa, const std::string& operation) {
    for (const auto& [label, state] : dfa.states()) {
        for (const auto& symbol : dfa.alphabet()->symbols()) {
            if (!dfa.successor(label, symbol)) {
                throw AutomatonError(ErrorKind::IncompleteAutomaton,
                                     "Cannot " + operation + " an incomplete DFA: state " +
                                         std::to_string(label) + " has no transition on '" +
                                         symbol + "'. Complete it first.");
            }
        }
    }
}

// Moore partition refinement. Starts from {final, non-final} and splits
// blocks until every pair of states sharing a block agrees, for each symbol,
// on the block its successor lies in.
StatePartition refine_partition(const DFA& dfa) {
    const auto& alphabet = dfa.alphabet()->symbols();

    StatePartition state_partition;
    std::set<std::size_t> initial_blocks;
    for (const auto& [label, state] : dfa.states()) {
        state_partition[label] = state.final ? 1 : 0;
        initial_blocks.insert(state_partition[label]);
    }
    std::size_t block_count = initial_blocks.size();

    while (true) {
        // A state's signature is its current block followed by the blocks of
        // its successors. States with equal signatures stay together; since
        // the current block is part of the signature, blocks only ever split.
        std::map<std::vector<std::size_t>, std::size_t> signatures;
        StatePartition refined;

        for (const auto& [label, state] : dfa.states()) {
            std::vector<std::size_t> signature;
            signature.reserve(alphabet.size() + 1);
            signature.push_back(state_partition.at(label));
            for (const auto& symbol : alphabet) {
                const StateLabel target = *state.transitions.at(symbol).begin();
                signature.push_back(state_partition.at(target));
            }

            const std::size_t next_index = signatures.size();
            auto inserted = signatures.emplace(std::move(signature), next_index);
            refined[label] = inserted.first->second;
        }

        const bool stable = signatures.size() == block_count;
        state_partition = std::move(refined);
        block_count = signatures.size();
        if (stable) {
            break;
        }
    }

    return state_partition;
}

}  // namespace

DFA minimize(const DFA& dfa) {
    if (dfa.initial_states().empty()) {
        throw AutomatonError(ErrorKind::NoInitialState,
                             "Cannot minimize a DFA without an initial state.");
    }
    require_complete(dfa, "minimize");

    const DFA reachable = reachable_part(dfa);
    const StatePartition state_partition = refine_partition(reachable);
    const auto& alphabet = reachable.alphabet()->symbols();

    // Any member stands for its block: by the fixed point all members agree
    // on finality and on successor blocks.
    std::map<std::size_t, StateLabel> representative;
    for (const auto& [label, block] : state_partition) {
        representative.emplace(block, label);
    }

    // Number blocks breadth-first from the initial block.
    const StateLabel start = *reachable.initial_states().begin();
    std::map<std::size_t, StateLabel> block_label;
    std::vector<std::size_t> order;
    std::queue<std::size_t> pending;

    block_label[state_partition.at(start)] = 0;
    order.push_back(state_partition.at(start));
    pending.push(state_partition.at(start));

    while (!pending.empty()) {
        const std::size_t block = pending.front();
        pending.pop();
        const auto& state = reachable.state(representative.at(block));
        for (const auto& symbol : alphabet) {
            const std::size_t target_block =
                state_partition.at(*state.transitions.at(symbol).begin());
            if (block_label.emplace(target_block, order.size()).second) {
                order.push_back(target_block);
                pending.push(target_block);
            }
        }
    }

    DFA minimized(dfa.alphabet());
    for (std::size_t label = 0; label < order.size(); ++label) {
        const auto& state = reachable.state(representative.at(order[label]));
        minimized.add_state(label, label == 0, state.final);
    }
    for (std::size_t label = 0; label < order.size(); ++label) {
        const auto& state = reachable.state(representative.at(order[label]));
        for (const auto& symbol : alphabet) {
            const std::size_t target_block =
                state_partition.at(*state.transitions.at(symbol).begin());
            minimized.add_transition({symbol}, label, block_label.at(target_block));
        }
    }

    return minimized;
}

std::vector<std::pair<StateLabel, StateLabel>> equivalent_state_pairs(const DFA& dfa) {
    require_complete(dfa, "compute equivalent states of");

    const StatePartition state_partition = refine_partition(dfa);

    std::vector<std::pair<StateLabel, StateLabel>> pairs;
    for (auto first = state_partition.begin(); first != state_partition.end(); ++first) {
        for (auto second = std::next(first); second != state_partition.end(); ++second) {
            if (first->second == second->second) {
                pairs.emplace_back(first->first, second->first);
            }
        }
    }
    return pairs;
}

}  // namespace finite_automata
