#include "automata/error.hpp"

namespace finite_automata {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DuplicateLabel:
            return "DuplicateLabel";
        case ErrorKind::UnknownState:
            return "UnknownState";
        case ErrorKind::InvalidSymbol:
            return "InvalidSymbol";
        case ErrorKind::SymbolNotInAlphabet:
            return "SymbolNotInAlphabet";
        case ErrorKind::NondeterministicTransition:
            return "NondeterministicTransition";
        case ErrorKind::IncompleteAutomaton:
            return "IncompleteAutomaton";
        case ErrorKind::NoInitialState:
            return "NoInitialState";
        case ErrorKind::MultipleInitialStates:
            return "MultipleInitialStates";
        case ErrorKind::EmptyAlphabet:
            return "EmptyAlphabet";
    }
    return "Unknown";
}

AutomatonError::AutomatonError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(to_string(kind)) + ": " + message), kind_(kind) {}

}  // namespace finite_automata
