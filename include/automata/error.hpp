#pragma once

#include <stdexcept>
#include <string>

namespace finite_automata {

enum class ErrorKind {
    DuplicateLabel,
    UnknownState,
    InvalidSymbol,
    SymbolNotInAlphabet,
    NondeterministicTransition,
    IncompleteAutomaton,
    NoInitialState,
    MultipleInitialStates,
    EmptyAlphabet,
};

const char* to_string(ErrorKind kind);

// Every modeling error raised by the library. The message names the
// offending label or symbol; kind() lets callers branch without parsing it.
class AutomatonError : public std::runtime_error {
public:
    AutomatonError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

}  // namespace finite_automata
