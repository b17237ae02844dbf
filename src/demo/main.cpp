#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "automata/automaton.hpp"
#include "automata/complete.hpp"
#include "automata/determinize.hpp"
#include "automata/minimize.hpp"
#include "project_config.hpp"
#include "utils/word.hpp"

namespace finite_automata {
namespace {

struct CommandLineOptions {
    std::vector<std::string> words;
    bool skip_minimize{false};
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [--word=TEXT]... [--skip-minimize]\n";
    std::cout << "Options:\n"
              << "  --word=TEXT         Word to run through every automaton (repeatable).\n"
              << "                      Each character is one symbol.\n"
              << "  --skip-minimize     Stop after completion.\n"
              << "  --version           Print version information.\n"
              << "  --help              Show this message.\n";
}

bool parse_argument(const std::string& arg,
                    CommandLineOptions& opts,
                    const char* program) {
    if (arg == "--help" || arg == "-h") {
        print_usage(program);
        std::exit(0);
    }
    if (arg == "--version") {
        std::cout << "automata-demo " << kVersion << "\n";
        std::exit(0);
    }

    auto parse_key_value = [](const std::string& option,
                              const std::string& prefix) -> std::optional<std::string> {
        if (option.rfind(prefix, 0) == 0) {
            return option.substr(prefix.size());
        }
        return std::nullopt;
    };

    if (auto value = parse_key_value(arg, "--word=")) {
        opts.words.push_back(*value);
        return true;
    }
    if (arg == "--skip-minimize") {
        opts.skip_minimize = true;
        return true;
    }

    std::cerr << "Unknown option: " << arg << "\n";
    print_usage(program);
    return false;
}

// Words over {a, b} ending with 'a'. State 2 is a dead end, so the NFA is
// both nondeterministic (0 on a) and redundant.
NFA build_reference_nfa() {
    NFA nfa(Alphabet::from_characters("ab"));
    nfa.add_state(0, true);
    nfa.add_state(1, false, true);
    nfa.add_state(2);

    nfa.add_transition({"a", "b"}, 0, 0);
    nfa.add_transition({"a"}, 0, 1);
    nfa.add_transition({"a", "b"}, 1, 2);
    nfa.add_transition({"a", "b"}, 2, 2);
    return nfa;
}

template <Determinism D>
void report_words(const Automaton<D>& automaton, const std::vector<std::string>& words) {
    for (const auto& text : words) {
        try {
            std::cout << "      \"" << text << "\": "
                      << (automaton.accepts(to_word(text)) ? "accepted" : "rejected") << "\n";
        } catch (const AutomatonError& ex) {
            std::cout << "      \"" << text << "\": " << ex.what() << "\n";
        }
    }
}

}  // namespace
}  // namespace finite_automata

int main(int argc, char* argv[]) {
    using namespace finite_automata;

    CommandLineOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (!parse_argument(arg, options, argv[0])) {
            return 1;
        }
    }
    if (options.words.empty()) {
        options.words = kDefaultDemoWords;
    }

    try {
        const int steps = options.skip_minimize ? 3 : 4;

        std::cout << "[1/" << steps << "] Building NFA..." << std::endl;
        NFA nfa = build_reference_nfa();
        std::cout << "      NFA states: " << nfa.size()
                  << ", transitions: " << nfa.transition_count() << std::endl;
        report_words(nfa, options.words);

        std::cout << "[2/" << steps << "] Determinizing (subset construction)..." << std::endl;
        DFA dfa = determinize(nfa);
        std::cout << "      DFA states: " << dfa.size()
                  << (dfa.is_complete() ? " (complete)" : " (partial)") << std::endl;
        report_words(dfa, options.words);

        std::cout << "[3/" << steps << "] Completing DFA..." << std::endl;
        DFA completed = complete(dfa);
        std::cout << "      Completed DFA states: " << completed.size() << std::endl;

        if (!options.skip_minimize) {
            std::cout << "[4/" << steps << "] Minimizing DFA..." << std::endl;
            DFA minimized = minimize(completed);
            std::cout << "      Minimized DFA states: " << minimized.size() << std::endl;
            report_words(minimized, options.words);
        } else {
            report_words(completed, options.words);
        }

        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
