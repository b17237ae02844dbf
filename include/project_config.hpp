#pragma once

#include <string>
#include <vector>

namespace finite_automata {

inline const std::string kVersion = "0.3.0";

// Words checked by automata-demo when no --word option is given.
inline const std::vector<std::string> kDefaultDemoWords = {"ababba", "ababbababb", "a", ""};

}  // namespace finite_automata
