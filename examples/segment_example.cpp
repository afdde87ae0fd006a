#include <iostream>
#include <string>
#include <vector>

#include "seqflow/seqflow.hpp"

namespace {
void print_groups(std::string const &title, std::vector<std::vector<std::string>> const &groups) {
  std::cout << title << ":";
  for (auto const &g : groups) {
    std::cout << " [";
    for (size_t i = 0; i < g.size(); ++i) {
      std::cout << (i ? " " : "") << g[i];
    }
    std::cout << "]";
  }
  std::cout << "\n";
}

seqflow::seq<std::string> log_lines() {
  return seqflow::of<std::string>({"boot", "BEGIN", "read", "parse", "END", "idle", "BEGIN", "write", "END", "halt"});
}
} // namespace

int main() {
  using namespace seqflow;
  auto is = [](char const *word) { return [word](std::string const &s) { return s == word; }; };

  // Transactions between BEGIN and END markers
  print_groups("transactions", to_vectors(group(log_lines(), is("BEGIN"), false, is("END"), false)));

  // Sections started by each BEGIN
  print_groups("sections", to_vectors(group(log_lines(), is("BEGIN"))));

  // Fixed-size chunks and rolling windows
  print_groups("chunks of 3", to_vectors(group(log_lines(), 3)));
  print_groups("pairs", to_vectors(roll(log_lines(), 2)));

  // Columns side by side
  print_groups("columns", to_vectors(traverse(of<std::string>({"a", "b", "c"}), of<std::string>({"1", "2", "3"}))));

  std::cout << "woven:";
  for_each(weave(of<std::string>({"a", "b"}), of<std::string>({"1", "2"})),
           [](std::string &&s) { std::cout << " " << s; });
  std::cout << "\n";

  std::cout << "labelled:";
  auto labelled = zip(cycle(of<std::string>({"even", "odd"})), iota(0),
                      [](std::string const &parity, int n) { return std::to_string(n) + ":" + parity; });
  for_each(limit_at_most(std::move(labelled), 5), [](std::string &&s) { std::cout << " " << s; });
  std::cout << "\n";

  std::cout << "stuttered:";
  for_each(repeat(of({1, 2, 3}), 2), [](int &&v) { std::cout << " " << v; });
  std::cout << "\n";

  return 0;
}
