#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "seqflow/seqflow.hpp"

int main() {
  using namespace seqflow;

  // Tick prices; a negative price marks a feed glitch
  std::vector<double> prices{10.0, 10.5, 11.0, -1.0, 11.5, 12.0, 11.0, 10.0, 9.5, 10.5};

  // Replace glitches by 0, skip until the price first reaches 10.5, keep 6 ticks
  auto cleaned = validate(from_vector(prices), [](double p) { return p >= 0; }, [](double) { return 0.0; });
  auto ticks = limit_at_most(gate(std::move(cleaned), [](double p) { return p >= 10.5; }), 6);

  std::cout << "3-tick moving average:";
  auto averages = window_average(std::move(ticks), 3);
  for_each(averages, [](double &&avg) { std::cout << " " << avg; });
  std::cout << "\n";

  // Running maximum per symbol
  using quote = std::pair<std::string, double>;
  auto highs = accumulate_keyed(of<quote>({{"AAA", 10.0}, {"BBB", 12.0}, {"CCC", 11.0}, {"DDD", 13.0}}),
                                [](double a, double b) { return a < b ? b : a; });
  for_each(highs, [](quote &&q) { std::cout << q.first << " high so far: " << q.second << "\n"; });

  // Top 2 price levels and every tick at them
  auto levels = filter_max_values(from_vector(prices), 2, [](double a, double b) { return a < b; });
  std::cout << "top levels:";
  for_each(levels, [](double &&p) { std::cout << " " << p; });
  std::cout << "\n";

  // Every unordered pair of distinct levels
  auto pairs = cross_product_naturally_ordered(of({9.5, 10.0, 11.0}));
  for_each(pairs, [](std::pair<double, double> &&pr) { std::cout << "(" << pr.first << ", " << pr.second << ")\n"; });

  return 0;
}
