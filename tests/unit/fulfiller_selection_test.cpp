#include "internal/oracle/fulfiller_selection.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

namespace {

using coolrouter::oracle::FulfillerSelection;
using coolrouter::oracle::FulfillProbability;
using coolrouter::oracle::MaxFulfillers;

coolrouter::model::Hash32 H(uint8_t tag) {
  coolrouter::model::Hash32 h{};
  h.fill(tag);
  return h;
}

void TestMaxFulfillers() {
  assert(MaxFulfillers(0) == 1);
  assert(MaxFulfillers(1) == 1);
  assert(MaxFulfillers(4) == 1);
  assert(MaxFulfillers(5) == 1);
  assert(MaxFulfillers(10) == 2);
  assert(MaxFulfillers(19) == 3);
  assert(MaxFulfillers(20) == 4);
  assert(MaxFulfillers(32) == 4);
}

void TestProbability() {
  assert(FulfillProbability(1) == 1.0);
  assert(std::fabs(FulfillProbability(3) - 1.0 / 3.0) < 1e-12);
  assert(std::fabs(FulfillProbability(10) - 0.2) < 1e-12);
  assert(std::fabs(FulfillProbability(32) - 4.0 / 32.0) < 1e-12);
}

void TestOnlyWinnersFulfill() {
  assert(!FulfillerSelection::Decide(H(1), H(2), 1, 0.0));
  assert(FulfillerSelection::Decide(H(1), H(1), 1, 0.999));
  assert(FulfillerSelection::Decide(H(1), H(1), 10, 0.19));
  assert(!FulfillerSelection::Decide(H(1), H(1), 10, 0.2));
}

void TestSeededSelectionRate() {
  FulfillerSelection selection(42);
  int                chosen = 0;
  for (int i = 0; i < 10000; ++i) {
    if (selection.ShouldFulfill(H(1), H(1), 10)) {
      ++chosen;
    }
  }
  // p = 0.2
  assert(chosen > 1700 && chosen < 2300);

  for (int i = 0; i < 100; ++i) {
    assert(!selection.ShouldFulfill(H(1), H(2), 10));
  }
}

} // namespace

int main() {
  TestMaxFulfillers();
  TestProbability();
  TestOnlyWinnersFulfill();
  TestSeededSelectionRate();

  std::cout << "coolrouter_unit_fulfiller_selection: pass\n";
  return 0;
}
