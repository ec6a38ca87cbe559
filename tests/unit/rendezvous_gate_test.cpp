#include "internal/race/rendezvous.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using optimist::race::RendezvousGate;
using optimist::util::Cancellation;
using optimist::util::Timeout;

void TestNobodyPassesBeforeAllArrived() {
  RendezvousGate    gate(2);
  std::atomic<bool> passed{false};

  gate.Arrive();
  std::thread waiter([&] {
    auto turn = gate.AwaitTurn(Cancellation::After(5s));
    passed    = true;
  });

  std::this_thread::sleep_for(50ms);
  assert(!passed.load() && "one arrival must not open the gate");

  gate.Arrive();
  waiter.join();
  assert(passed.load());
  assert(gate.Arrived() == 2);
}

void TestTurnsAreExclusive() {
  RendezvousGate   gate(2);
  std::atomic<int> inside{0};
  std::atomic<int> max_inside{0};

  auto party = [&] {
    gate.Arrive();
    auto turn = gate.AwaitTurn(Cancellation::After(5s));
    const int now = ++inside;
    int       seen = max_inside.load();
    while (now > seen && !max_inside.compare_exchange_weak(seen, now)) {
    }
    std::this_thread::sleep_for(30ms);
    --inside;
  };

  std::thread a(party);
  std::thread b(party);
  a.join();
  b.join();
  assert(max_inside.load() == 1);
}

void TestAbandonOpensTheGate() {
  RendezvousGate gate(2);
  gate.Arrive();
  gate.Abandon();
  auto turn = gate.AwaitTurn(Cancellation::After(1s));
  (void)turn;
}

void TestWaitIsCancellable() {
  RendezvousGate gate(2);
  gate.Arrive();

  bool threw = false;
  try {
    auto turn = gate.AwaitTurn(Cancellation::After(30ms));
  } catch (const Timeout&) {
    threw = true;
  }
  assert(threw && "a missing peer must surface as Timeout");

  auto        cancel = Cancellation::None();
  std::thread canceller([cancel]() mutable {
    std::this_thread::sleep_for(20ms);
    cancel.Cancel();
  });
  threw = false;
  try {
    auto turn = gate.AwaitTurn(cancel);
  } catch (const Timeout&) {
    threw = true;
  }
  canceller.join();
  assert(threw);
}

void TestTooManyArrivalsAreRejected() {
  RendezvousGate gate(1);
  assert(gate.Parties() == 1);
  gate.Arrive();
  assert(gate.Arrived() == gate.Parties());

  bool threw = false;
  try {
    gate.Arrive();
  } catch (const optimist::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestNobodyPassesBeforeAllArrived();
  TestTurnsAreExclusive();
  TestAbandonOpensTheGate();
  TestWaitIsCancellable();
  TestTooManyArrivalsAreRejected();

  std::cout << "optimist_unit_rendezvous_gate: pass\n";
  return 0;
}
