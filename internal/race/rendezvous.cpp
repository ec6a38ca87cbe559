#include "rendezvous.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace optimist::race {

RendezvousGate::Turn::Turn(Turn&& other) noexcept : gate_(other.gate_) {
  other.gate_ = nullptr;
}

RendezvousGate::Turn::~Turn() {
  if (gate_ != nullptr) gate_->Release();
}

RendezvousGate::RendezvousGate(std::size_t parties) : parties_(parties) {
  if (parties_ == 0) throw std::invalid_argument("rendezvous gate needs at least one party");
}

void RendezvousGate::Count() {
  {
    std::lock_guard lock(mutex_);
    if (arrived_ >= parties_) throw util::InvalidState("rendezvous gate: more arrivals than parties");
    ++arrived_;
  }
  cv_.notify_all();
}

void RendezvousGate::Arrive() {
  Count();
}

void RendezvousGate::Abandon() {
  Count();
}

RendezvousGate::Turn RendezvousGate::AwaitTurn(const util::Cancellation& cancel) {
  cancel.ThrowIfCancelled("rendezvous");

  std::unique_lock lock(mutex_);
  const auto       ready = [this] { return arrived_ >= parties_ && !turn_held_; };

  bool acquired = false;
  if (auto deadline = cancel.Deadline()) {
    acquired = cv_.wait_until(lock, cancel.Token(), *deadline, ready);
  } else {
    acquired = cv_.wait(lock, cancel.Token(), ready);
  }

  if (!acquired) {
    lock.unlock();
    cancel.ThrowIfCancelled("rendezvous");
    throw util::Timeout("rendezvous: wait ended without a turn");
  }

  turn_held_ = true;
  return Turn(this);
}

std::size_t RendezvousGate::Arrived() const {
  std::lock_guard lock(mutex_);
  return arrived_;
}

void RendezvousGate::Release() {
  {
    std::lock_guard lock(mutex_);
    turn_held_ = false;
  }
  cv_.notify_all();
}

} // namespace optimist::race
