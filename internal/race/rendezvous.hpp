#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

#include "internal/util/cancellation.hpp"

namespace optimist::race {

/*
  RendezvousGate

  Two-phase barrier for the forced interleaving:

  1. every party calls Arrive() (or Abandon() when it failed before
     getting there); nobody passes AwaitTurn() until all parties did
  2. past that point the gate is a mutex: one Turn at a time, handed
     over when the holder's Turn is destroyed

  An abandoned party counts as arrived but never takes a turn, so a peer
  that dies early cannot leave the others waiting forever. AwaitTurn()
  is cancellable and throws util::Timeout.
*/
class RendezvousGate {
 public:
  class Turn {
   public:
    Turn(Turn&& other) noexcept;
    Turn& operator=(Turn&&) = delete;
    Turn(const Turn&)            = delete;
    Turn& operator=(const Turn&) = delete;
    ~Turn();

   private:
    friend class RendezvousGate;
    explicit Turn(RendezvousGate* gate) : gate_(gate) {
    }

    RendezvousGate* gate_;
  };

  explicit RendezvousGate(std::size_t parties = 2);

  void Arrive();
  void Abandon();

  Turn AwaitTurn(const util::Cancellation& cancel);

  // parties that arrived or abandoned so far
  std::size_t Arrived() const;

  std::size_t Parties() const {
    return parties_;
  }

 private:
  void Release();
  void Count();

  const std::size_t           parties_;
  mutable std::mutex          mutex_;
  std::condition_variable_any cv_;
  std::size_t                 arrived_   = 0;
  bool                        turn_held_ = false;
};

} // namespace optimist::race
