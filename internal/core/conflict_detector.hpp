#pragma once

#include <cstdint>
#include <string>

namespace optimist::core {

enum class Consistency {
  kOk = 0,
  kConflict,
};

const char* ToString(Consistency consistency);

/*
  Compares the affected counts of a writer's two attempts at the same
  (key, expected_version). Equal counts mean the update behaved the same
  both times; anything else means a peer moved the row in between.
*/
Consistency CheckConsistency(std::uint64_t first_count, std::uint64_t second_count);

// Throws util::ConcurrentUpdateError carrying both counts on kConflict.
void EnsureConsistent(std::uint64_t first_count, std::uint64_t second_count, const std::string& context);

} // namespace optimist::core
