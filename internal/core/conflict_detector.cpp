#include "conflict_detector.hpp"

#include "internal/util/errors.hpp"

namespace optimist::core {

const char* ToString(Consistency consistency) {
  switch (consistency) {
    case Consistency::kOk:
      return "ok";
    case Consistency::kConflict:
      return "conflict";
  }
  return "unknown";
}

Consistency CheckConsistency(std::uint64_t first_count, std::uint64_t second_count) {
  return first_count == second_count ? Consistency::kOk : Consistency::kConflict;
}

void EnsureConsistent(std::uint64_t first_count, std::uint64_t second_count, const std::string& context) {
  if (CheckConsistency(first_count, second_count) == Consistency::kOk) {
    return;
  }

  throw util::ConcurrentUpdateError(context + ": first attempt changed " + std::to_string(first_count) + " rows, second attempt changed " +
                                        std::to_string(second_count),
                                    first_count, second_count);
}

} // namespace optimist::core
