#include "time.hpp"

namespace optimist::util {

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d) {
  auto total = std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos());
  return std::chrono::duration_cast<std::chrono::milliseconds>(total);
}

google::protobuf::Duration FromMillis(std::chrono::milliseconds ms) {
  auto sec   = std::chrono::duration_cast<std::chrono::seconds>(ms);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(ms - sec);

  google::protobuf::Duration d;
  d.set_seconds(sec.count());
  d.set_nanos(static_cast<int32_t>(nanos.count()));
  return d;
}

bool IsZero(const google::protobuf::Duration& d) {
  return d.seconds() == 0 && d.nanos() == 0;
}

} // namespace optimist::util
