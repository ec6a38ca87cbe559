#pragma once

#include <chrono>

#include "google/protobuf/duration.pb.h"

namespace optimist::util {

/*
  Duration conversions between config (protobuf Duration) and std::chrono.
*/

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d);

google::protobuf::Duration FromMillis(std::chrono::milliseconds ms);

// true when the proto field was left at its zero value
bool IsZero(const google::protobuf::Duration& d);

} // namespace optimist::util
