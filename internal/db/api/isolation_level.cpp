#include "isolation_level.hpp"

#include <cctype>
#include <stdexcept>

namespace optimist::db {

namespace {

// lowercase, drop separators: "READ COMMITTED" / "read_committed" / "ReadCommitted" -> "readcommitted"
std::string Normalize(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (c == '_' || c == ' ' || c == '-') continue;
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

} // namespace

const char* ToSql(IsolationLevel level) {
  switch (level) {
    case IsolationLevel::kReadUncommitted:
      return "READ UNCOMMITTED";
    case IsolationLevel::kReadCommitted:
      return "READ COMMITTED";
    case IsolationLevel::kRepeatableRead:
      return "REPEATABLE READ";
    case IsolationLevel::kSerializable:
      return "SERIALIZABLE";
  }
  return "READ COMMITTED";
}

const char* ToString(IsolationLevel level) {
  switch (level) {
    case IsolationLevel::kReadUncommitted:
      return "read_uncommitted";
    case IsolationLevel::kReadCommitted:
      return "read_committed";
    case IsolationLevel::kRepeatableRead:
      return "repeatable_read";
    case IsolationLevel::kSerializable:
      return "serializable";
  }
  return "unknown";
}

IsolationLevel ParseIsolationLevel(std::string_view text) {
  const auto key = Normalize(text);

  if (key == "readuncommitted") return IsolationLevel::kReadUncommitted;
  if (key == "readcommitted") return IsolationLevel::kReadCommitted;
  if (key == "repeatableread") return IsolationLevel::kRepeatableRead;
  if (key == "serializable") return IsolationLevel::kSerializable;

  throw std::invalid_argument("unknown isolation level: " + std::string(text));
}

} // namespace optimist::db
