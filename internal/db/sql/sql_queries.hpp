#pragma once

namespace optimist::db::sql {

/*
  Canonical SQL used by all backends.

  IMPORTANT:
  These are written in SQLite-compatible SQL subset.
  Postgres prepares the same statements with $n placeholders (see PgPool).
*/

static constexpr const char* INSERT_ENTITY =
    "INSERT INTO entity(primary_key,version)"
    " VALUES(?,?);";

static constexpr const char* SELECT_ENTITY =
    "SELECT primary_key,version"
    " FROM entity WHERE primary_key=?;";

// the optimistic concurrency primitive: match and increment in one statement
static constexpr const char* ADVANCE_ENTITY_VERSION =
    "UPDATE entity SET version=version+1"
    " WHERE primary_key=? AND version=?;";

static constexpr const char* DELETE_ENTITY =
    "DELETE FROM entity WHERE primary_key=?;";

}
