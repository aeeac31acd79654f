#pragma once

#include "command/command.hpp"
#include "command/response.hpp"
#include "storage/store.hpp"

namespace polykv {

// Executes one hash command against store.hashes().
//
// Read-only commands take the shared lock; mutating commands take the
// exclusive lock for their whole duration (HINCRBY and HSETNX included), so a
// read-modify-write never interleaves with another writer.  An absent key
// reads as an empty hash; writes create it on first touch.
[[nodiscard]] Response execute(const HashCommand& cmd, Store& store);

} // namespace polykv
