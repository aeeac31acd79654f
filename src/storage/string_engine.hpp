#pragma once

#include "command/command.hpp"
#include "command/response.hpp"
#include "storage/store.hpp"

namespace polykv {

// Executes one string command against store.strings().
//
// RENAME and INCRBY/DECRBY read and write under a single exclusive lock.
[[nodiscard]] Response execute(const StringCommand& cmd, Store& store);

} // namespace polykv
