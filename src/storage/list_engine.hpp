#pragma once

#include "command/command.hpp"
#include "command/response.hpp"
#include "storage/store.hpp"

namespace polykv {

// Executes one list command against store.lists().
//
// Indices follow the usual convention: 0 is the head, -1 the tail.  A list
// emptied by pops stays attached to its key, so LPUSHX/RPUSHX still see it.
[[nodiscard]] Response execute(const ListCommand& cmd, Store& store);

} // namespace polykv
