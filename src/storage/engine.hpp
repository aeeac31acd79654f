#pragma once

#include "command/command.hpp"
#include "command/response.hpp"
#include "storage/store.hpp"

namespace polykv {

// Executes PING / KEYS.
[[nodiscard]] Response execute(const ServerCommand& cmd, Store& store);

// Routes a translated Command to the engine owning its data type and returns
// that engine's Response.  Never throws for a well-typed Command; execution
// failures come back as ErrorResp.
//
// Thread-safe: all shared state lives in `store` behind its container locks.
[[nodiscard]] Response execute(const Command& cmd, Store& store);

} // namespace polykv
