#pragma once

#include "command/command.hpp"
#include "command/response.hpp"
#include "storage/store.hpp"

namespace polykv {

// Largest |count| accepted by SRANDMEMBER with a negative count.  Larger
// requests get kErrOutOfRange instead of a reply of that many members.
inline constexpr Count kMaxRandomPicks = Count{1} << 20;

// Executes one set command against store.sets().
//
// SDIFF/SUNION/SINTER read every source under one shared lock.  The *STORE
// variants, SPOP and SMOVE compute and write under one exclusive lock, so the
// destination never reflects a partially applied command.  Absent keys act as
// empty sets.
[[nodiscard]] Response execute(const SetCommand& cmd, Store& store);

} // namespace polykv
