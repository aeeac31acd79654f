#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace polykv {

// Opaque byte sequences; equality is exact byte equality.
using Key   = std::string;
using Value = std::string;

// Lengths, increments, cardinalities.
using Count = std::int64_t;

// ── Commands ──────────────────────────────────────────────────────────────────
//
// Validated representation of a single client request.  Each command is a
// plain struct carrying already type-checked arguments; the commands of one
// data type are grouped into a closed std::variant so the owning engine can
// std::visit over it and the compiler rejects any unhandled alternative.

// ── Server ────────────────────────────────────────────────────────────────────

struct PingCmd {};

struct KeysCmd {};

using ServerCommand = std::variant<PingCmd, KeysCmd>;

// ── Strings ───────────────────────────────────────────────────────────────────

struct SetCmd {
    Key key;
    Value value;
};

struct GetCmd {
    Key key;
};

struct DelCmd {
    std::vector<Key> keys;
};

struct RenameCmd {
    Key key;
    Key new_key;
};

struct ExistsCmd {
    std::vector<Key> keys;
};

// INCR / INCRBY
struct IncrByCmd {
    Key key;
    Count delta;
};

// DECR / DECRBY
struct DecrByCmd {
    Key key;
    Count delta;
};

struct StrLenCmd {
    Key key;
};

using StringCommand = std::variant<SetCmd, GetCmd, DelCmd, RenameCmd, ExistsCmd,
                                   IncrByCmd, DecrByCmd, StrLenCmd>;

// ── Hashes ────────────────────────────────────────────────────────────────────

struct HGetCmd {
    Key key;
    Key field;
};

struct HSetCmd {
    Key key;
    Key field;
    Value value;
};

struct HExistsCmd {
    Key key;
    Key field;
};

struct HGetAllCmd {
    Key key;
};

struct HMGetCmd {
    Key key;
    std::vector<Key> fields;
};

struct HKeysCmd {
    Key key;
};

struct HMSetCmd {
    Key key;
    std::vector<std::pair<Key, Value>> pairs; // applied in order, later pairs win
};

struct HIncrByCmd {
    Key key;
    Key field;
    Count delta;
};

struct HLenCmd {
    Key key;
};

struct HDelCmd {
    Key key;
    std::vector<Key> fields;
};

struct HValsCmd {
    Key key;
};

struct HStrLenCmd {
    Key key;
    Key field;
};

struct HSetNxCmd {
    Key key;
    Key field;
    Value value;
};

using HashCommand = std::variant<HGetCmd, HSetCmd, HExistsCmd, HGetAllCmd, HMGetCmd,
                                 HKeysCmd, HMSetCmd, HIncrByCmd, HLenCmd, HDelCmd,
                                 HValsCmd, HStrLenCmd, HSetNxCmd>;

// ── Sets ──────────────────────────────────────────────────────────────────────

struct SAddCmd {
    Key key;
    std::vector<Value> members;
};

struct SRemCmd {
    Key key;
    std::vector<Value> members;
};

struct SMembersCmd {
    Key key;
};

struct SIsMemberCmd {
    Key key;
    Value member;
};

struct SCardCmd {
    Key key;
};

struct SDiffCmd {
    std::vector<Key> keys;
};

struct SUnionCmd {
    std::vector<Key> keys;
};

struct SInterCmd {
    std::vector<Key> keys;
};

struct SDiffStoreCmd {
    Key destination;
    std::vector<Key> keys;
};

struct SUnionStoreCmd {
    Key destination;
    std::vector<Key> keys;
};

struct SInterStoreCmd {
    Key destination;
    std::vector<Key> keys;
};

struct SPopCmd {
    Key key;
    std::optional<Count> count; // non-negative when present
};

struct SMoveCmd {
    Key source;
    Key destination;
    Value member;
};

struct SRandMemberCmd {
    Key key;
    std::optional<Count> count; // negative: repeats allowed
};

using SetCommand = std::variant<SAddCmd, SRemCmd, SMembersCmd, SIsMemberCmd, SCardCmd,
                                SDiffCmd, SUnionCmd, SInterCmd, SDiffStoreCmd,
                                SUnionStoreCmd, SInterStoreCmd, SPopCmd, SMoveCmd,
                                SRandMemberCmd>;

// ── Lists ─────────────────────────────────────────────────────────────────────

struct LPushCmd {
    Key key;
    std::vector<Value> values;
};

struct RPushCmd {
    Key key;
    std::vector<Value> values;
};

struct LPushXCmd {
    Key key;
    Value value;
};

struct RPushXCmd {
    Key key;
    Value value;
};

struct LLenCmd {
    Key key;
};

struct LPopCmd {
    Key key;
};

struct RPopCmd {
    Key key;
};

struct LRangeCmd {
    Key key;
    Count start;
    Count stop;
};

struct LIndexCmd {
    Key key;
    Count index;
};

enum class InsertPosition : uint8_t {
    Before,
    After,
};

struct LInsertCmd {
    Key key;
    InsertPosition position;
    Value pivot;
    Value value;
};

using ListCommand = std::variant<LPushCmd, RPushCmd, LPushXCmd, RPushXCmd, LLenCmd,
                                 LPopCmd, RPopCmd, LRangeCmd, LIndexCmd, LInsertCmd>;

// ── Command ───────────────────────────────────────────────────────────────────

using Command = std::variant<ServerCommand, StringCommand, HashCommand, SetCommand,
                             ListCommand>;

} // namespace polykv
