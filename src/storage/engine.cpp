#include "storage/engine.hpp"
#include "common/overloaded.hpp"
#include "storage/hash_engine.hpp"
#include "storage/list_engine.hpp"
#include "storage/set_engine.hpp"
#include "storage/string_engine.hpp"

#include <variant>

namespace polykv {

Response execute(const ServerCommand& cmd, Store& store) {
    return std::visit(
        Overloaded{
            [](const PingCmd&) -> Response { return PongResp{}; },
            [&](const KeysCmd&) -> Response { return MultiValueResp{store.keys()}; },
        },
        cmd);
}

Response execute(const Command& cmd, Store& store) {
    return std::visit([&](const auto& family) { return execute(family, store); }, cmd);
}

} // namespace polykv
