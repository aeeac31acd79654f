#include "storage/string_engine.hpp"
#include "common/overloaded.hpp"
#include "storage/counter.hpp"

#include <string>
#include <utility>
#include <variant>

namespace polykv {

namespace {

// Stores the outcome of a counter update and converts it to a reply.
Response store_counter(StringMap& strings, const Key& key,
                       std::variant<Count, ErrorResp> result) {
    if (auto* err = std::get_if<ErrorResp>(&result)) {
        return std::move(*err);
    }
    const Count value = std::get<Count>(result);
    strings.insert_or_assign(key, std::to_string(value));
    return IntResp{value};
}

const Value* find_value(const StringMap& strings, const Key& key) {
    auto it = strings.find(key);
    return it == strings.end() ? nullptr : &it->second;
}

} // anonymous namespace

Response execute(const StringCommand& cmd, Store& store) {
    return std::visit(
        Overloaded{
            [&](const SetCmd& c) -> Response {
                auto strings = store.strings().write();
                strings->insert_or_assign(c.key, c.value);
                return OkResp{};
            },

            [&](const GetCmd& c) -> Response {
                auto strings = store.strings().read();
                if (const Value* v = find_value(*strings, c.key)) {
                    return ValueResp{*v};
                }
                return NilResp{};
            },

            [&](const DelCmd& c) -> Response {
                auto strings = store.strings().write();
                Count removed = 0;
                for (const auto& key : c.keys) {
                    removed += static_cast<Count>(strings->erase(key));
                }
                return IntResp{removed};
            },

            [&](const RenameCmd& c) -> Response {
                auto strings = store.strings().write();
                auto it = strings->find(c.key);
                if (it == strings->end()) {
                    return ErrorResp{kErrNoSuchKey};
                }
                if (c.key == c.new_key) {
                    return OkResp{};
                }
                Value value = std::move(it->second);
                strings->erase(it);
                strings->insert_or_assign(c.new_key, std::move(value));
                return OkResp{};
            },

            [&](const ExistsCmd& c) -> Response {
                auto strings = store.strings().read();
                Count found = 0;
                for (const auto& key : c.keys) {
                    found += static_cast<Count>(strings->count(key));
                }
                return IntResp{found};
            },

            [&](const IncrByCmd& c) -> Response {
                auto strings = store.strings().write();
                return store_counter(*strings, c.key,
                                     apply_delta(find_value(*strings, c.key), c.delta));
            },

            [&](const DecrByCmd& c) -> Response {
                auto strings = store.strings().write();
                return store_counter(*strings, c.key,
                                     apply_negated_delta(find_value(*strings, c.key), c.delta));
            },

            [&](const StrLenCmd& c) -> Response {
                auto strings = store.strings().read();
                const Value* v = find_value(*strings, c.key);
                return IntResp{v == nullptr ? 0 : static_cast<Count>(v->size())};
            },
        },
        cmd);
}

} // namespace polykv
