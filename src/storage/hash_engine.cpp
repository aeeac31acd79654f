#include "storage/hash_engine.hpp"
#include "common/overloaded.hpp"
#include "storage/counter.hpp"

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace polykv {

namespace {

// Field lookup inside a locked HashMap; nullptr if the key or field is absent.
const Value* find_field(const HashMap& hashes, const Key& key, const Key& field) {
    auto hash = hashes.find(key);
    if (hash == hashes.end()) {
        return nullptr;
    }
    auto it = hash->second.find(field);
    return it == hash->second.end() ? nullptr : &it->second;
}

const Hash* find_hash(const HashMap& hashes, const Key& key) {
    auto it = hashes.find(key);
    return it == hashes.end() ? nullptr : &it->second;
}

} // anonymous namespace

Response execute(const HashCommand& cmd, Store& store) {
    return std::visit(
        Overloaded{
            [&](const HGetCmd& c) -> Response {
                auto hashes = store.hashes().read();
                if (const Value* v = find_field(*hashes, c.key, c.field)) {
                    return ValueResp{*v};
                }
                return NilResp{};
            },

            [&](const HSetCmd& c) -> Response {
                auto hashes = store.hashes().write();
                (*hashes)[c.key].insert_or_assign(c.field, c.value);
                return OkResp{};
            },

            [&](const HExistsCmd& c) -> Response {
                auto hashes = store.hashes().read();
                return IntResp{find_field(*hashes, c.key, c.field) != nullptr ? 1 : 0};
            },

            [&](const HGetAllCmd& c) -> Response {
                auto hashes = store.hashes().read();
                const Hash* hash = find_hash(*hashes, c.key);
                if (hash == nullptr) {
                    return MultiValueResp{};
                }
                std::vector<Value> flat;
                flat.reserve(hash->size() * 2);
                for (const auto& [field, value] : *hash) {
                    flat.push_back(field);
                    flat.push_back(value);
                }
                return MultiValueResp{std::move(flat)};
            },

            [&](const HMGetCmd& c) -> Response {
                auto hashes = store.hashes().read();
                const Hash* hash = find_hash(*hashes, c.key);
                ArrayResp out;
                out.items.reserve(c.fields.size());
                for (const auto& field : c.fields) {
                    if (hash != nullptr) {
                        if (auto it = hash->find(field); it != hash->end()) {
                            out.items.emplace_back(ValueResp{it->second});
                            continue;
                        }
                    }
                    out.items.emplace_back(NilResp{});
                }
                return out;
            },

            [&](const HKeysCmd& c) -> Response {
                auto hashes = store.hashes().read();
                MultiValueResp out;
                if (const Hash* hash = find_hash(*hashes, c.key)) {
                    out.values.reserve(hash->size());
                    for (const auto& [field, _] : *hash) {
                        out.values.push_back(field);
                    }
                }
                return out;
            },

            [&](const HMSetCmd& c) -> Response {
                auto hashes = store.hashes().write();
                Hash& hash = (*hashes)[c.key];
                for (const auto& [field, value] : c.pairs) {
                    hash.insert_or_assign(field, value);
                }
                return OkResp{};
            },

            [&](const HIncrByCmd& c) -> Response {
                // One exclusive lock spans the read, the arithmetic and the store.
                auto hashes = store.hashes().write();
                Hash& hash = (*hashes)[c.key];

                auto it = hash.find(c.field);
                auto result = apply_delta(it == hash.end() ? nullptr : &it->second, c.delta);
                if (auto* err = std::get_if<ErrorResp>(&result)) {
                    return std::move(*err);
                }
                hash.insert_or_assign(c.field, std::to_string(std::get<Count>(result)));
                return OkResp{};
            },

            [&](const HLenCmd& c) -> Response {
                auto hashes = store.hashes().read();
                const Hash* hash = find_hash(*hashes, c.key);
                return IntResp{hash == nullptr ? 0 : static_cast<Count>(hash->size())};
            },

            [&](const HDelCmd& c) -> Response {
                auto hashes = store.hashes().write();
                auto it = hashes->find(c.key);
                if (it == hashes->end()) {
                    return IntResp{0};
                }
                Count removed = 0;
                for (const auto& field : c.fields) {
                    removed += static_cast<Count>(it->second.erase(field));
                }
                return IntResp{removed};
            },

            [&](const HValsCmd& c) -> Response {
                auto hashes = store.hashes().read();
                MultiValueResp out;
                if (const Hash* hash = find_hash(*hashes, c.key)) {
                    out.values.reserve(hash->size());
                    for (const auto& [_, value] : *hash) {
                        out.values.push_back(value);
                    }
                }
                return out;
            },

            [&](const HStrLenCmd& c) -> Response {
                auto hashes = store.hashes().read();
                const Value* v = find_field(*hashes, c.key, c.field);
                return IntResp{v == nullptr ? 0 : static_cast<Count>(v->size())};
            },

            [&](const HSetNxCmd& c) -> Response {
                auto hashes = store.hashes().write();
                const bool inserted = (*hashes)[c.key].try_emplace(c.field, c.value).second;
                return IntResp{inserted ? 1 : 0};
            },
        },
        cmd);
}

} // namespace polykv
