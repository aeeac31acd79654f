#include "storage/list_engine.hpp"
#include "common/overloaded.hpp"

#include <algorithm>
#include <iterator>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

namespace polykv {

namespace {

const List* find_list(const ListMap& lists, const Key& key) {
    auto it = lists.find(key);
    return it == lists.end() ? nullptr : &it->second;
}

// Resolves a possibly negative index against a list of `size` elements.
std::optional<std::size_t> resolve_index(Count index, std::size_t size) {
    const auto n = static_cast<Count>(size);
    if (index < 0) {
        index += n;
    }
    if (index < 0 || index >= n) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(index);
}

std::vector<Value> range(const List& list, Count start, Count stop) {
    const auto n = static_cast<Count>(list.size());
    if (start < 0) {
        start = std::max<Count>(start + n, 0);
    }
    if (stop < 0) {
        stop += n;
    }
    stop = std::min(stop, n - 1);
    if (start > stop || start >= n) {
        return {};
    }
    return std::vector<Value>(list.begin() + start, list.begin() + stop + 1);
}

Response pop(Store& store, const Key& key, bool front) {
    auto lists = store.lists().write();
    auto it = lists->find(key);
    if (it == lists->end() || it->second.empty()) {
        return NilResp{};
    }
    List& list = it->second;
    Value value;
    if (front) {
        value = std::move(list.front());
        list.pop_front();
    } else {
        value = std::move(list.back());
        list.pop_back();
    }
    return ValueResp{std::move(value)};
}

// Pushes only when the key is already materialized.
Response push_existing(Store& store, const Key& key, const Value& value, bool front) {
    auto lists = store.lists().write();
    auto it = lists->find(key);
    if (it == lists->end()) {
        return IntResp{0};
    }
    if (front) {
        it->second.push_front(value);
    } else {
        it->second.push_back(value);
    }
    return IntResp{static_cast<Count>(it->second.size())};
}

} // anonymous namespace

Response execute(const ListCommand& cmd, Store& store) {
    return std::visit(
        Overloaded{
            [&](const LPushCmd& c) -> Response {
                auto lists = store.lists().write();
                List& list = (*lists)[c.key];
                for (const auto& value : c.values) {
                    list.push_front(value);
                }
                return IntResp{static_cast<Count>(list.size())};
            },

            [&](const RPushCmd& c) -> Response {
                auto lists = store.lists().write();
                List& list = (*lists)[c.key];
                list.insert(list.end(), c.values.begin(), c.values.end());
                return IntResp{static_cast<Count>(list.size())};
            },

            [&](const LPushXCmd& c) -> Response {
                return push_existing(store, c.key, c.value, true);
            },

            [&](const RPushXCmd& c) -> Response {
                return push_existing(store, c.key, c.value, false);
            },

            [&](const LLenCmd& c) -> Response {
                auto lists = store.lists().read();
                const List* list = find_list(*lists, c.key);
                return IntResp{list == nullptr ? 0 : static_cast<Count>(list->size())};
            },

            [&](const LPopCmd& c) -> Response { return pop(store, c.key, true); },

            [&](const RPopCmd& c) -> Response { return pop(store, c.key, false); },

            [&](const LRangeCmd& c) -> Response {
                auto lists = store.lists().read();
                const List* list = find_list(*lists, c.key);
                if (list == nullptr) {
                    return MultiValueResp{};
                }
                return MultiValueResp{range(*list, c.start, c.stop)};
            },

            [&](const LIndexCmd& c) -> Response {
                auto lists = store.lists().read();
                const List* list = find_list(*lists, c.key);
                if (list == nullptr) {
                    return NilResp{};
                }
                auto idx = resolve_index(c.index, list->size());
                if (!idx) {
                    return NilResp{};
                }
                return ValueResp{(*list)[*idx]};
            },

            [&](const LInsertCmd& c) -> Response {
                auto lists = store.lists().write();
                auto it = lists->find(c.key);
                if (it == lists->end()) {
                    return IntResp{0};
                }
                List& list = it->second;
                auto pivot = std::find(list.begin(), list.end(), c.pivot);
                if (pivot == list.end()) {
                    return IntResp{-1};
                }
                if (c.position == InsertPosition::After) {
                    ++pivot;
                }
                list.insert(pivot, c.value);
                return IntResp{static_cast<Count>(list.size())};
            },
        },
        cmd);
}

} // namespace polykv
