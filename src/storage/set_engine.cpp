#include "storage/set_engine.hpp"
#include "common/overloaded.hpp"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <random>
#include <utility>
#include <variant>
#include <vector>

namespace polykv {

namespace {

enum class SetAlgebra : uint8_t {
    Diff,
    Union,
    Inter,
};

// Per-thread generator: SRANDMEMBER runs under a shared lock, so the
// generator cannot live in the store.
std::mt19937& rng() {
    thread_local std::mt19937 gen{std::random_device{}()};
    return gen;
}

const MemberSet* find_set(const SetMap& sets, const Key& key) {
    auto it = sets.find(key);
    return it == sets.end() ? nullptr : &it->second;
}

// Applies `op` across the sets named by `keys`, left to right.
MemberSet combine(const SetMap& sets, SetAlgebra op, const std::vector<Key>& keys) {
    MemberSet result;
    if (keys.empty()) {
        return result;
    }

    if (const MemberSet* first = find_set(sets, keys.front())) {
        result = *first;
    }

    for (std::size_t i = 1; i < keys.size(); ++i) {
        const MemberSet* other = find_set(sets, keys[i]);
        switch (op) {
            case SetAlgebra::Diff:
                if (other != nullptr) {
                    for (const auto& member : *other) {
                        result.erase(member);
                    }
                }
                break;
            case SetAlgebra::Union:
                if (other != nullptr) {
                    result.insert(other->begin(), other->end());
                }
                break;
            case SetAlgebra::Inter:
                if (other == nullptr) {
                    result.clear();
                } else {
                    std::erase_if(result, [other](const Value& m) { return !other->contains(m); });
                }
                break;
        }
    }
    return result;
}

std::vector<Value> to_vector(const MemberSet& set) {
    return std::vector<Value>(set.begin(), set.end());
}

Response read_combined(Store& store, SetAlgebra op, const std::vector<Key>& keys) {
    auto sets = store.sets().read();
    return MultiValueResp{to_vector(combine(*sets, op, keys))};
}

Response store_combined(Store& store, SetAlgebra op, const Key& destination,
                        const std::vector<Key>& keys) {
    auto sets = store.sets().write();
    // Computed before assigning: the destination may also be a source.
    MemberSet result = combine(*sets, op, keys);
    const auto size = static_cast<Count>(result.size());
    (*sets)[destination] = std::move(result);
    return IntResp{size};
}

// Up to `count` distinct members chosen at random.
std::vector<Value> sample_distinct(const MemberSet& set, std::size_t count) {
    std::vector<Value> members = to_vector(set);
    std::shuffle(members.begin(), members.end(), rng());
    if (members.size() > count) {
        members.resize(count);
    }
    return members;
}

} // anonymous namespace

Response execute(const SetCommand& cmd, Store& store) {
    return std::visit(
        Overloaded{
            [&](const SAddCmd& c) -> Response {
                auto sets = store.sets().write();
                MemberSet& set = (*sets)[c.key];
                Count added = 0;
                for (const auto& member : c.members) {
                    if (set.insert(member).second) {
                        ++added;
                    }
                }
                return IntResp{added};
            },

            [&](const SRemCmd& c) -> Response {
                auto sets = store.sets().write();
                auto it = sets->find(c.key);
                if (it == sets->end()) {
                    return IntResp{0};
                }
                Count removed = 0;
                for (const auto& member : c.members) {
                    removed += static_cast<Count>(it->second.erase(member));
                }
                return IntResp{removed};
            },

            [&](const SMembersCmd& c) -> Response {
                auto sets = store.sets().read();
                const MemberSet* set = find_set(*sets, c.key);
                return MultiValueResp{set == nullptr ? std::vector<Value>{} : to_vector(*set)};
            },

            [&](const SIsMemberCmd& c) -> Response {
                auto sets = store.sets().read();
                const MemberSet* set = find_set(*sets, c.key);
                return IntResp{set != nullptr && set->contains(c.member) ? 1 : 0};
            },

            [&](const SCardCmd& c) -> Response {
                auto sets = store.sets().read();
                const MemberSet* set = find_set(*sets, c.key);
                return IntResp{set == nullptr ? 0 : static_cast<Count>(set->size())};
            },

            [&](const SDiffCmd& c) -> Response {
                return read_combined(store, SetAlgebra::Diff, c.keys);
            },

            [&](const SUnionCmd& c) -> Response {
                return read_combined(store, SetAlgebra::Union, c.keys);
            },

            [&](const SInterCmd& c) -> Response {
                return read_combined(store, SetAlgebra::Inter, c.keys);
            },

            [&](const SDiffStoreCmd& c) -> Response {
                return store_combined(store, SetAlgebra::Diff, c.destination, c.keys);
            },

            [&](const SUnionStoreCmd& c) -> Response {
                return store_combined(store, SetAlgebra::Union, c.destination, c.keys);
            },

            [&](const SInterStoreCmd& c) -> Response {
                return store_combined(store, SetAlgebra::Inter, c.destination, c.keys);
            },

            [&](const SPopCmd& c) -> Response {
                auto sets = store.sets().write();
                auto it = sets->find(c.key);

                if (!c.count) {
                    if (it == sets->end() || it->second.empty()) {
                        return NilResp{};
                    }
                    std::uniform_int_distribution<std::size_t> dist(0, it->second.size() - 1);
                    auto victim = std::next(it->second.begin(),
                                            static_cast<std::ptrdiff_t>(dist(rng())));
                    Value member = *victim;
                    it->second.erase(victim);
                    return ValueResp{std::move(member)};
                }

                if (it == sets->end()) {
                    return MultiValueResp{};
                }
                auto popped = sample_distinct(it->second, static_cast<std::size_t>(*c.count));
                for (const auto& member : popped) {
                    it->second.erase(member);
                }
                return MultiValueResp{std::move(popped)};
            },

            [&](const SMoveCmd& c) -> Response {
                auto sets = store.sets().write();
                auto src = sets->find(c.source);
                if (src == sets->end() || !src->second.contains(c.member)) {
                    return IntResp{0};
                }
                if (c.source == c.destination) {
                    return IntResp{1};
                }
                // Erase before touching the destination: operator[] may rehash
                // the outer map and invalidate `src`.
                src->second.erase(c.member);
                (*sets)[c.destination].insert(c.member);
                return IntResp{1};
            },

            [&](const SRandMemberCmd& c) -> Response {
                auto sets = store.sets().read();
                const MemberSet* set = find_set(*sets, c.key);

                if (!c.count) {
                    if (set == nullptr || set->empty()) {
                        return NilResp{};
                    }
                    std::uniform_int_distribution<std::size_t> dist(0, set->size() - 1);
                    return ValueResp{*std::next(set->begin(),
                                                static_cast<std::ptrdiff_t>(dist(rng())))};
                }

                if (*c.count < -kMaxRandomPicks) {
                    return ErrorResp{kErrOutOfRange};
                }
                if (set == nullptr || set->empty() || *c.count == 0) {
                    return MultiValueResp{};
                }
                if (*c.count > 0) {
                    return MultiValueResp{
                        sample_distinct(*set, static_cast<std::size_t>(*c.count))};
                }

                // Negative count: exactly |count| picks, repeats allowed.
                const auto picks = static_cast<std::size_t>(-*c.count);
                const std::vector<Value> members = to_vector(*set);
                std::uniform_int_distribution<std::size_t> dist(0, members.size() - 1);
                std::vector<Value> out;
                out.reserve(picks);
                for (std::size_t i = 0; i < picks; ++i) {
                    out.push_back(members[dist(rng())]);
                }
                return MultiValueResp{std::move(out)};
            },
        },
        cmd);
}

} // namespace polykv
