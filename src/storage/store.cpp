#include "storage/store.hpp"

#include <unordered_set>

namespace polykv {

namespace {

// Appends the keys of `map` not already in `seen`.
template <typename Map>
void collect_keys(const Map& map, std::unordered_set<Key>& seen, std::vector<Key>& out) {
    for (const auto& [k, _] : map) {
        if (seen.insert(k).second) {
            out.push_back(k);
        }
    }
}

} // anonymous namespace

std::vector<Key> Store::keys() const {
    std::unordered_set<Key> seen;
    std::vector<Key> result;

    // One lock at a time; each guard is released at the end of its block.
    {
        auto strings = strings_.read();
        collect_keys(*strings, seen, result);
    }
    {
        auto hashes = hashes_.read();
        collect_keys(*hashes, seen, result);
    }
    {
        auto sets = sets_.read();
        collect_keys(*sets, seen, result);
    }
    {
        auto lists = lists_.read();
        collect_keys(*lists, seen, result);
    }
    return result;
}

} // namespace polykv
