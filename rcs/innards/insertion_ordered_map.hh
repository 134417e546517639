#ifndef REGION_CONSTRAINT_STORE_GUARD_RCS_INNARDS_INSERTION_ORDERED_MAP_HH
#define REGION_CONSTRAINT_STORE_GUARD_RCS_INNARDS_INSERTION_ORDERED_MAP_HH

#include <cstdlib>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rcs::innards
{
    /**
     * \brief A hash map that iterates in the order its keys were first
     * inserted.
     *
     * Assigning to a key that is already present replaces its value but
     * leaves the key where it was in the iteration order. There is no
     * erase, because nothing needs one.
     *
     * \ingroup Innards
     */
    template <typename Key_, typename Value_>
    class InsertionOrderedMap
    {
    private:
        using Entries = std::vector<std::pair<Key_, Value_>>;
        Entries entries;
        std::unordered_map<Key_, std::size_t> positions;

    public:
        InsertionOrderedMap() = default;

        InsertionOrderedMap(const InsertionOrderedMap & other) = default;

        InsertionOrderedMap(InsertionOrderedMap && other) = default;

        ~InsertionOrderedMap() = default;

        auto operator=(const InsertionOrderedMap &) -> InsertionOrderedMap & = default;

        auto operator=(InsertionOrderedMap &&) -> InsertionOrderedMap & = default;

        [[nodiscard]] auto empty() const -> bool
        {
            return entries.empty();
        }

        [[nodiscard]] auto size() const -> std::size_t
        {
            return entries.size();
        }

        auto reserve(std::size_t n) -> void
        {
            entries.reserve(n);
            positions.reserve(n);
        }

        [[nodiscard]] auto contains(const Key_ & key) const -> bool
        {
            return positions.contains(key);
        }

        [[nodiscard]] auto get(const Key_ & key) const -> std::optional<Value_>
        {
            auto p = positions.find(key);
            if (p == positions.end())
                return std::nullopt;
            return entries[p->second].second;
        }

        /**
         * Returns true if the key was new, false if an existing value was
         * replaced.
         */
        auto insert_or_assign(const Key_ & key, Value_ value) -> bool
        {
            auto [p, inserted] = positions.try_emplace(key, entries.size());
            if (inserted)
                entries.emplace_back(key, std::move(value));
            else
                entries[p->second].second = std::move(value);
            return inserted;
        }

        [[nodiscard]] auto begin() const -> typename Entries::const_iterator
        {
            return entries.begin();
        }

        [[nodiscard]] auto end() const -> typename Entries::const_iterator
        {
            return entries.end();
        }
    };
}

#endif
