#ifndef REGION_CONSTRAINT_STORE_GUARD_RCS_REGION_VID_HH
#define REGION_CONSTRAINT_STORE_GUARD_RCS_REGION_VID_HH

#include <concepts>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>

#include <fmt/ostream.h>

namespace rcs
{
    /**
     * \brief An inference region variable, identified by its index.
     *
     * Use rcs::operator""_vid to create a literal, for example 3_vid.
     *
     * \ingroup Core
     */
    struct RegionVid final
    {
        unsigned long long index;

        constexpr explicit RegionVid(unsigned long long x) :
            index(x)
        {
        }

        [[nodiscard]] auto to_string() const -> std::string
        {
            return "'?" + std::to_string(index);
        }

        [[nodiscard]] constexpr auto operator<=>(const RegionVid &) const = default;
    };

    /**
     * \brief A strongly connected component of the region graph. This is
     * the usual key type after MemberConstraintSet::into_mapped() has
     * collapsed each RegionVid onto its component.
     *
     * Use rcs::operator""_scc to create a literal, for example 2_scc.
     *
     * \ingroup Core
     */
    struct ConstraintSccIndex final
    {
        unsigned long long index;

        constexpr explicit ConstraintSccIndex(unsigned long long x) :
            index(x)
        {
        }

        [[nodiscard]] auto to_string() const -> std::string
        {
            return "scc" + std::to_string(index);
        }

        [[nodiscard]] constexpr auto operator<=>(const ConstraintSccIndex &) const = default;
    };

    auto operator<<(std::ostream &, const RegionVid &) -> std::ostream &;

    auto operator<<(std::ostream &, const ConstraintSccIndex &) -> std::ostream &;

    /**
     * \brief Create a RegionVid literal, for example 3_vid.
     *
     * \ingroup Core
     */
    [[nodiscard]] constexpr inline auto operator"" _vid(unsigned long long v) -> RegionVid
    {
        return RegionVid(v);
    }

    /**
     * \brief Create a ConstraintSccIndex literal, for example 2_scc.
     *
     * \ingroup Core
     */
    [[nodiscard]] constexpr inline auto operator"" _scc(unsigned long long v) -> ConstraintSccIndex
    {
        return ConstraintSccIndex(v);
    }

    /**
     * Anything a MemberConstraintSet can group its constraints by. Keys are
     * copied freely and hashed into the head map. If a key is also
     * formattable, it is named when a caller asks about a key that has no
     * constraints.
     *
     * \ingroup Core
     */
    template <typename T_>
    concept RegionKey = std::copyable<T_> && std::equality_comparable<T_> && requires(const T_ & r) {
        {
            std::hash<T_>{}(r)
        } -> std::convertible_to<std::size_t>;
    };
}

template <>
struct std::hash<rcs::RegionVid>
{
    [[nodiscard]] inline auto operator()(const rcs::RegionVid & v) const noexcept -> std::size_t
    {
        return hash<unsigned long long>{}(v.index);
    }
};

template <>
struct std::hash<rcs::ConstraintSccIndex>
{
    [[nodiscard]] inline auto operator()(const rcs::ConstraintSccIndex & v) const noexcept -> std::size_t
    {
        return hash<unsigned long long>{}(v.index);
    }
};

template <>
struct fmt::formatter<rcs::RegionVid> : ostream_formatter
{
};

template <>
struct fmt::formatter<rcs::ConstraintSccIndex> : ostream_formatter
{
};

#endif
