#ifndef REGION_CONSTRAINT_STORE_GUARD_RCS_OPAQUE_TYPE_HH
#define REGION_CONSTRAINT_STORE_GUARD_RCS_OPAQUE_TYPE_HH

#include <iosfwd>
#include <string>

#include <fmt/ostream.h>

namespace rcs
{
    /**
     * \brief A range of source text, used to point diagnostics at the place
     * where a hidden type was instantiated.
     *
     * \ingroup Core
     */
    struct Span final
    {
        unsigned file = 0;
        unsigned long long lo = 0;
        unsigned long long hi = 0;
    };

    /**
     * \brief The concrete type hiding behind an opaque type, in which a
     * member region appears. Only ever rendered by diagnostics.
     *
     * \ingroup Core
     */
    struct HiddenType final
    {
        std::string description;
    };

    /**
     * \brief Identifies which opaque type instantiation gave rise to a
     * member constraint.
     *
     * \ingroup Core
     */
    struct OpaqueTypeKey final
    {
        unsigned long long def_index = 0;
        std::string name;
    };

    auto operator<<(std::ostream &, const Span &) -> std::ostream &;

    auto operator<<(std::ostream &, const HiddenType &) -> std::ostream &;

    auto operator<<(std::ostream &, const OpaqueTypeKey &) -> std::ostream &;
}

template <>
struct fmt::formatter<rcs::Span> : ostream_formatter
{
};

template <>
struct fmt::formatter<rcs::HiddenType> : ostream_formatter
{
};

template <>
struct fmt::formatter<rcs::OpaqueTypeKey> : ostream_formatter
{
};

#endif
