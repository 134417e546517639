/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef REGION_CONSTRAINT_STORE_GUARD_RCS_EXCEPTION_HH
#define REGION_CONSTRAINT_STORE_GUARD_RCS_EXCEPTION_HH

#include <exception>
#include <string>
#include <version>

#if __has_include(<source_location>) && __cpp_lib_source_location
#  include <source_location>
#endif

namespace rcs
{
    /**
     * \brief Thrown if something has gone wrong. This always indicates a bug
     * in whatever is calling the store, not a problem with the program being
     * compiled, and should abort the current compilation.
     *
     * \ingroup Core
     */
    class UnexpectedException : public std::exception
    {
    private:
        std::string _wat;

    public:
        explicit UnexpectedException(const std::string &);

        virtual auto what() const noexcept -> const char * override;
    };

    /**
     * \brief Thrown if a MemberConstraintIndex is used with a set that did not
     * create it, with a set that has since been consumed by
     * MemberConstraintSet::into_mapped(), or is out of range.
     *
     * \ingroup Core
     */
    class InvalidConstraintIndex : public UnexpectedException
    {
    public:
#if __has_include(<source_location>) && __cpp_lib_source_location
        explicit InvalidConstraintIndex(const std::string & msg, const std::source_location & = std::source_location::current());
#else
        explicit InvalidConstraintIndex(const std::string & msg);
#endif
    };

    /**
     * \brief Thrown if the caller asks for the constraints of a member region
     * that it believed had some, but that has none.
     *
     * \ingroup Core
     */
    class UnknownMemberRegion : public UnexpectedException
    {
    public:
#if __has_include(<source_location>) && __cpp_lib_source_location
        explicit UnknownMemberRegion(const std::string & msg, const std::source_location & = std::source_location::current());
#else
        explicit UnknownMemberRegion(const std::string & msg);
#endif
    };

    /**
     * \brief Thrown if a MemberConstraintSet is added to or remapped after
     * it has been consumed by MemberConstraintSet::into_mapped() or moved
     * from.
     *
     * \ingroup Core
     */
    class ConsumedSetUsed : public UnexpectedException
    {
    public:
#if __has_include(<source_location>) && __cpp_lib_source_location
        explicit ConsumedSetUsed(const std::string & operation, const std::source_location & = std::source_location::current());
#else
        explicit ConsumedSetUsed(const std::string & operation);
#endif
    };
}

#endif
