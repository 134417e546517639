#include <rcs/exception.hh>

using namespace rcs;

#if __has_include(<source_location>) && __cpp_lib_source_location
using std::source_location;
#endif
using std::string;
#if __has_include(<source_location>) && __cpp_lib_source_location
using std::to_string;
#endif

UnexpectedException::UnexpectedException(const string & w) :
    _wat("unexpected problem: " + w)
{
}

auto UnexpectedException::what() const noexcept -> const char *
{
    return _wat.c_str();
}

#if __has_include(<source_location>) && __cpp_lib_source_location

namespace
{
    auto where_does_it_hurt(const source_location & where) -> string
    {
        return string{where.file_name()} + ":" + to_string(where.line()) + " in " + string{where.function_name()};
    }
}

InvalidConstraintIndex::InvalidConstraintIndex(const string & msg, const source_location & where) :
    UnexpectedException{"invalid member constraint index: " + msg + " at " + where_does_it_hurt(where)}
{
}

UnknownMemberRegion::UnknownMemberRegion(const string & msg, const source_location & where) :
    UnexpectedException{"no member constraints for " + msg + " at " + where_does_it_hurt(where)}
{
}

ConsumedSetUsed::ConsumedSetUsed(const string & operation, const source_location & where) :
    UnexpectedException{operation + " called on a consumed member constraint set at " + where_does_it_hurt(where)}
{
}

#else

InvalidConstraintIndex::InvalidConstraintIndex(const string & msg) :
    UnexpectedException{"invalid member constraint index: " + msg + ", source location not supported by your compiler"}
{
}

UnknownMemberRegion::UnknownMemberRegion(const string & msg) :
    UnexpectedException{"no member constraints for " + msg + ", source location not supported by your compiler"}
{
}

ConsumedSetUsed::ConsumedSetUsed(const string & operation) :
    UnexpectedException{operation + " called on a consumed member constraint set, source location not supported by your compiler"}
{
}

#endif
