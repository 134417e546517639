#include <rcs/opaque_type.hh>

#include <ostream>

using namespace rcs;

using std::ostream;

auto rcs::operator<<(ostream & o, const Span & s) -> ostream &
{
    return o << "file" << s.file << ":" << s.lo << "-" << s.hi;
}

auto rcs::operator<<(ostream & o, const HiddenType & t) -> ostream &
{
    return o << t.description;
}

auto rcs::operator<<(ostream & o, const OpaqueTypeKey & k) -> ostream &
{
    return o << k.name << "#" << k.def_index;
}
