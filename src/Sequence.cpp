#include "Sequence.hpp"


namespace hapsyn {


Sequence::Sequence(const string& name, const string& sequence):
        name(name),
        sequence(sequence)
{}


bool Sequence::operator==(const Sequence& other) const{
    return name == other.name and sequence == other.sequence;
}

} // hapsyn
