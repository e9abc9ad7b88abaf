#pragma once

#include <string>

using std::string;


namespace hapsyn {

class Sequence{
public:
    string name;
    string sequence;

    Sequence(const string& name, const string& sequence);
    Sequence()=default;

    bool operator==(const Sequence& other) const;
};

}
