#pragma once

#include <iostream>
#include <string>
#include <chrono>

using std::chrono::duration_cast;
using std::chrono::steady_clock;

using std::chrono::hours;
using std::chrono::minutes;
using std::chrono::seconds;
using std::chrono::milliseconds;

using std::ostream;
using std::string;


namespace hapsyn{

/**
 * Wall clock stopwatch used as a prefix for progress logging, e.g. `cerr << t << "Loading coords" << '\n'`
 */
class Timer{
    steady_clock::time_point start;

public:
    Timer();

    /// Formatted as "[Xh Xm Xs Xms] " so it can directly precede a log message
    [[nodiscard]] string elapsed() const;
    [[nodiscard]] milliseconds elapsed_milliseconds() const;
};

}

ostream& operator<<(ostream& o, const hapsyn::Timer& t);
