#include "Timer.hpp"

using std::to_string;

namespace hapsyn{

Timer::Timer():
        start(steady_clock::now())
{}


milliseconds Timer::elapsed_milliseconds() const {
    return duration_cast<milliseconds>(steady_clock::now() - start);
}


string Timer::elapsed() const {
    auto d = elapsed_milliseconds();

    const auto h = duration_cast<hours>(d);
    const auto m = duration_cast<minutes>(d - h);
    const auto s = duration_cast<seconds>(d - h - m);
    const auto ms = d - h - m - s;

    return "[" + to_string(h.count()) + "h " +
           to_string(m.count()) + "m " +
           to_string(s.count()) + "s " +
           to_string(ms.count()) + "ms] ";
}


}

ostream& operator<<(ostream& o, const hapsyn::Timer& t) {
    o << t.elapsed();

    return o;
}
