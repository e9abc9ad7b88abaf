#pragma once

#include "Timer.hpp"
#include <functional>
#include <istream>
#include <cstdint>
#include <utility>
#include <vector>
#include <string>
#include <limits>

using std::numeric_limits;
using std::function;
using std::vector;
using std::string;
using std::pair;

namespace hapsyn{

inline bool HAPSYN_DEBUG = false;

inline const string DEBUG_BANNER = "\n"
        "================================================\n"
        "                 DEBUG MODE ON                  \n"
        "================================================\n\n";

using interval_t = pair<int64_t,int64_t>;

/**
 * Split a line on runs of whitespace (spaces or tabs), discarding empty tokens
 * @param line text to be split, not modified
 * @param tokens result, cleared before use
 */
void split_whitespace(const string& line, vector<string>& tokens);

/**
 * Strict integer parse, the whole token must be consumed
 * @return false if the token is empty, has trailing characters, or is out of range
 */
bool parse_int64(const string& token, int64_t& result);

/**
 * Strict floating point parse, the whole token must be consumed and the value must be finite
 */
bool parse_double(const string& token, double& result);

uint64_t get_peak_memory_usage();

/**
 * Iterate the lines of a stream. Trailing carriage returns are stripped.
 * @param f lambda to operate on each line, along with its 1-based line number
 */
void for_line_in_stream(std::istream& input, const function<void(const string& line, int64_t line_number)>& f);

}
