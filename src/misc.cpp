#include "misc.hpp"

#include <stdexcept>
#include <cctype>
#include <iostream>
#include <fstream>
#include <cstdlib>
#include <cerrno>
#include <string>
#include <vector>
#include <cmath>

using std::runtime_error;
using std::ifstream;
using std::string;
using std::vector;
using std::cerr;


namespace hapsyn{


void split_whitespace(const string& line, vector<string>& tokens){
    tokens.clear();

    string token;
    for (auto c: line){
        if (c == ' ' or c == '\t' or c == '\r' or c == '\n'){
            if (not token.empty()){
                tokens.emplace_back(std::move(token));
                token.clear();
            }
            continue;
        }

        token += c;
    }

    if (not token.empty()){
        tokens.emplace_back(std::move(token));
    }
}


bool parse_int64(const string& token, int64_t& result){
    if (token.empty()){
        return false;
    }

    char* end = nullptr;
    errno = 0;
    long long value = std::strtoll(token.c_str(), &end, 10);

    if (errno == ERANGE or end != token.c_str() + token.size()){
        return false;
    }

    result = value;
    return true;
}


bool parse_double(const string& token, double& result){
    if (token.empty()){
        return false;
    }

    char* end = nullptr;
    errno = 0;
    double value = std::strtod(token.c_str(), &end);

    if (errno == ERANGE or end != token.c_str() + token.size() or not std::isfinite(value)){
        return false;
    }

    result = value;
    return true;
}


uint64_t get_peak_memory_usage(){
    uint64_t peak_memory_usage = 0;

    ifstream status_file("/proc/self/status");

    if (not status_file.is_open()){
        return peak_memory_usage;
    }

    // Looking for a line like "VmHWM:     12345 kB"
    string line;
    while (std::getline(status_file, line)){
        if (line.rfind("VmHWM", 0) != 0){
            continue;
        }

        size_t i = line.find(':');
        while (i < line.size() and not isdigit(static_cast<unsigned char>(line[i]))){
            i++;
        }

        char* end;
        peak_memory_usage = std::strtoull(line.c_str() + i, &end, 10);
        break;
    }

    return peak_memory_usage;
}


void for_line_in_stream(std::istream& input, const function<void(const string& line, int64_t line_number)>& f){
    string line;
    int64_t line_number = 0;

    while (std::getline(input, line)){
        line_number++;

        if (not line.empty() and line.back() == '\r'){
            line.pop_back();
        }

        f(line, line_number);
    }

    if (input.bad()){
        throw runtime_error("ERROR: stream failed after line " + std::to_string(line_number));
    }
}


}
