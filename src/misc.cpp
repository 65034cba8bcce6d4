#include "misc.hpp"

#include <stdexcept>
#include <cstdlib>
#include <cerrno>
#include <cmath>

using std::runtime_error;
using std::to_string;


namespace MlMath{


bool is_separator(char c){
    return c == ',' or c == ' ' or c == '\t' or c == '\r' or c == '\n';
}


double parse_token(const string& token, size_t line_number){
    const char* begin = token.c_str();
    char* end = nullptr;

    errno = 0;
    double x = std::strtod(begin, &end);

    if (end == begin){
        throw runtime_error("ERROR: parse_token cannot parse '" + token + "' on line " + to_string(line_number));
    }

    if (size_t(end - begin) != token.size()){
        throw runtime_error("ERROR: parse_token trailing characters in '" + token + "' on line " + to_string(line_number));
    }

    // Underflow also sets ERANGE but still yields a usable (subnormal or zero) value
    if (errno == ERANGE and std::abs(x) == HUGE_VAL){
        throw runtime_error("ERROR: parse_token value out of range '" + token + "' on line " + to_string(line_number));
    }

    return x;
}


void parse_line(const string& line, size_t line_number, vector<double>& result){
    string token;

    for (auto c: line){
        if (c == '#'){
            break;
        }

        if (is_separator(c)){
            if (not token.empty()){
                result.emplace_back(parse_token(token, line_number));
                token.clear();
            }
        }
        else{
            token += c;
        }
    }

    if (not token.empty()){
        result.emplace_back(parse_token(token, line_number));
    }
}


void for_each_value(istream& input, const function<void(double)>& f){
    string line;
    vector<double> values;
    size_t line_number = 0;

    while (std::getline(input, line)){
        line_number++;

        values.clear();
        parse_line(line, line_number, values);

        for (auto x: values){
            f(x);
        }
    }

    if (input.bad()){
        throw runtime_error("ERROR: for_each_value failed while reading line " + to_string(line_number + 1));
    }
}


}
