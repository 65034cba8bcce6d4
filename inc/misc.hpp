#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <vector>

using std::function;
using std::istream;
using std::string;
using std::vector;


namespace MlMath{

bool is_separator(char c);

// Convert one complete token to a double, throws if the token is malformed or overflows
double parse_token(const string& token, size_t line_number);

/**
 * Split one line of text into scalar values. Values may be separated by whitespace and/or commas, and anything after
 * a '#' is a comment. Blank lines produce no values.
 * @param line text to be parsed
 * @param line_number 1-based line index, only used for error messages
 * @param result values are appended here
 */
void parse_line(const string& line, size_t line_number, vector<double>& result);

// Call f on every value of the stream, in order, without holding more than one line in memory
void for_each_value(istream& input, const function<void(double)>& f);

}
