
#include "wd_utils/wd_string_utils.h"
#include "wd_utils/wd_exception.h"
#include <stdarg.h>
#include <ctype.h>
#include <string.h>
#include <stdio.h>
#include <algorithm>
#include <stdexcept>

using namespace wd_utils;
using namespace std;

vector<string> wd_utils::wd_string_utils::split(const string& str, char delim)
{
    vector<string> parts;

    size_t begin = 0;

    while(begin < str.size())
    {
        auto end = str.find(delim, begin);
        if(end == string::npos)
            end = str.size();

        if(end != begin)
            parts.emplace_back(str, begin, end - begin);

        begin = end + 1;
    }

    return parts;
}

vector<string> wd_utils::wd_string_utils::split_whitespace(const string& str)
{
    vector<string> tokens;

    size_t pos = 0;
    const size_t len = str.length();

    while(pos < len)
    {
        while(pos < len && is_space(str[pos]))
            ++pos;

        size_t start = pos;

        while(pos < len && !is_space(str[pos]))
            ++pos;

        if(pos > start)
            tokens.emplace_back(str, start, pos - start);
    }

    return tokens;
}

string wd_utils::wd_string_utils::format(const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    const string result = format(fmt, args);
    va_end(args);
    return result;
}

string wd_utils::wd_string_utils::format(const char* fmt, va_list& args)
{
    va_list newargs;
    va_copy(newargs, args);

    int chars_written = vsnprintf(nullptr, 0, fmt, newargs);
    int len = chars_written + 1;

    vector<char> str(len);

    va_end(newargs);

    va_copy(newargs, args);
    vsnprintf(&str[0], len, fmt, newargs);

    va_end(newargs);

    return string(&str[0]);
}

bool wd_utils::wd_string_utils::contains(const string& str, const string& target)
{
    return (str.find(target) != string::npos) ? true : false;
}

static bool verify_digit(char c)
{
    return isdigit((unsigned char)c) != 0;
}

bool wd_utils::wd_string_utils::is_integer(const string& str, bool canHaveSign)
{
    const string stripped = strip(str);

    if(stripped.empty())
        return false;

    size_t first = 0;
    if(stripped[0] == '-' || stripped[0] == '+')
    {
        if(!canHaveSign)
            return false;
        first = 1;
    }

    if(first == stripped.size())
        return false;

    return all_of(stripped.begin() + first, stripped.end(), verify_digit);
}

string wd_utils::wd_string_utils::lstrip(const string& str)
{
    string retval = str;
    size_t pos = 0;
    while(pos < retval.size() && wd_utils::wd_string_utils::is_space(retval[pos])) pos++;
    retval.erase(0, pos);
    return retval;
}

string wd_utils::wd_string_utils::rstrip(const string& str)
{
    string retval = str;
    size_t pos = retval.size();
    while(pos > 0 && wd_utils::wd_string_utils::is_space(retval[pos - 1])) pos--;
    retval.erase(pos);
    return retval;
}

string wd_utils::wd_string_utils::strip(const string& str)
{
    auto retval = wd_utils::wd_string_utils::rstrip(str);
    return wd_utils::wd_string_utils::lstrip(retval);
}

int wd_utils::wd_string_utils::s_to_int(const string& s)
{
    if(!is_integer(s))
        WD_STHROW(wd_invalid_argument_exception, ("Not an integer: \"%s\"", s.c_str()));

    try
    {
        return stoi(strip(s));
    }
    catch(const out_of_range&)
    {
        WD_STHROW(wd_invalid_argument_exception, ("Integer out of range: \"%s\"", s.c_str()));
    }
}

double wd_utils::wd_string_utils::s_to_double(const string& s)
{
    auto stripped = strip(s);
    size_t consumed = 0;
    double val = 0.0;

    try
    {
        val = stod(stripped, &consumed);
    }
    catch(const exception&)
    {
        WD_STHROW(wd_invalid_argument_exception, ("Not a number: \"%s\"", s.c_str()));
    }

    if(consumed != stripped.size())
        WD_STHROW(wd_invalid_argument_exception, ("Not a number: \"%s\"", s.c_str()));

    return val;
}
