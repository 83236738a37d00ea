
#ifndef wd_utils_wd_string_utils_h
#define wd_utils_wd_string_utils_h

#include <string>
#include <vector>
#include <cstdarg>

namespace wd_utils
{

namespace wd_string_utils
{

/// Empty fields are dropped.
std::vector<std::string> split(const std::string& str, char delim);

/// Splits on any run of whitespace, dropping empty tokens. Used for the xs:list
/// valued WS-Discovery elements (XAddrs, Types, Scopes).
std::vector<std::string> split_whitespace(const std::string& str);

std::string format(const char* fmt, ...);
std::string format(const char* fmt, va_list& args);

bool contains(const std::string& str, const std::string& target);

inline bool is_space(char a) { return (a == ' ' || a == '\n' || a == '\t' || a == '\r'); }

bool is_integer(const std::string& str, bool canHaveSign=true);

std::string lstrip(const std::string& str);
std::string rstrip(const std::string& str);
std::string strip(const std::string& str);

int s_to_int(const std::string& s);
double s_to_double(const std::string& s);

}

}

#endif
