
#ifndef wd_utils_wd_args_h
#define wd_utils_wd_args_h

#include "wd_utils/wd_nullable.h"
#include <map>
#include <string>
#include <vector>

namespace wd_utils
{

namespace wd_args
{

struct option
{
    std::string long_name;   // "--timeout"
    std::string short_name;  // "-t", or empty
    bool takes_value;
};

/// Values keyed by long name. A flag maps to an empty string.
typedef std::map<std::string, std::string> parsed_options;

/// Accepts "--name value", "--name=value" and "-n value" for options that take
/// a value, and "--name" / "-n" for flags. The token after a valued option is
/// always its value, even when it starts with '-'. A repeated option keeps its
/// last value. Unknown options, positional arguments, a missing or empty value,
/// and a value given to a flag throw wd_invalid_argument_exception.
parsed_options parse_arguments(int argc, char* argv[], const std::vector<option>& known);

bool has(const parsed_options& opts, const std::string& long_name);

wd_nullable<std::string> value_of(const parsed_options& opts, const std::string& long_name);

}

}

#endif
