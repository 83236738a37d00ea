
#include "wd_utils/wd_args.h"
#include "wd_utils/wd_exception.h"

using namespace wd_utils;
using namespace std;

static const wd_args::option* _find(const vector<wd_args::option>& known, const string& name)
{
    for(auto& o : known)
    {
        if(o.long_name == name || (!o.short_name.empty() && o.short_name == name))
            return &o;
    }

    return nullptr;
}

wd_args::parsed_options wd_utils::wd_args::parse_arguments(int argc, char* argv[], const vector<option>& known)
{
    parsed_options parsed;

    for(int i = 1; i < argc; ++i)
    {
        string token = argv[i];

        if(token.size() < 2 || token[0] != '-')
            WD_STHROW(wd_invalid_argument_exception, ("Unexpected argument: %s", token.c_str()));

        string name = token;
        wd_nullable<string> inline_value;

        auto eq = token.find('=');
        if(token.compare(0, 2, "--") == 0 && eq != string::npos)
        {
            name = token.substr(0, eq);
            inline_value.set_value(token.substr(eq + 1));
        }

        auto opt = _find(known, name);
        if(!opt)
            WD_STHROW(wd_invalid_argument_exception, ("Unrecognized option: %s", name.c_str()));

        if(!opt->takes_value)
        {
            if(inline_value)
                WD_STHROW(wd_invalid_argument_exception, ("%s does not take a value.", opt->long_name.c_str()));

            parsed[opt->long_name] = string();
            continue;
        }

        string value;
        if(inline_value)
            value = inline_value.value();
        else if(i + 1 < argc)
            value = argv[++i];

        if(value.empty())
            WD_STHROW(wd_invalid_argument_exception, ("%s requires a value.", opt->long_name.c_str()));

        parsed[opt->long_name] = value;
    }

    return parsed;
}

bool wd_utils::wd_args::has(const parsed_options& opts, const string& long_name)
{
    return opts.find(long_name) != opts.end();
}

wd_nullable<string> wd_utils::wd_args::value_of(const parsed_options& opts, const string& long_name)
{
    auto found = opts.find(long_name);
    if(found == opts.end() || found->second.empty())
        return wd_nullable<string>();

    return wd_nullable<string>(found->second);
}
