
#include "wd_utils/wd_exception.h"

using namespace std;
using namespace wd_utils;

wd_exception::wd_exception(const string& msg) :
    exception(),
    _msg(msg)
{
}

wd_exception::~wd_exception() noexcept
{
}

const char* wd_exception::what() const noexcept
{
    return _msg.c_str();
}

wd_io_exception::wd_io_exception(const string& msg, int error_code) :
    wd_exception(msg),
    _error_code(error_code)
{
}
