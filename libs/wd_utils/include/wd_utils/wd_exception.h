
#ifndef wd_utils_wd_exception_h
#define wd_utils_wd_exception_h

#include "wd_utils/wd_logger.h"
#include "wd_utils/wd_string_utils.h"
#include <string>
#include <exception>
#include <errno.h>
#include <string.h>

namespace wd_utils
{

/// Base of everything the wd_ libraries throw. Messages are formatted by the
/// throw macros below, so the constructors take finished text.
class wd_exception : public std::exception
{
public:
    explicit wd_exception(const std::string& msg);
    virtual ~wd_exception() noexcept;

    virtual const char* what() const noexcept;

private:
    std::string _msg;
};

/// Bad option values, malformed addresses, misuse of an API.
class wd_invalid_argument_exception : public wd_exception
{
public:
    using wd_exception::wd_exception;
};

class wd_internal_exception : public wd_exception
{
public:
    using wd_exception::wd_exception;
};

/// A failed socket operation. error_code() is the errno behind it, or 0 when the
/// failure was detected without a system call (a short send, for instance).
class wd_io_exception : public wd_exception
{
public:
    wd_io_exception(const std::string& msg, int error_code = 0);
    virtual ~wd_io_exception() noexcept {}

    int error_code() const { return _error_code; }

private:
    int _error_code;
};

}

#define WD_THROW(ARGS) \
do { \
    throw wd_utils::wd_exception(wd_utils::wd_string_utils::format ARGS); \
} while(0)

#define WD_STHROW(EXTYPE, ARGS) \
do { \
    throw EXTYPE(wd_utils::wd_string_utils::format ARGS); \
} while(0)

// errno is read before the message is formatted. The thrown text is the
// formatted message followed by ": " and strerror().
#define WD_THROW_ERRNO(ARGS) \
do { \
    int wd_errno_ = errno; \
    throw wd_utils::wd_io_exception(wd_utils::wd_string_utils::format ARGS + ": " + strerror(wd_errno_), wd_errno_); \
} while(0)

// The logger writes each line of a multi-line message separately.
#define WD_LOG_EXCEPTION(E) WD_LOG_ERROR("%s", (E).what())

#endif
