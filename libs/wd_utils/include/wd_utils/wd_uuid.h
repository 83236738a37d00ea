
#ifndef wd_utils_wd_uuid_h
#define wd_utils_wd_uuid_h

#include <string>

namespace wd_utils
{

namespace wd_uuid
{

/// A random (version 4) uuid in lower case canonical form, e.g.
/// "1b4e28ba-2fa1-41d2-883f-0016d3cca427".
std::string generate();

}

}

#endif
