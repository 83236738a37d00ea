
#include "wd_utils/wd_uuid.h"
#include <uuid/uuid.h>

using namespace wd_utils;
using namespace std;

string wd_utils::wd_uuid::generate()
{
    uuid_t id;
    uuid_generate_random(id);

    char text[37];
    uuid_unparse_lower(id, text);

    return string(text);
}
