#include "nodemesh/base/uuid.h"
#include <uuid/uuid.h>

namespace nodemesh {

std::string generate_uuid() {
    uuid_t raw;
    uuid_generate_random(raw);

    char text[37] = {0};
    uuid_unparse_lower(raw, text);
    return std::string(text);
}

bool is_valid_uuid(const std::string& value) {
    uuid_t raw;
    return uuid_parse(value.c_str(), raw) == 0;
}

} // namespace nodemesh
