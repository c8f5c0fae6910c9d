#pragma once
#include <string>

namespace ams {

// Random RFC 4122 version 4 UUID in canonical 8-4-4-4-12 form.
std::string uuid4();

// Current UTC time as YYYY-MM-DDTHH:MM:SS.ffffffZ.
std::string utc_now_iso();

} // namespace ams
