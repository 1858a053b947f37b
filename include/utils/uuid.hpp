#pragma once

#include <string>

namespace pmsim {

// Random v4 UUID, used for user and trade ids
std::string generate_uuid();

} // namespace pmsim
