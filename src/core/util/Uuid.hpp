#pragma once

#include <string>

namespace rackscan::core::util {

/**
 * @brief Generates a random RFC 4122 version 4 UUID in canonical text form.
 */
std::string generateUuid();

} // namespace rackscan::core::util
