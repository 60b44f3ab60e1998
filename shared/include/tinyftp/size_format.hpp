/**
 * TinyFTP - Human readable byte counts for progress output.
 */
#pragma once

#include <cstdint>
#include <string>

namespace tinyftp
{

    // Divides by 1024 while the value is above 1024 (at most five times) and
    // prints the result with two decimals and a unit suffix, e.g. "10.00MB".
    std::string format_size(std::uint64_t bytes);

} // namespace tinyftp
