#pragma once

#include <cstdint>
#include <string>

namespace filevault
{

    // Decimal units: "1 Byte", "10 Bytes", "1.0 kB", "10.5 MB".
    std::string format_size(std::uint64_t bytes);

} // namespace filevault
