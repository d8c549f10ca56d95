#include "filevault/format.hpp"

#include <array>
#include <iomanip>
#include <sstream>
#include <string_view>

namespace filevault
{

    std::string format_size(std::uint64_t bytes)
    {
        if (bytes == 1)
        {
            return "1 Byte";
        }
        if (bytes < 1000)
        {
            return std::to_string(bytes) + " Bytes";
        }

        static constexpr std::array<std::string_view, 6> kUnits{"kB", "MB", "GB", "TB", "PB", "EB"};
        auto value = static_cast<double>(bytes) / 1000.0;
        std::size_t unit = 0;
        while (value >= 1000.0 && unit + 1 < kUnits.size())
        {
            value /= 1000.0;
            ++unit;
        }
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1) << value << ' ' << kUnits[unit];
        return oss.str();
    }

} // namespace filevault
