#include "tinyftp/size_format.hpp"

#include <array>
#include <iomanip>
#include <sstream>
#include <string_view>

namespace tinyftp
{

    namespace
    {
        constexpr std::size_t kMaxReductions = 5;
        constexpr std::array<std::string_view, kMaxReductions + 1> kSuffixes{"B", "KB", "MB", "GB", "TB", "PB"};
    } // namespace

    std::string format_size(std::uint64_t bytes)
    {
        auto value = static_cast<double>(bytes);
        std::size_t reductions = 0;
        while (value > 1024.0 && reductions < kMaxReductions)
        {
            value /= 1024.0;
            ++reductions;
        }

        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << value << kSuffixes[reductions];
        return oss.str();
    }

} // namespace tinyftp
