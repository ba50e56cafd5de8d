#include "Allocator.hpp"

#include "Core/Logger.hpp"
#include "Errors.hpp"
#include "Types.hpp"

#include <cstring>

namespace UruncNet
{
    int GetTapIndex(Kernel &kernel)
    {
        const std::size_t prefix_len = std::strlen(TapPrefix);

        int count = 0;
        for (const auto &link : kernel.ListLinks())
        {
            if (link.name.compare(0, prefix_len, TapPrefix) == 0)
            {
                ++count;
            }
        }

        if (count > MaxTapIndex)
        {
            throw CapacityError("TAP interfaces count higher than 255");
        }

        LOGD("network") << "tap index: " << count;
        return count;
    }
} // namespace UruncNet
