#include "TapController.hpp"

#include "Core/Logger.hpp"
#include "Errors.hpp"

#include <cstdlib>

namespace UruncNet
{
    Link CreateTapDevice(Kernel            &kernel,
                         const std::string &name,
                         int                queues,
                         std::uint32_t      uid,
                         std::uint32_t      gid)
    {
        if (name.empty())
        {
            throw InvalidParameterError("tap device name is empty");
        }
        if (queues < 0)
        {
            throw InvalidParameterError("invalid queue count " + std::to_string(queues) +
                                        " for " + name);
        }
        if (queues == 0)
        {
            queues = 1;
        }

        if (kernel.LinkByName(name))
        {
            throw KernelOperationError("failed to create tap device " + name + ": file exists");
        }

        Link tap = kernel.CreateTap(name, queues, uid, gid);
        kernel.SetLinkUp(tap, 0);
        tap.up = true;

        LOGI("tap") << "created " << name << " queues=" << queues
                    << " owner=" << uid << ":" << gid;
        return tap;
    }

    void DeleteTapDevice(Kernel &kernel, const Link *link)
    {
        if (!link)
        {
            LOGF("tap") << "DeleteTapDevice called with a null link";
            std::abort();
        }

        kernel.DeleteLink(*link);
        LOGI("tap") << "deleted " << link->name;
    }
} // namespace UruncNet
