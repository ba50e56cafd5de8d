#include "TAP.hpp"
#include "Logger.hpp"

#include <cerrno>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <linux/if.h>
#include <linux/if_tun.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace
{
    void CloseAll(std::vector<int> &fds)
    {
        for (int fd : fds)
        {
            ::close(fd);
        }
        fds.clear();
    }
}

int TapAlloc(const std::string &interface_name,
             int                queues,
             std::uint32_t      uid,
             std::uint32_t      gid)
{
    if (interface_name.empty() || interface_name.size() >= IFNAMSIZ || queues < 1)
    {
        return -EINVAL;
    }

    std::vector<int> fds;
    fds.reserve(static_cast<std::size_t>(queues));

    for (int q = 0; q < queues; ++q)
    {
        int descriptor = ::open("/dev/net/tun", O_RDWR | O_CLOEXEC);
        if (descriptor < 0)
        {
            const int err = errno;
            LOGE("tap") << "open /dev/net/tun failed: " << std::strerror(err);
            CloseAll(fds);
            return -err;
        }

        struct ifreq request {};
        request.ifr_flags = IFF_TAP | IFF_NO_PI | IFF_MULTI_QUEUE;
        std::strncpy(request.ifr_name, interface_name.c_str(), IFNAMSIZ - 1);

        if (::ioctl(descriptor, TUNSETIFF, (void *)&request) < 0)
        {
            const int err = errno;
            LOGE("tap") << "ioctl TUNSETIFF failed for " << interface_name
                        << " queue=" << q << ": " << std::strerror(err);
            ::close(descriptor);
            CloseAll(fds);
            return -err;
        }
        fds.push_back(descriptor);
    }

    // Владелец и persist задаются на любом из дескрипторов очередей
    const int first = fds.front();
    if (::ioctl(first, TUNSETOWNER, static_cast<unsigned long>(uid)) < 0)
    {
        const int err = errno;
        LOGE("tap") << "ioctl TUNSETOWNER failed: " << std::strerror(err);
        CloseAll(fds);
        return -err;
    }
    if (::ioctl(first, TUNSETGROUP, static_cast<unsigned long>(gid)) < 0)
    {
        const int err = errno;
        LOGE("tap") << "ioctl TUNSETGROUP failed: " << std::strerror(err);
        CloseAll(fds);
        return -err;
    }
    if (::ioctl(first, TUNSETPERSIST, 1UL) < 0)
    {
        const int err = errno;
        LOGE("tap") << "ioctl TUNSETPERSIST failed: " << std::strerror(err);
        CloseAll(fds);
        return -err;
    }

    CloseAll(fds);
    LOGD("tap") << "TAP allocated: " << interface_name
                << " queues=" << queues << " owner=" << uid << ":" << gid;
    return 0;
}
