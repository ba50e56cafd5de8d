#include "Errors.hpp"

namespace UruncNet
{
    const char *ToString(ErrorKind kind)
    {
        switch (kind)
        {
            case ErrorKind::Precondition:     return "precondition";
            case ErrorKind::Capacity:         return "capacity";
            case ErrorKind::Policy:           return "policy";
            case ErrorKind::InvalidParameter: return "invalid-parameter";
            case ErrorKind::KernelOperation:  return "kernel-operation";
            case ErrorKind::Introspection:    return "introspection";
        }
        return "unknown";
    }

    bool IsLinkNotFound(const NetworkError &error)
    {
        return error.Kind() == ErrorKind::KernelOperation &&
               std::string(error.what()).find(LinkNotFoundMessage) != std::string::npos;
    }
} // namespace UruncNet
