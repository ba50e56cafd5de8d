#include "TrafficMirror.hpp"

#include "Core/Logger.hpp"
#include "Errors.hpp"

#include <algorithm>

namespace UruncNet
{
    namespace
    {
        bool IsIngressKind(const std::string &kind)
        {
            return kind == "ingress" || kind == "clsact";
        }

        bool HasIngressQdisc(Kernel &kernel, const Link &link)
        {
            const auto qdiscs = kernel.ListQdiscs(link);
            return std::any_of(qdiscs.begin(), qdiscs.end(),
                               [](const Qdisc &q){ return IsIngressKind(q.kind); });
        }
    }

    void AddIngressQdisc(Kernel &kernel, const Link *link)
    {
        if (!link)
        {
            throw InvalidParameterError("link is nil");
        }

        kernel.AddIngressQdisc(*link);
        LOGD("tc") << "ingress qdisc added on " << link->name;
    }

    void AddRedirectFilter(Kernel &kernel, const Link *src, const Link *dst)
    {
        if (!src || !dst)
        {
            throw InvalidParameterError("link is nil");
        }
        if (!HasIngressQdisc(kernel, *src))
        {
            throw KernelOperationError("no ingress qdisc on " + src->name);
        }

        kernel.AddRedirectFilter(*src, *dst);
        LOGD("tc") << "redirect " << src->name << " -> " << dst->name;
    }

    void DeleteAllQdiscs(Kernel &kernel, const Link *link)
    {
        if (!link)
        {
            throw InvalidParameterError("link is nil");
        }

        int removed = 0;
        for (const auto &q : kernel.ListQdiscs(*link))
        {
            // root-qdisc (pfifo_fast, fq_codel, noqueue) не трогаем
            if (!IsIngressKind(q.kind)) continue;

            kernel.DeleteQdisc(*link, q);
            ++removed;
        }
        LOGD("tc") << "removed " << removed << " qdisc(s) from " << link->name;
    }

    void DeleteAllTcFilters(Kernel &kernel, const Link *link)
    {
        if (!link)
        {
            throw InvalidParameterError("link is nil");
        }

        int removed = 0;
        for (const auto &f : kernel.ListFilters(*link, IngressHandle))
        {
            kernel.DeleteFilter(*link, f);
            ++removed;
        }
        LOGD("tc") << "removed " << removed << " filter(s) from " << link->name;
    }
} // namespace UruncNet
