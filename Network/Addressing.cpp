#include "Addressing.hpp"
#include "Types.hpp"

#include <cctype>
#include <cstdio>
#include <cstring>
#include <sstream>

#include <arpa/inet.h>

namespace UruncNet
{
    bool parse_cidr4(const std::string &s, CidrV4 &out)
    {
        auto pos = s.find('/');
        std::string ip = (pos == std::string::npos) ? s : s.substr(0, pos);

        int pref = 32;
        if (pos != std::string::npos)
        {
            const std::string len = s.substr(pos + 1);
            if (len.empty() || len.size() > 2) return false;
            for (char c : len)
            {
                if (!std::isdigit(static_cast<unsigned char>(c))) return false;
            }
            pref = std::stoi(len);
        }
        if (pref < 0 || pref > 32) return false;

        in_addr ia{};
        if (inet_pton(AF_INET, ip.c_str(), &ia) != 1) return false;
        // inet_pton кладёт в network byte order: это и есть big-endian
        std::memcpy(&out.addr_be, &ia.s_addr, sizeof(out.addr_be));
        out.prefix = static_cast<std::uint8_t>(pref);
        return true;
    }

    std::string to_network_cidr(const CidrV4 &c)
    {
        std::uint32_t be = c.addr_be;
        std::uint32_t host = (c.prefix == 0)  ? 0xFFFFFFFFu
                           : (c.prefix >= 32) ? 0u
                           : (0xFFFFFFFFu >> c.prefix);
        std::uint32_t net_be = be & ~htonl(host);
        in_addr ia{};
        std::memcpy(&ia.s_addr, &net_be, sizeof(net_be));
        char buf[INET_ADDRSTRLEN]{};
        inet_ntop(AF_INET, &ia, buf, sizeof(buf));
        std::ostringstream oss;
        oss << buf << "/" << static_cast<int>(c.prefix);
        return oss.str();
    }

    std::string to_address(const CidrV4 &c)
    {
        in_addr ia{};
        std::memcpy(&ia.s_addr, &c.addr_be, sizeof(c.addr_be));
        char buf[INET_ADDRSTRLEN]{};
        inet_ntop(AF_INET, &ia, buf, sizeof(buf));
        return buf;
    }

    std::string prefix_to_mask_hex(std::uint8_t prefix)
    {
        const std::uint32_t mask = (prefix == 0) ? 0u
                                 : (prefix >= 32) ? 0xFFFFFFFFu
                                 : (0xFFFFFFFFu << (32 - prefix));
        char buf[9]{};
        std::snprintf(buf, sizeof(buf), "%08x", mask);
        return buf;
    }

    std::optional<std::string> mask_hex_to_dotted(const std::string &hex)
    {
        if (hex.size() != 8) return std::nullopt;

        std::ostringstream oss;
        for (std::size_t i = 0; i < 8; i += 2)
        {
            const char hi = hex[i];
            const char lo = hex[i + 1];
            if (!std::isxdigit(static_cast<unsigned char>(hi)) ||
                !std::isxdigit(static_cast<unsigned char>(lo)))
            {
                return std::nullopt;
            }
            const int octet = std::stoi(hex.substr(i, 2), nullptr, 16);
            if (i != 0) oss << '.';
            oss << octet;
        }
        return oss.str();
    }

    std::string ExpandTemplate(const std::string &tmpl, int value)
    {
        const std::string v = std::to_string(value);
        std::string out;
        out.reserve(tmpl.size() + v.size());
        for (char c : tmpl)
        {
            if (c == 'X') out += v;
            else out.push_back(c);
        }
        return out;
    }

    std::string TapName(int index)
    {
        return ExpandTemplate(DefaultTap, index);
    }

    std::string DynamicSandboxAddress(int index)
    {
        return ExpandTemplate(DynamicNetworkTapIP, index + 1) + "/" + std::to_string(SubnetPrefix);
    }

    std::string DynamicGatewayAddress(int index)
    {
        return ExpandTemplate(DynamicNetworkGatewayIP, index + 1) + "/" + std::to_string(SubnetPrefix);
    }
} // namespace UruncNet
