#include "Config.hpp"

#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace UruncNet::Tool
{
    void ApplyConfigJson(const std::string &text, Config &cfg)
    {
        boost::json::value jv = boost::json::parse(text);
        if (!jv.is_object())
        {
            throw std::runtime_error("config: top-level value must be an object");
        }
        const auto &o = jv.as_object();

        auto set_str = [&](const char *key, std::string &dst)
        {
            if (const auto *pv = o.if_contains(key))
            {
                if (!pv->is_string())
                {
                    throw std::runtime_error(std::string("config: '") + key + "' must be a string");
                }
                dst = std::string(pv->as_string().c_str());
            }
        };

        auto set_id = [&](const char *key, std::uint32_t &dst)
        {
            if (const auto *pv = o.if_contains(key))
            {
                std::int64_t v = -1;
                if (pv->is_int64())
                {
                    v = pv->as_int64();
                }
                else if (pv->is_uint64() && pv->as_uint64() <= std::numeric_limits<std::uint32_t>::max())
                {
                    v = static_cast<std::int64_t>(pv->as_uint64());
                }
                if (v < 0 || v > std::numeric_limits<std::uint32_t>::max())
                {
                    throw std::runtime_error(std::string("config: '") + key + "' is not a valid id");
                }
                dst = static_cast<std::uint32_t>(v);
            }
        };

        set_str("mode",          cfg.mode);
        set_id ("uid",           cfg.uid);
        set_id ("gid",           cfg.gid);
        set_str("log_dir",       cfg.log_dir);
        set_str("log_level",     cfg.log_level);
        set_str("console_level", cfg.console_level);
    }

    void LoadConfigFile(const std::string &path, Config &cfg)
    {
        std::ifstream in(path);
        if (!in)
        {
            throw std::runtime_error("config: cannot open " + path);
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        ApplyConfigJson(ss.str(), cfg);
    }

    boost::json::object ToJson(const UnikernelNetworkInfo &info)
    {
        boost::json::object eth;
        eth["IP"]             = info.EthDevice.IP;
        eth["DefaultGateway"] = info.EthDevice.DefaultGateway;
        eth["Mask"]           = info.EthDevice.Mask;
        eth["Interface"]      = info.EthDevice.Interface;
        eth["MAC"]            = info.EthDevice.MAC;

        boost::json::object out;
        out["TapDevice"] = info.TapDevice;
        out["EthDevice"] = std::move(eth);
        return out;
    }
} // namespace UruncNet::Tool
