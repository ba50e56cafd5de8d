// CLI/Tool/Config.hpp: параметры urunc-net: JSON-файл + флаги командной строки.
#pragma once

#include "Network/Types.hpp"

#include <cstdint>
#include <string>

#include <boost/json.hpp>

namespace UruncNet::Tool
{
    struct Config
    {
        std::string   mode          = "static";
        std::uint32_t uid           = 0;
        std::uint32_t gid           = 0;
        std::string   log_dir       = "logs";
        std::string   log_level     = "info";
        std::string   console_level = "debug";
    };

    /**
     * @brief Применяет JSON-объект к cfg; ключи, которых нет, оставляют значение по умолчанию.
     * @throws std::runtime_error если текст не JSON-объект или значение не того типа.
     */
    void ApplyConfigJson(const std::string &text, Config &cfg);

    /// Читает файл и вызывает ApplyConfigJson.
    void LoadConfigFile(const std::string &path, Config &cfg);

    /// Дескриптор для печати в stdout.
    boost::json::object ToJson(const UnikernelNetworkInfo &info);
} // namespace UruncNet::Tool
