// Main.cpp: urunc-net: настройка и снятие сети песочницы на хосте

#include "Config.hpp"
#include "Core/Logger.hpp"
#include "Network/Allocator.hpp"
#include "Network/Errors.hpp"
#include "Network/Linux/NetlinkKernel.hpp"
#include "Network/Manager.hpp"

#include <unistd.h>

#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace
{
    void PrintUsage()
    {
        std::cout
            << "Usage: urunc-net setup [--mode static|dynamic] [--uid N] [--gid N] [--config FILE]\n"
               "       urunc-net cleanup <tap>\n"
               "       urunc-net index\n"
               "Common: [--log-dir DIR] [--log-level LEVEL] [--config FILE]\n";
    }

    std::uint32_t ParseId(const std::string &flag, const std::string &value)
    {
        std::size_t pos = 0;
        const unsigned long v = std::stoul(value, &pos);
        if (pos != value.size() || v > 0xFFFFFFFFul)
        {
            throw std::invalid_argument("Invalid " + flag + ": " + value);
        }
        return static_cast<std::uint32_t>(v);
    }

    Logger::Options MakeLoggerOptions(const UruncNet::Tool::Config &cfg)
    {
        Logger::Options options;
        options.app_name      = "urunc-net";
        options.directory     = cfg.log_dir;
        options.base_filename = "urunc-net";

        if (!Logger::ParseSeverity(cfg.log_level, options.file_min_severity))
        {
            throw std::invalid_argument("Invalid log level: " + cfg.log_level);
        }
        if (!Logger::ParseSeverity(cfg.console_level, options.console_min_severity))
        {
            throw std::invalid_argument("Invalid console level: " + cfg.console_level);
        }
        return options;
    }
}

int main(int argc,
         char **argv)
{
    if (argc < 2)
    {
        PrintUsage();
        return 1;
    }

    const std::string command = argv[1];
    if (command == "-h" || command == "--help")
    {
        PrintUsage();
        return 0;
    }

    UruncNet::Tool::Config cfg;
    std::string tap_name;

    // Сначала конфиг, потом флаги: флаги перекрывают файл
    try
    {
        for (int i = 2; i < argc; ++i)
        {
            if (std::string(argv[i]) == "--config" && i + 1 < argc)
            {
                UruncNet::Tool::LoadConfigFile(argv[i + 1], cfg);
            }
        }

        for (int i = 2; i < argc; ++i)
        {
            std::string a = argv[i];
            if (a == "--config" && i + 1 < argc)
            {
                ++i;
            }
            else if (a == "--mode" && i + 1 < argc)
            {
                cfg.mode = argv[++i];
            }
            else if (a == "--uid" && i + 1 < argc)
            {
                cfg.uid = ParseId(a, argv[++i]);
            }
            else if (a == "--gid" && i + 1 < argc)
            {
                cfg.gid = ParseId(a, argv[++i]);
            }
            else if (a == "--log-dir" && i + 1 < argc)
            {
                cfg.log_dir = argv[++i];
            }
            else if (a == "--log-level" && i + 1 < argc)
            {
                cfg.log_level = argv[++i];
            }
            else if (command == "cleanup" && tap_name.empty() && a.rfind("--", 0) != 0)
            {
                tap_name = a;
            }
            else
            {
                std::cerr << "Unknown argument: " << a << "\n";
                PrintUsage();
                return 1;
            }
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Arguments: " << e.what() << "\n";
        return 1;
    }

    std::unique_ptr<Logger::Guard> logger;
    try
    {
        logger = std::make_unique<Logger::Guard>(MakeLoggerOptions(cfg));
    }
    catch (const std::exception &e)
    {
        std::cerr << "Logger: " << e.what() << "\n";
        return 1;
    }

    LOGI("cli") << "Startup: command=" << command;
    // Конфиг читался до инициализации логгера: печатаем итог здесь
    LOGD("cli") << "Config: mode=" << cfg.mode << " uid=" << cfg.uid << " gid=" << cfg.gid
                << " log_dir=" << cfg.log_dir << " log_level=" << cfg.log_level
                << " console_level=" << cfg.console_level;

    try
    {
        if (geteuid() != 0)
        {
            LOGE("cli") << "Privilege check failed: root required";
            throw std::runtime_error("Root privileges are required.");
        }

        UruncNet::NetlinkKernel kernel;

        if (command == "setup")
        {
            LOGI("cli") << "Args: mode=" << cfg.mode << " uid=" << cfg.uid << " gid=" << cfg.gid;

            auto manager = UruncNet::NewNetworkManager(cfg.mode, kernel);
            const auto info = manager->NetworkSetup(cfg.uid, cfg.gid);

            std::cout << boost::json::serialize(UruncNet::Tool::ToJson(info)) << std::endl;
        }
        else if (command == "cleanup")
        {
            if (tap_name.empty())
            {
                throw std::invalid_argument("cleanup: tap device name is required");
            }

            try
            {
                UruncNet::Cleanup(kernel, tap_name);
            }
            catch (const UruncNet::NetworkError &e)
            {
                if (!UruncNet::IsLinkNotFound(e))
                {
                    throw;
                }
                LOGW("cli") << "Cleanup: " << e.what() << " (ignored)";
            }
        }
        else if (command == "index")
        {
            std::cout << UruncNet::GetTapIndex(kernel) << std::endl;
        }
        else
        {
            PrintUsage();
            throw std::invalid_argument("Unknown command: " + command);
        }
    }
    catch (const UruncNet::NetworkError &e)
    {
        LOGE("cli") << "Fatal (" << UruncNet::ToString(e.Kind()) << "): " << e.what();
        return 1;
    }
    catch (const std::exception &e)
    {
        LOGE("cli") << "Fatal: " << e.what();
        return 1;
    }

    LOGI("cli") << "Shutdown: done";
    return 0;
}
