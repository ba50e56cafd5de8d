#include "Logger.hpp"

#include <filesystem>
#include <ios>
#include <iostream>
#include <stdexcept>
#include <system_error>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace expr     = boost::log::expressions;
namespace keywords = boost::log::keywords;

namespace
{
    BOOST_LOG_ATTRIBUTE_KEYWORD(a_severity,  "Severity",  Logger::Severity)
    BOOST_LOG_ATTRIBUTE_KEYWORD(a_channel,   "Channel",   std::string)
    BOOST_LOG_ATTRIBUTE_KEYWORD(a_timestamp, "TimeStamp", boost::posix_time::ptime)

    auto MakeFormatter()
    {
        return expr::stream
               << "[" << expr::format_date_time(a_timestamp, "%Y-%m-%d %H:%M:%S.%f") << "]"
               << " [" << a_severity << "]"
               << " [" << a_channel << "] "
               << expr::smessage;
    }
}

namespace Logger
{
    BOOST_LOG_GLOBAL_LOGGER_DEFAULT(Global, ChannelLogger)

    void Init(const Options &options)
    {
        auto core = boost::log::core::get();
        core->remove_all_sinks();
        boost::log::add_common_attributes();

        if (options.to_console)
        {
            auto sink = boost::log::add_console_log(std::clog);
            sink->set_formatter(MakeFormatter());
            sink->set_filter(a_severity >= options.console_min_severity);
        }

        if (options.to_file)
        {
            std::error_code ec;
            std::filesystem::create_directories(options.directory, ec);
            if (ec)
            {
                throw std::runtime_error("cannot create log directory " + options.directory +
                                         ": " + ec.message());
            }

            const std::string pattern =
                (std::filesystem::path(options.directory) / (options.base_filename + "_%N.log")).string();

            auto sink = boost::log::add_file_log(
                keywords::file_name     = pattern,
                keywords::rotation_size = options.rotation_size,
                keywords::open_mode     = std::ios_base::out | std::ios_base::app,
                keywords::auto_flush    = true);
            sink->set_formatter(MakeFormatter());
            sink->set_filter(a_severity >= options.file_min_severity);
        }

        LOGI("logger") << options.app_name << ": logging initialized";
    }

    void Shutdown() noexcept
    {
        try
        {
            auto core = boost::log::core::get();
            core->flush();
            core->remove_all_sinks();
        }
        catch (const std::exception &e)
        {
            std::cerr << "[logger] shutdown failed: " << e.what() << "\n";
        }
    }

    bool ParseSeverity(const std::string &text, Severity &out)
    {
        return boost::log::trivial::from_string(text.c_str(), text.size(), out);
    }

    Guard::Guard(const Options &options)
    {
        Init(options);
    }

    Guard::~Guard()
    {
        Shutdown();
    }
} // namespace Logger
