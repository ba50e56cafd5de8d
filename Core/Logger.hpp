// Core/Logger.hpp: общий логгер на Boost.Log: консоль + файл с ротацией, каналы по подсистемам.
#pragma once

#include <cstddef>
#include <string>

#include <boost/log/trivial.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>

namespace Logger
{
    using Severity      = boost::log::trivial::severity_level;
    using ChannelLogger = boost::log::sources::severity_channel_logger_mt<Severity, std::string>;

    /**
     * @brief Настройки приёмников (sinks) логгера.
     */
    struct Options
    {
        std::string app_name      = "urunc-net"; ///< Имя приложения в первой записи лога.
        std::string directory     = "logs";      ///< Каталог для файлов лога.
        std::string base_filename = "urunc-net"; ///< Префикс имени файла (без расширения).

        Severity file_min_severity    = boost::log::trivial::info;  ///< Порог для файла.
        Severity console_min_severity = boost::log::trivial::debug; ///< Порог для консоли.

        bool        to_file       = true;             ///< Писать ли в файл.
        bool        to_console    = true;             ///< Писать ли в stderr.
        std::size_t rotation_size = 10 * 1024 * 1024; ///< Размер файла до ротации, байт.
    };

    /**
     * @brief Инициализирует sinks и общие атрибуты (TimeStamp, ThreadID).
     * @param options Настройки.
     * @throws std::runtime_error если каталог лога нельзя создать.
     */
    void Init(const Options &options);

    /**
     * @brief Сбрасывает буферы и снимает все sinks.
     */
    void Shutdown() noexcept;

    /**
     * @brief Разбирает имя уровня ("trace", "debug", "info", "warning", "error", "fatal").
     * @param text Имя уровня.
     * @param out Куда записать уровень.
     * @return true при успехе.
     */
    bool ParseSeverity(const std::string &text, Severity &out);

    /**
     * @brief RAII-обёртка: Init в конструкторе, Shutdown в деструкторе.
     */
    class Guard
    {
    public:
        explicit Guard(const Options &options);
        ~Guard();

        Guard(const Guard &)            = delete;
        Guard &operator=(const Guard &) = delete;
    };

    BOOST_LOG_GLOBAL_LOGGER(Global, ChannelLogger)
} // namespace Logger

#define LOG_CHANNEL_SEV(channel, sev) \
    BOOST_LOG_CHANNEL_SEV(::Logger::Global::get(), std::string(channel), ::boost::log::trivial::sev)

#define LOGT(channel) LOG_CHANNEL_SEV(channel, trace)
#define LOGD(channel) LOG_CHANNEL_SEV(channel, debug)
#define LOGI(channel) LOG_CHANNEL_SEV(channel, info)
#define LOGW(channel) LOG_CHANNEL_SEV(channel, warning)
#define LOGE(channel) LOG_CHANNEL_SEV(channel, error)
#define LOGF(channel) LOG_CHANNEL_SEV(channel, fatal)
