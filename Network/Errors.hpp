// Network/Errors.hpp: типизированные ошибки сетевой подсистемы.
#pragma once

#include <stdexcept>
#include <string>

namespace UruncNet
{
    enum class ErrorKind
    {
        Precondition,     ///< Нет eth0.
        Capacity,         ///< Индекс TAP вышел за 255.
        Policy,           ///< Вторая песочница в одном namespace (dynamic).
        InvalidParameter, ///< Пустые ссылки на интерфейсы, неверные аргументы.
        KernelOperation,  ///< Отказ ядра/netlink/nftables.
        Introspection     ///< У интерфейса нет MAC/маски/IPv4.
    };

    const char *ToString(ErrorKind kind);

    /**
     * @brief База для всех ошибок подсистемы; все они восстановимы вызывающим.
     */
    class NetworkError : public std::runtime_error
    {
    public:
        NetworkError(ErrorKind kind, const std::string &message)
            : std::runtime_error(message)
            , kind_(kind)
        {
        }

        ErrorKind Kind() const noexcept
        {
            return kind_;
        }

    private:
        ErrorKind kind_;
    };

    class PreconditionError : public NetworkError
    {
    public:
        explicit PreconditionError(const std::string &message)
            : NetworkError(ErrorKind::Precondition, message)
        {
        }
    };

    class CapacityError : public NetworkError
    {
    public:
        explicit CapacityError(const std::string &message)
            : NetworkError(ErrorKind::Capacity, message)
        {
        }
    };

    class PolicyError : public NetworkError
    {
    public:
        explicit PolicyError(const std::string &message)
            : NetworkError(ErrorKind::Policy, message)
        {
        }
    };

    class InvalidParameterError : public NetworkError
    {
    public:
        explicit InvalidParameterError(const std::string &message)
            : NetworkError(ErrorKind::InvalidParameter, message)
        {
        }
    };

    class KernelOperationError : public NetworkError
    {
    public:
        explicit KernelOperationError(const std::string &message)
            : NetworkError(ErrorKind::KernelOperation, message)
        {
        }
    };

    class IntrospectionError : public NetworkError
    {
    public:
        explicit IntrospectionError(const std::string &message)
            : NetworkError(ErrorKind::Introspection, message)
        {
        }
    };

    /// Текст, по которому вызывающие распознают отсутствующий интерфейс.
    inline constexpr const char *LinkNotFoundMessage = "link not found";

    /// true, если ошибка означает «интерфейса уже нет».
    bool IsLinkNotFound(const NetworkError &error);
} // namespace UruncNet
