// Network/Types.hpp: адресные дескрипторы и описания объектов ядра.
#pragma once

#include <cstdint>
#include <string>

namespace UruncNet
{
    inline constexpr const char *DefaultInterface = "eth0";       ///< Uplink-интерфейс в namespace песочницы.
    inline constexpr const char *DefaultTap       = "tapX_urunc"; ///< Шаблон имени TAP, X: индекс.
    inline constexpr const char *TapPrefix        = "tap";        ///< Префикс, по которому считаются TAP.

    inline constexpr const char *StaticNetworkTapIP       = "172.16.1.1";
    inline constexpr const char *StaticNetworkUnikernelIP = "172.16.1.2";
    inline constexpr const char *StaticIPAddr             = "172.16.1.1/24";
    inline constexpr const char *StaticNetworkMask        = "255.255.255.0";

    /// Шаблоны динамической схемы, X: (индекс TAP + 1).
    inline constexpr const char *DynamicNetworkTapIP       = "172.16.X.2";
    inline constexpr const char *DynamicNetworkGatewayIP   = "172.16.X.1";

    inline constexpr int SubnetPrefix = 24;
    inline constexpr int TapQueues    = 1;
    inline constexpr int MaxTapIndex  = 255;

    /**
     * @brief Адресные параметры, которые получает сетевой стек песочницы.
     *
     * Все поля: строки (dotted-decimal или colon-hex). Полностью заполненный
     * экземпляр не содержит пустых полей.
     */
    struct Interface
    {
        std::string IP;
        std::string DefaultGateway;
        std::string Mask;
        std::string Interface;
        std::string MAC;

        bool operator==(const struct Interface &) const = default;
    };

    /**
     * @brief Результат NetworkSetup: имя TAP и адресация песочницы.
     */
    struct UnikernelNetworkInfo
    {
        std::string         TapDevice;
        struct Interface    EthDevice;

        bool operator==(const UnikernelNetworkInfo &) const = default;
    };

    /**
     * @brief Снимок сетевого интерфейса хоста.
     */
    struct Link
    {
        std::string  name;
        int          index = 0;
        unsigned int mtu   = 0;
        std::string  mac;        ///< "aa:bb:cc:dd:ee:ff"; пусто, если L2-адреса нет или он нулевой.
        bool         up    = false;
    };

    /// IPv4-адрес интерфейса; маска в шестнадцатеричном виде ядра ("ffffff00").
    struct Ipv4Address
    {
        std::string local;
        std::string mask_hex;
    };

    /// Qdisc, прикреплённый к интерфейсу.
    struct Qdisc
    {
        std::uint32_t handle = 0;
        std::uint32_t parent = 0;
        std::string   kind;
    };

    /// Классификатор tc (достаточно ключа parent/prio/protocol для удаления).
    struct Filter
    {
        std::uint32_t handle   = 0;
        std::uint32_t parent   = 0;
        std::uint16_t priority = 0;
        std::uint16_t protocol = 0;
        std::string   kind;
    };

    /// Хэндл ingress-qdisc ("ffff:"): он же parent для фильтров на приёме.
    inline constexpr std::uint32_t IngressHandle = 0xFFFF0000u;
} // namespace UruncNet
