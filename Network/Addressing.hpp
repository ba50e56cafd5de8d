// Network/Addressing.hpp: разбор CIDR, маски и схемы адресации TAP.
#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace UruncNet
{
    /**
     * @brief CIDR блок IPv4.
     */
    struct CidrV4
    {
        std::uint32_t addr_be = 0; ///< Адрес в big-endian.
        std::uint8_t  prefix  = 0; ///< Длина префикса.
    };

    /**
     * @brief Разобрать строку IPv4 CIDR в структуру CidrV4.
     * @param s Строка формата "A.B.C.D/len". Если "/len" опущен, берётся 32.
     * @param out Куда записать адрес/префикс.
     * @return true при успехе.
     */
    bool parse_cidr4(const std::string &s, CidrV4 &out);

    /**
     * @brief Вернуть строку сети вида "A.B.C.D/p" (обнуляя хостовые биты).
     */
    std::string to_network_cidr(const CidrV4 &c);

    /// Адрес без префикса: "A.B.C.D".
    std::string to_address(const CidrV4 &c);

    /**
     * @brief Маска по длине префикса в шестнадцатеричном виде ядра: 24 -> "ffffff00".
     */
    std::string prefix_to_mask_hex(std::uint8_t prefix);

    /**
     * @brief Шестнадцатеричная маска -> dotted-decimal: "ffffff00" -> "255.255.255.0".
     * @return std::nullopt, если строка не 8 hex-символов.
     */
    std::optional<std::string> mask_hex_to_dotted(const std::string &hex);

    /// Подставить значение вместо 'X' в шаблоне адреса/имени.
    std::string ExpandTemplate(const std::string &tmpl, int value);

    /// Имя TAP по индексу: 0 -> "tap0_urunc".
    std::string TapName(int index);

    /// Адрес песочницы в динамической схеме: 0 -> "172.16.1.2/24".
    std::string DynamicSandboxAddress(int index);

    /// Адрес шлюза (на TAP) в динамической схеме: 0 -> "172.16.1.1/24".
    std::string DynamicGatewayAddress(int index);
} // namespace UruncNet
