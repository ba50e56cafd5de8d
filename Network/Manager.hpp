// Network/Manager.hpp: стратегии адресации песочницы (static/dynamic) и общий teardown.
#pragma once

#include "Kernel.hpp"
#include "Types.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace UruncNet
{
    /**
     * @brief Стратегия настройки сети для одной песочницы.
     *
     * NetworkSetup не откатывает частично созданное при ошибке:
     * вызывающий обязан выполнить Cleanup.
     */
    class Manager
    {
    public:
        virtual ~Manager() = default;

        /**
         * @brief Создаёт TAP для песочницы uid:gid и связывает его с eth0.
         * @return Имя TAP и адресация, которую песочница должна выставить у себя.
         */
        virtual UnikernelNetworkInfo NetworkSetup(std::uint32_t uid, std::uint32_t gid) = 0;
    };

    /**
     * @brief tap0_urunc, 172.16.1.1/24 на TAP, 172.16.1.2 песочнице, masquerade через eth0.
     */
    class StaticNetwork final : public Manager
    {
    public:
        explicit StaticNetwork(Kernel &kernel)
            : kernel_(kernel)
        {
        }

        UnikernelNetworkInfo NetworkSetup(std::uint32_t uid, std::uint32_t gid) override;

    private:
        Kernel &kernel_;
    };

    /**
     * @brief tap<i>_urunc, подсеть 172.16.<i+1>.0/24, без NAT.
     *
     * Одна песочница на namespace: индекс больше 0: PolicyError.
     */
    class DynamicNetwork final : public Manager
    {
    public:
        explicit DynamicNetwork(Kernel &kernel)
            : kernel_(kernel)
        {
        }

        UnikernelNetworkInfo NetworkSetup(std::uint32_t uid, std::uint32_t gid) override;

    private:
        Kernel &kernel_;
    };

    /**
     * @brief Стратегия по имени: "static" или "dynamic".
     * @throws InvalidParameterError "network manager <kind> not supported".
     */
    std::unique_ptr<Manager> NewNetworkManager(const std::string &kind, Kernel &kernel);

    /**
     * @brief Снимает фильтры и qdisc TAP (и eth0, если он есть) и удаляет TAP.
     *
     * Ошибки снятия правил пишутся в лог и не прерывают очистку.
     *
     * @throws KernelOperationError "link not found", если TAP нет; отказ удаления TAP.
     */
    void Cleanup(Kernel &kernel, const std::string &tap_name);
} // namespace UruncNet
