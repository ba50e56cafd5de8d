// tests/ManagerTests.cpp
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "FakeKernel.hpp"
#include "Network/Addressing.hpp"
#include "Network/Errors.hpp"
#include "Network/Manager.hpp"
#include "Network/TrafficMirror.hpp"

#include <algorithm>

using namespace UruncNet;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::ThrowsMessage;
using ::testing::UnorderedElementsAre;

using Redirect = Testing::FakeKernel::Redirect;

class ManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        kernel.AddLink("lo");
        kernel.AddLink("eth0", "aa:bb:cc:dd:ee:01", 1450);
        kernel.AddAddress("eth0", "10.0.0.5", "ffffff00");
        kernel.SetGateway("eth0", "10.0.0.1");
    }

    Testing::FakeKernel kernel;
};

// ==================== Factory ====================

TEST_F(ManagerTest, FactoryKnowsStaticAndDynamic)
{
    EXPECT_NE(dynamic_cast<StaticNetwork *>(NewNetworkManager("static", kernel).get()), nullptr);
    EXPECT_NE(dynamic_cast<DynamicNetwork *>(NewNetworkManager("dynamic", kernel).get()), nullptr);
}

TEST_F(ManagerTest, FactoryRejectsUnknownKinds)
{
    for (const std::string kind : { "", "bridge", "Static", "static " })
    {
        std::unique_ptr<Manager> m;
        EXPECT_THAT([&]{ m = NewNetworkManager(kind, kernel); },
                    ThrowsMessage<InvalidParameterError>(
                        HasSubstr("network manager " + kind + " not supported")));
        EXPECT_EQ(m.get(), nullptr);
    }
    EXPECT_THAT(kernel.Calls(), IsEmpty());
}

// ==================== Static ====================

TEST_F(ManagerTest, StaticSetupScenario)
{
    auto manager = NewNetworkManager("static", kernel);
    const auto info = manager->NetworkSetup(1000, 1000);

    UnikernelNetworkInfo expected;
    expected.TapDevice                = "tap0_urunc";
    expected.EthDevice.IP             = "172.16.1.2";
    expected.EthDevice.DefaultGateway = "172.16.1.1";
    expected.EthDevice.Mask           = "255.255.255.0";
    expected.EthDevice.Interface      = "eth0";
    expected.EthDevice.MAC            = "aa:bb:cc:dd:ee:01";
    EXPECT_EQ(info, expected);

    const Link *tap = kernel.Find("tap0_urunc");
    ASSERT_NE(tap, nullptr);
    EXPECT_TRUE(tap->up);
    EXPECT_EQ(tap->mtu, 1450u);
    EXPECT_EQ(kernel.Owners().at("tap0_urunc").uid, 1000u);
    EXPECT_EQ(kernel.Owners().at("tap0_urunc").gid, 1000u);

    const auto addrs = kernel.Addresses("tap0_urunc");
    ASSERT_EQ(addrs.size(), 1u);
    EXPECT_EQ(addrs[0].local, "172.16.1.1");
    EXPECT_EQ(addrs[0].mask_hex, "ffffff00");

    EXPECT_THAT(kernel.Redirects(),
                UnorderedElementsAre(Redirect{ "eth0", "tap0_urunc" },
                                     Redirect{ "tap0_urunc", "eth0" }));

    ASSERT_EQ(kernel.Masquerade().size(), 1u);
    EXPECT_EQ(kernel.Masquerade()[0].first,  "eth0");
    EXPECT_EQ(kernel.Masquerade()[0].second, "172.16.1.0/24");
    EXPECT_TRUE(kernel.IpForward());
}

TEST_F(ManagerTest, StaticIgnoresExistingTapCount)
{
    kernel.AddLink("tapother");
    const auto info = NewNetworkManager("static", kernel)->NetworkSetup(0, 0);
    EXPECT_EQ(info.TapDevice, "tap0_urunc");
}

TEST_F(ManagerTest, StaticSecondSetupCollides)
{
    auto manager = NewNetworkManager("static", kernel);
    manager->NetworkSetup(0, 0);
    EXPECT_THROW(manager->NetworkSetup(0, 0), KernelOperationError);
}

TEST_F(ManagerTest, SetupClearsStaleRulesOnEth0)
{
    const Link eth0 = *kernel.Find("eth0");
    const Link old  = kernel.AddLink("old0", "02:00:00:00:00:99");
    AddIngressQdisc(kernel, &eth0);
    AddRedirectFilter(kernel, &eth0, &old);

    NewNetworkManager("static", kernel)->NetworkSetup(0, 0);

    EXPECT_THAT(kernel.Redirects(),
                UnorderedElementsAre(Redirect{ "eth0", "tap0_urunc" },
                                     Redirect{ "tap0_urunc", "eth0" }));
}

TEST_F(ManagerTest, IngressQdiscPrecedesRedirect)
{
    NewNetworkManager("dynamic", kernel)->NetworkSetup(0, 0);

    const auto &calls = kernel.Calls();
    const auto first_qdisc  = std::find(calls.begin(), calls.end(), "AddIngressQdisc");
    const auto first_filter = std::find(calls.begin(), calls.end(), "AddRedirectFilter");
    ASSERT_NE(first_qdisc, calls.end());
    ASSERT_NE(first_filter, calls.end());
    EXPECT_LT(first_qdisc - calls.begin(), first_filter - calls.begin());
    EXPECT_EQ(std::count(calls.begin(), calls.end(), "AddIngressQdisc"), 2);
    EXPECT_EQ(std::count(calls.begin(), calls.end(), "AddRedirectFilter"), 2);
}

TEST_F(ManagerTest, MissingEth0IsPrecondition)
{
    Testing::FakeKernel bare;
    bare.AddLink("lo");

    for (const char *kind : { "static", "dynamic" })
    {
        EXPECT_THAT([&]{ NewNetworkManager(kind, bare)->NetworkSetup(0, 0); },
                    ThrowsMessage<PreconditionError>(
                        HasSubstr("failed to find eth0 interface: eth0 device not found")));
    }
    EXPECT_TRUE(bare.Owners().empty());
}

TEST_F(ManagerTest, NoRollbackOnFailure)
{
    kernel.FailOn("EnsureMasquerade");
    EXPECT_THROW(NewNetworkManager("static", kernel)->NetworkSetup(0, 0), KernelOperationError);

    // TAP остаётся; убирает его Cleanup
    EXPECT_NE(kernel.Find("tap0_urunc"), nullptr);
    Cleanup(kernel, "tap0_urunc");
    EXPECT_EQ(kernel.Find("tap0_urunc"), nullptr);
}

// ==================== Dynamic ====================

TEST_F(ManagerTest, DynamicSetupScenario)
{
    auto manager = NewNetworkManager("dynamic", kernel);

    const auto info = manager->NetworkSetup(1000, 1000);
    EXPECT_EQ(info.TapDevice, "tap0_urunc");
    EXPECT_EQ(info.EthDevice.IP, "172.16.1.2");
    EXPECT_EQ(info.EthDevice.DefaultGateway, "172.16.1.1");
    EXPECT_EQ(info.EthDevice.Mask, "255.255.255.0");
    EXPECT_EQ(info.EthDevice.Interface, "eth0");
    EXPECT_EQ(info.EthDevice.MAC, "aa:bb:cc:dd:ee:01");

    EXPECT_TRUE(kernel.Masquerade().empty());
    EXPECT_FALSE(kernel.IpForward());

    EXPECT_THAT([&]{ manager->NetworkSetup(1000, 1000); },
                ThrowsMessage<PolicyError>(
                    HasSubstr("can't spawn multiple unikernels in the same network namespace")));
    EXPECT_EQ(kernel.Find("tap1_urunc"), nullptr);
}

TEST_F(ManagerTest, DynamicDescriptorMatchesAddressPlan)
{
    const auto info = NewNetworkManager("dynamic", kernel)->NetworkSetup(0, 0);

    CidrV4 sandbox{};
    CidrV4 gateway{};
    ASSERT_TRUE(parse_cidr4(DynamicSandboxAddress(0), sandbox));
    ASSERT_TRUE(parse_cidr4(DynamicGatewayAddress(0), gateway));
    EXPECT_EQ(info.EthDevice.IP, to_address(sandbox));
    EXPECT_EQ(info.EthDevice.DefaultGateway, to_address(gateway));

    const auto addrs = kernel.Addresses(info.TapDevice);
    ASSERT_EQ(addrs.size(), 1u);
    EXPECT_EQ(addrs[0].local, to_address(gateway));
    EXPECT_EQ(mask_hex_to_dotted(addrs[0].mask_hex).value_or(""), info.EthDevice.Mask);
}

TEST_F(ManagerTest, DynamicRejectsPrecomputedIndexAboveZero)
{
    kernel.AddLink("tap5");
    EXPECT_THROW(NewNetworkManager("dynamic", kernel)->NetworkSetup(0, 0), PolicyError);
}

// ==================== Cleanup ====================

TEST_F(ManagerTest, CleanupUndoesSetup)
{
    NewNetworkManager("static", kernel)->NetworkSetup(0, 0);
    Cleanup(kernel, "tap0_urunc");

    EXPECT_EQ(kernel.Find("tap0_urunc"), nullptr);
    EXPECT_THAT(kernel.Redirects(), IsEmpty());
    EXPECT_THAT(kernel.Qdiscs("eth0"), IsEmpty());
    EXPECT_NE(kernel.Find("eth0"), nullptr);
}

TEST_F(ManagerTest, CleanupMissingDeviceIsLinkNotFound)
{
    try
    {
        Cleanup(kernel, "nonexistent-device");
        FAIL() << "expected an error";
    }
    catch (const NetworkError &e)
    {
        EXPECT_TRUE(IsLinkNotFound(e));
        EXPECT_THAT(e.what(), HasSubstr("link not found"));
    }
}

TEST_F(ManagerTest, CleanupOfPartialSetup)
{
    kernel.FailOn("AddRedirectFilter");
    EXPECT_THROW(NewNetworkManager("dynamic", kernel)->NetworkSetup(0, 0), KernelOperationError);

    EXPECT_NO_THROW(Cleanup(kernel, "tap0_urunc"));
    EXPECT_EQ(kernel.Find("tap0_urunc"), nullptr);
    EXPECT_THAT(kernel.Qdiscs("eth0"), IsEmpty());
}

TEST_F(ManagerTest, CleanupContinuesPastRuleRemovalFailures)
{
    NewNetworkManager("static", kernel)->NetworkSetup(0, 0);
    kernel.FailOn("DeleteFilter");
    kernel.FailOn("DeleteQdisc");

    EXPECT_NO_THROW(Cleanup(kernel, "tap0_urunc"));
    EXPECT_EQ(kernel.Find("tap0_urunc"), nullptr);
}

TEST_F(ManagerTest, CleanupWithoutEth0)
{
    Testing::FakeKernel bare;
    const Link tap = bare.AddLink("tap0_urunc", "02:00:00:00:00:02");
    AddIngressQdisc(bare, &tap);

    EXPECT_NO_THROW(Cleanup(bare, "tap0_urunc"));
    EXPECT_EQ(bare.Find("tap0_urunc"), nullptr);
}

TEST_F(ManagerTest, CleanupTwiceSecondIsLinkNotFound)
{
    NewNetworkManager("dynamic", kernel)->NetworkSetup(0, 0);
    Cleanup(kernel, "tap0_urunc");
    EXPECT_THAT([&]{ Cleanup(kernel, "tap0_urunc"); },
                ThrowsMessage<KernelOperationError>(HasSubstr("link not found")));
}
