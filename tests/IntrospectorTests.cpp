// tests/IntrospectorTests.cpp
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "FakeKernel.hpp"
#include "Network/Errors.hpp"
#include "Network/Introspector.hpp"

using namespace UruncNet;
using ::testing::HasSubstr;
using ::testing::ThrowsMessage;

class IntrospectorTest : public ::testing::Test
{
protected:
    Testing::FakeKernel kernel;
};

TEST_F(IntrospectorTest, ReadsEth0)
{
    kernel.AddLink("eth0", "aa:bb:cc:dd:ee:01");
    kernel.AddAddress("eth0", "10.0.0.5", "ffffff00");
    kernel.SetGateway("eth0", "10.0.0.1");

    const auto info = GetInterfaceInfo(kernel, "eth0");
    EXPECT_EQ(info.IP, "10.0.0.5");
    EXPECT_EQ(info.Mask, "255.255.255.0");
    EXPECT_EQ(info.DefaultGateway, "10.0.0.1");
    EXPECT_EQ(info.MAC, "aa:bb:cc:dd:ee:01");
    EXPECT_EQ(info.Interface, "eth0");
}

TEST_F(IntrospectorTest, InterfaceLabelIsAlwaysDefault)
{
    kernel.AddLink("ens3", "aa:bb:cc:dd:ee:02");
    kernel.AddAddress("ens3", "192.168.0.10", "ffff0000");

    const auto info = GetInterfaceInfo(kernel, "ens3");
    EXPECT_EQ(info.Interface, "eth0");
    EXPECT_EQ(info.Mask, "255.255.0.0");
}

TEST_F(IntrospectorTest, GatewayIsBestEffort)
{
    kernel.AddLink("eth0", "aa:bb:cc:dd:ee:01");
    kernel.AddAddress("eth0", "10.0.0.5", "ff000000");

    const auto info = GetInterfaceInfo(kernel, "eth0");
    EXPECT_TRUE(info.DefaultGateway.empty());
    EXPECT_EQ(info.Mask, "255.0.0.0");
}

TEST_F(IntrospectorTest, MissingInterface)
{
    EXPECT_THAT([&]{ GetInterfaceInfo(kernel, "nonexistent-name"); },
                ThrowsMessage<IntrospectionError>(HasSubstr("no such network interface")));
}

TEST_F(IntrospectorTest, LoopbackHasNoMac)
{
    kernel.AddLink("lo");
    kernel.AddAddress("lo", "127.0.0.1", "ff000000");

    EXPECT_THAT([&]{ GetInterfaceInfo(kernel, "lo"); },
                ThrowsMessage<IntrospectionError>(HasSubstr("failed to get MAC address")));
}

TEST_F(IntrospectorTest, NoIPv4Address)
{
    kernel.AddLink("eth1", "aa:bb:cc:dd:ee:03");

    EXPECT_THAT([&]{ GetInterfaceInfo(kernel, "eth1"); },
                ThrowsMessage<IntrospectionError>(HasSubstr("failed to find IPv4 address")));
}

TEST_F(IntrospectorTest, MalformedMask)
{
    kernel.AddLink("eth1", "aa:bb:cc:dd:ee:03");
    kernel.AddAddress("eth1", "10.0.0.5", "");

    EXPECT_THAT([&]{ GetInterfaceInfo(kernel, "eth1"); },
                ThrowsMessage<IntrospectionError>(HasSubstr("failed to find mask")));
}

TEST_F(IntrospectorTest, EnsureEth0Exists)
{
    EXPECT_THAT([&]{ EnsureEth0Exists(kernel); },
                ThrowsMessage<PreconditionError>(HasSubstr("eth0 device not found")));

    kernel.AddLink("eth00");
    EXPECT_THROW(EnsureEth0Exists(kernel), PreconditionError);

    kernel.AddLink("eth0", "aa:bb:cc:dd:ee:01");
    EXPECT_NO_THROW(EnsureEth0Exists(kernel));
}
