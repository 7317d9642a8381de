#include <gtest/gtest.h>
#include "hostaddr/resolver.hpp"
#include <net/if.h>

using namespace hostaddr;

namespace {

InterfaceRecord make_record(std::optional<RawAddress> address, InterfaceFlags flags) {
    InterfaceRecord record;
    record.name = "test0";
    record.address = address;
    record.flags = flags;
    return record;
}

} // namespace

TEST(InterfaceFlagsTest, FromNativeBits) {
    auto flags = InterfaceFlags::from_native(IFF_UP | IFF_LOOPBACK | IFF_RUNNING);
    EXPECT_TRUE(flags.contains(InterfaceFlag::UP));
    EXPECT_TRUE(flags.contains(InterfaceFlag::LOOPBACK));
    EXPECT_TRUE(flags.contains(InterfaceFlag::RUNNING));
    EXPECT_FALSE(flags.contains(InterfaceFlag::BROADCAST));
    EXPECT_EQ(flags, (InterfaceFlags{InterfaceFlag::UP, InterfaceFlag::LOOPBACK, InterfaceFlag::RUNNING}));
    EXPECT_EQ(flags.to_string(), "up,loopback,running");
}

TEST(InterfaceFlagsTest, EmptySet) {
    InterfaceFlags flags;
    EXPECT_TRUE(flags.empty());
    EXPECT_EQ(flags.to_string(), "");
}

TEST(UsabilityFilterTest, IgnoresLoopback) {
    EXPECT_FALSE(is_usable({InterfaceFlag::UP, InterfaceFlag::LOOPBACK, InterfaceFlag::RUNNING},
                           RawAddress{IPv4Address{{127, 0, 0, 1}}}));
}

TEST(UsabilityFilterTest, IgnoresLoopbackNetOnOrdinaryInterface) {
    EXPECT_FALSE(is_usable({InterfaceFlag::UP, InterfaceFlag::BROADCAST,
                            InterfaceFlag::MULTICAST, InterfaceFlag::RUNNING},
                           RawAddress{IPv4Address{{127, 1, 0, 0}}}));
}

TEST(UsabilityFilterTest, IgnoresIPv6Localhost) {
    EXPECT_FALSE(is_usable({InterfaceFlag::UP, InterfaceFlag::RUNNING},
                           RawAddress{IPv6Address{{0, 0, 0, 0, 0, 0, 0, 1}}}));
}

TEST(UsabilityFilterTest, AcceptsGlobalAddressOnLoopbackInterface) {
    EXPECT_TRUE(is_usable({InterfaceFlag::UP, InterfaceFlag::LOOPBACK, InterfaceFlag::RUNNING},
                          RawAddress{IPv4Address{{192, 0, 2, 11}}}));
}

TEST(UsabilityFilterTest, IgnoresInterfaceThatIsNotUp) {
    EXPECT_FALSE(is_usable({InterfaceFlag::BROADCAST, InterfaceFlag::MULTICAST},
                           RawAddress{IPv4Address{{192, 0, 2, 12}}}));
}

TEST(UsabilityFilterTest, AcceptsUpInterface) {
    EXPECT_TRUE(is_usable({InterfaceFlag::BROADCAST, InterfaceFlag::MULTICAST, InterfaceFlag::UP},
                          RawAddress{IPv4Address{{192, 0, 2, 12}}}));
}

TEST(UsabilityFilterTest, IgnoresMissingAddress) {
    EXPECT_FALSE(is_usable({InterfaceFlag::UP, InterfaceFlag::LOOPBACK}, std::nullopt));
}

TEST(UsableAddressTest, FormatsUsableIPv4) {
    auto address = usable_address(make_record(
        IPv4Address{{192, 0, 2, 12}},
        {InterfaceFlag::BROADCAST, InterfaceFlag::MULTICAST, InterfaceFlag::UP}));
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(*address, "192.0.2.12");
}

TEST(UsableAddressTest, FormatsUsableIPv6) {
    auto address = usable_address(make_record(
        IPv6Address{{8193, 1712, 5, 2439, 0, 0, 0, 1}},
        {InterfaceFlag::BROADCAST, InterfaceFlag::MULTICAST, InterfaceFlag::UP}));
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(*address, "[2001:6b0:5:987::1]");
}

TEST(UsableAddressTest, IgnoresLoopback) {
    EXPECT_FALSE(usable_address(make_record(
        IPv4Address{{127, 0, 0, 1}},
        {InterfaceFlag::UP, InterfaceFlag::LOOPBACK, InterfaceFlag::RUNNING})).has_value());
}

TEST(UsableAddressesTest, MixedInterfaceList) {
    std::vector<InterfaceRecord> records = {
        // valid
        make_record(IPv4Address{{192, 0, 2, 11}},
                    {InterfaceFlag::BROADCAST, InterfaceFlag::MULTICAST, InterfaceFlag::UP}),
        // invalid (127.0.0.1)
        make_record(IPv4Address{{127, 0, 0, 1}},
                    {InterfaceFlag::BROADCAST, InterfaceFlag::MULTICAST, InterfaceFlag::UP}),
        // invalid (not up)
        make_record(IPv4Address{{192, 0, 2, 10}},
                    {InterfaceFlag::BROADCAST, InterfaceFlag::MULTICAST}),
        // valid (loopback interface)
        make_record(IPv4Address{{192, 0, 2, 12}},
                    {InterfaceFlag::LOOPBACK, InterfaceFlag::UP}),
        // invalid (no address)
        make_record(std::nullopt, {InterfaceFlag::LOOPBACK, InterfaceFlag::UP}),
    };

    EXPECT_EQ(usable_addresses(records),
              (std::vector<std::string>{"192.0.2.11", "192.0.2.12"}));
}

TEST(UsableAddressesTest, KeepsInputOrderAndDuplicates) {
    InterfaceFlags up{InterfaceFlag::UP};
    std::vector<InterfaceRecord> records = {
        make_record(IPv4Address{{198, 51, 100, 1}}, up),
        make_record(IPv4Address{{192, 0, 2, 1}}, up),
        make_record(IPv4Address{{198, 51, 100, 1}}, up),
    };

    EXPECT_EQ(usable_addresses(records),
              (std::vector<std::string>{"198.51.100.1", "192.0.2.1", "198.51.100.1"}));
}

TEST(UsableAddressesTest, EmptyInput) {
    EXPECT_TRUE(usable_addresses({}).empty());
}
