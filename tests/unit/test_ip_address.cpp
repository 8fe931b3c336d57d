#include <string>
#include <gtest/gtest.h>
#include <boost/asio/ip/address.hpp>
#include "net/ip_address.hpp"

namespace {

using namespace toolguard::net;

TEST(IpAddressTest, ParsesStrictDottedQuad) {
    EXPECT_EQ(ParseIpv4("127.0.0.1").value_or(0), 0x7f000001u);
    EXPECT_EQ(ParseIpv4("255.255.255.255").value_or(0), 0xffffffffu);
    EXPECT_FALSE(ParseIpv4("256.0.0.1"));
    EXPECT_FALSE(ParseIpv4("1.2.3"));
    EXPECT_FALSE(ParseIpv4("1.2.3.4.5"));
    EXPECT_FALSE(ParseIpv4("0127.0.0.1"));
    EXPECT_FALSE(ParseIpv4("1.2.3.4 "));
    EXPECT_FALSE(ParseIpv4(""));
}

TEST(IpAddressTest, ParsesIpv6Forms) {
    const auto loopback = ParseIpv6("::1");
    ASSERT_TRUE(loopback);
    EXPECT_EQ(ToUint128(*loopback), (Uint128{0, 1}));

    const auto mapped = ParseIpv6("::ffff:10.0.0.1");
    ASSERT_TRUE(mapped);
    EXPECT_EQ((*mapped)[5], 0xffff);
    EXPECT_EQ((*mapped)[6], 0x0a00);
    EXPECT_EQ((*mapped)[7], 0x0001);

    EXPECT_TRUE(ParseIpv6("2001:db8:0:0:0:0:0:1"));
    EXPECT_TRUE(ParseIpv6("fe80::1%eth0"));
    EXPECT_FALSE(ParseIpv6("1::2::3"));
    EXPECT_FALSE(ParseIpv6("1:2:3:4:5:6:7"));
    EXPECT_FALSE(ParseIpv6("1:2:3:4:5:6:7:8:9"));
    EXPECT_FALSE(ParseIpv6("12345::"));
    EXPECT_FALSE(ParseIpv6("::ffff:999.0.0.1"));
    EXPECT_FALSE(ParseIpv6("example.com"));
}

TEST(IpAddressTest, CidrMatchingUsesExactWidths) {
    EXPECT_TRUE(Ipv4InCidr(0xc0a80101u, 0xc0a80000u, 16));
    EXPECT_FALSE(Ipv4InCidr(0xc0a90101u, 0xc0a80000u, 16));
    EXPECT_TRUE(Ipv4InCidr(0x01020304u, 0, 0));

    const Uint128 base{0x20010db800000000ULL, 0};
    EXPECT_TRUE(Ipv6InCidr({0x20010db8ffffffffULL, 42}, base, 32));
    EXPECT_FALSE(Ipv6InCidr({0x20010db900000000ULL, 0}, base, 32));
    EXPECT_TRUE(Ipv6InCidr({0, 0x0000ffff0a000001ULL}, {0, 0x0000ffff00000000ULL}, 96));
    EXPECT_FALSE(Ipv6InCidr({0, 0x0000fffe0a000001ULL}, {0, 0x0000ffff00000000ULL}, 96));
    EXPECT_TRUE(Ipv6InCidr({1, 2}, {1, 2}, 128));
    EXPECT_FALSE(Ipv6InCidr({1, 3}, {1, 2}, 128));
}

TEST(IpAddressTest, PrivateIpv4Ranges) {
    for (const auto* ip : {"0.1.2.3", "10.1.2.3", "100.64.0.1", "100.127.255.255", "127.0.0.1",
                           "169.254.169.254", "172.16.0.1", "172.31.255.255", "192.168.1.1",
                           "192.0.0.8", "192.0.2.1", "198.18.0.1", "198.19.255.255",
                           "198.51.100.7", "203.0.113.9", "224.0.0.1", "239.1.1.1",
                           "240.0.0.1", "255.255.255.255"}) {
        EXPECT_TRUE(IsPrivateIp(ip)) << ip;
    }
    for (const auto* ip : {"1.1.1.1", "8.8.8.8", "93.184.216.34", "100.63.255.255",
                           "100.128.0.0", "172.15.255.255", "172.32.0.0", "198.20.0.0",
                           "223.255.255.255"}) {
        EXPECT_FALSE(IsPrivateIp(ip)) << ip;
    }
}

TEST(IpAddressTest, PrivateIpv6Ranges) {
    for (const auto* ip : {"::", "::1", "fc00::1", "fdff::1", "fe80::1", "febf::1", "ff02::1",
                           "2001:db8::1", "::ffff:127.0.0.1", "::ffff:7f00:1", "::ffff:10.0.0.1",
                           "64:ff9b::a00:1", "2002:c0a8:0101::1"}) {
        EXPECT_TRUE(IsPrivateIp(ip)) << ip;
    }
    for (const auto* ip : {"2606:4700:4700::1111", "2001:4860:4860::8888", "::ffff:8.8.8.8",
                           "fec0::1", "2002:0808:0808::1"}) {
        EXPECT_FALSE(IsPrivateIp(ip)) << ip;
    }
}

TEST(IpAddressTest, UnparsableTextCountsAsPrivate) {
    EXPECT_TRUE(IsPrivateIp("not-an-ip"));
    EXPECT_TRUE(IsPrivateIp(""));
    EXPECT_EQ(DetectIpVersion("not-an-ip"), IpVersion::kNone);
    EXPECT_EQ(DetectIpVersion("10.0.0.1"), IpVersion::kV4);
    EXPECT_EQ(DetectIpVersion("::1"), IpVersion::kV6);
}

TEST(IpAddressTest, AsioAddressesUseTheSameTables) {
    EXPECT_TRUE(IsPrivateAddress(boost::asio::ip::make_address("10.9.8.7")));
    EXPECT_TRUE(IsPrivateAddress(boost::asio::ip::make_address("::ffff:192.168.0.1")));
    EXPECT_FALSE(IsPrivateAddress(boost::asio::ip::make_address("93.184.216.34")));
    EXPECT_FALSE(IsPrivateAddress(boost::asio::ip::make_address("2606:4700::1")));
}

TEST(IpAddressTest, FormatsIpv4) {
    EXPECT_EQ(FormatIpv4(0x7f000001u), "127.0.0.1");
    EXPECT_EQ(FormatIpv4(0), "0.0.0.0");
}

}  // namespace
