#include "gtest/gtest.h"

#include "tunnel_probe.hpp"

namespace {

TEST(SSHTunnelProbeTest, refused_connection_is_tunnel_unreachable) {
    TunnelConfig tunnel;
    tunnel.host = "127.0.0.1";
    tunnel.port = 1;
    tunnel.user = "nobody";

    SSHTunnelProbe probe(2);
    auto result = probe.probe(tunnel, "psql");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, RestoreErrorKind::TunnelUnreachable);
    EXPECT_NE(result.error().message.find("127.0.0.1:1"), std::string::npos);
}

TEST(CheckHostKeyTest, only_known_host_keys_are_accepted) {
    TunnelConfig tunnel;
    tunnel.host = "bastion";
    tunnel.port = 2222;

    EXPECT_TRUE(checkHostKey(tunnel, HostKeyState::Known).has_value());
    for (auto state : {HostKeyState::Changed, HostKeyState::OtherType, HostKeyState::Unknown,
                       HostKeyState::NotFound, HostKeyState::Error}) {
        auto result = checkHostKey(tunnel, state);
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().kind, RestoreErrorKind::TunnelUnreachable);
        EXPECT_NE(result.error().message.find("bastion:2222"), std::string::npos);
    }
}

} // namespace
