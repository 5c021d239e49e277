#include "updown/console.hpp"

#include <gtest/gtest.h>
#include <httplib.h>

#include <sstream>

TEST(Console, ColorizeWrapsInAnsiCodes) {
    EXPECT_EQ(updown::colorize("ok", updown::Color::green), "\x1b[32mok\x1b[0m");
    EXPECT_EQ(updown::colorize("ip", updown::Color::yellow), "\x1b[33mip\x1b[0m");
    EXPECT_EQ(updown::colorize("v", updown::Color::blue), "\x1b[34mv\x1b[0m");
}

TEST(Console, SharedInterfacesByPrefix) {
    EXPECT_TRUE(updown::is_shared_interface("eth0"));
    EXPECT_TRUE(updown::is_shared_interface("ens33"));
    EXPECT_TRUE(updown::is_shared_interface("wlp2s0"));
    EXPECT_TRUE(updown::is_shared_interface("tun0"));
    EXPECT_FALSE(updown::is_shared_interface("lo"));
    EXPECT_FALSE(updown::is_shared_interface("docker0"));
}

TEST(Console, ListedAddressesAreSharedAndSorted) {
    auto addresses = updown::list_ipv4_addresses();
    for (std::size_t i = 0; i < addresses.size(); ++i) {
        EXPECT_TRUE(updown::is_shared_interface(addresses[i].name)) << addresses[i].name;
        if (i > 0) EXPECT_LE(addresses[i - 1].name, addresses[i].name);
    }
}

TEST(Console, ShareUrlsPerInterface) {
    updown::Options opts;
    opts.port = 8080;
    std::vector<updown::InterfaceAddress> addresses = {
        { "eth0", "192.168.1.10" },
        { "wlan0", "10.0.0.4" },
    };
    EXPECT_EQ(updown::format_share_urls(opts, addresses),
        "Share with:\n"
        "  eth0: http://192.168.1.10:8080/\n"
        "  wlan0: http://10.0.0.4:8080/\n");
}

TEST(Console, ShareUrlFallsBackToBindAddress) {
    updown::Options opts;
    EXPECT_EQ(updown::format_share_urls(opts, {}), "Share with: http://0.0.0.0:6600/\n");

    opts.bind_address = "127.0.0.1";
    EXPECT_EQ(updown::format_share_urls(opts, { { "eth0", "192.168.1.10" } }),
        "Share with: http://127.0.0.1:6600/\n");
}

TEST(Console, UsageNamesEveryFlag) {
    std::ostringstream out;
    updown::print_usage(out, "updown");
    std::string text = out.str();
    EXPECT_EQ(text.rfind("Usage: updown [options]\n", 0), 0u);
    for (const char* flag : { "--help", "--port", "--bind", "--serve", "--output", "--max-upload", "--quiet" }) {
        EXPECT_NE(text.find(flag), std::string::npos) << flag;
    }
    EXPECT_NE(text.find("(default: unlimited)"), std::string::npos);
}

TEST(Console, PortInUseIsNotFree) {
    httplib::Server svr;
    int port = svr.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port, 0);
    EXPECT_FALSE(updown::is_port_free("127.0.0.1", port));
}
