#include <gtest/gtest.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "obf_protocol.hpp"
#include "scripted_transport.hpp"

using obf_test::ScriptedTransport;
using obf_test::ScriptState;

namespace {

// ポート名 → 台本。登録のないポートはオープン失敗扱い
class FakePorts {
public:
    std::shared_ptr<ScriptState> add(const std::string& port, const std::string& reply) {
        auto s = std::make_shared<ScriptState>();
        s->replies.push_back(reply);
        states_[port] = s;
        return s;
    }

    obf::PortOpener opener() {
        return [this](const std::string& port, const obf::DiscoveryOptions&) -> std::unique_ptr<obf::Transport> {
            opened.push_back(port);
            auto it = states_.find(port);
            if (it == states_.end()) return nullptr;
            return std::make_unique<ScriptedTransport>(it->second, port);
        };
    }

    std::vector<std::string> opened;

private:
    std::map<std::string, std::shared_ptr<ScriptState>> states_;
};

obf::DiscoveryOptions quiet() {
    obf::DiscoveryOptions o;
    o.suppress_output = true;
    return o;
}

} // namespace

TEST(Discover, FirstMatchingPortWins) {
    FakePorts ports;
    auto a = ports.add("/dev/ttyUSB0", "X9 ");
    auto b = ports.add("/dev/ttyUSB1", "V2.1 ");
    auto c = ports.add("/dev/ttyUSB2", "V2.0 ");

    auto dev = obf::discover({"/dev/ttyUSB0", "/dev/ttyUSB1", "/dev/ttyUSB2"}, quiet(), ports.opener());
    ASSERT_TRUE(dev != nullptr);
    EXPECT_EQ(dev->name(), "/dev/ttyUSB1");

    const std::vector<std::string> opened = {"/dev/ttyUSB0", "/dev/ttyUSB1"};
    EXPECT_EQ(ports.opened, opened);
    EXPECT_TRUE(a->closed);
    EXPECT_FALSE(b->closed);
    EXPECT_TRUE(c->writes.empty());
}

TEST(Discover, SendsIdentityQueryAndRaisesTimeoutOnMatch) {
    FakePorts ports;
    auto s = ports.add("COM3", "V2 ");

    obf::DiscoveryOptions o = quiet();
    o.probe_timeout   = std::chrono::milliseconds(50);
    o.connect_timeout = std::chrono::milliseconds(1500);

    auto dev = obf::discover({"COM3"}, o, ports.opener());
    ASSERT_TRUE(dev != nullptr);
    const std::vector<std::string> writes = {"V,"};
    EXPECT_EQ(s->writes, writes);
    EXPECT_EQ(dev->timeout().count(), 1500);
}

TEST(Discover, SkipsPortsThatFailToOpenOrSendGarbage) {
    FakePorts ports;
    auto bad = ports.add("/dev/ttyACM0", std::string("\xFF\xFE ", 3));
    ports.add("/dev/ttyACM1", "V2 ");

    auto dev = obf::discover({"/dev/ttyS0", "/dev/ttyACM0", "/dev/ttyACM1"}, quiet(), ports.opener());
    ASSERT_TRUE(dev != nullptr);
    EXPECT_EQ(dev->name(), "/dev/ttyACM1");
    EXPECT_TRUE(bad->closed);
}

TEST(Discover, NotFoundReturnsNullAndReports) {
    FakePorts ports;
    auto a = ports.add("/dev/ttyUSB0", "");        // 無応答
    auto b = ports.add("/dev/ttyUSB1", "V1 ");     // 別機種

    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    auto dev = obf::discover({"/dev/ttyUSB0", "/dev/ttyUSB1"}, obf::DiscoveryOptions(), ports.opener());
    const std::string out = testing::internal::GetCapturedStdout();
    const std::string err = testing::internal::GetCapturedStderr();

    EXPECT_TRUE(dev == nullptr);
    EXPECT_TRUE(a->closed);
    EXPECT_TRUE(b->closed);
    EXPECT_NE(out.find("/dev/ttyUSB0"), std::string::npos);
    EXPECT_NE(out.find("/dev/ttyUSB1"), std::string::npos);
    EXPECT_NE(err.find("[warn]"), std::string::npos);
}

TEST(Discover, SuppressedOutputHasNoPerPortLines) {
    FakePorts ports;
    ports.add("/dev/ttyUSB0", "V2 ");

    testing::internal::CaptureStdout();
    auto dev = obf::discover({"/dev/ttyUSB0"}, quiet(), ports.opener());
    const std::string out = testing::internal::GetCapturedStdout();

    ASSERT_TRUE(dev != nullptr);
    EXPECT_TRUE(out.empty());
}

TEST(Discover, EmptyCandidateList) {
    FakePorts ports;
    testing::internal::CaptureStderr();
    auto dev = obf::discover(std::vector<std::string>(), quiet(), ports.opener());
    testing::internal::GetCapturedStderr();
    EXPECT_TRUE(dev == nullptr);
    EXPECT_TRUE(ports.opened.empty());
}

TEST(Discover, InvalidUtf8AfterDeviceClassIsNoMatch) {
    const std::vector<std::string> replies = {
        std::string("V2\xC0\x80 ", 5),           // 冗長表現
        std::string("V2\xE0\x80\x80 ", 6),
        std::string("V2\xF0\x8F\xBF\xBF ", 7),
        std::string("V2\xED\xA0\x80 ", 6),      // サロゲート
        std::string("V2\xF4\x90\x80\x80 ", 7), // U+10FFFF 超
        std::string("V2\xF5\x80\x80\x80 ", 7),
    };
    for (const auto& reply : replies) {
        FakePorts ports;
        auto s = ports.add("COMX", reply);

        testing::internal::CaptureStderr();
        auto dev = obf::discover({"COMX"}, quiet(), ports.opener());
        testing::internal::GetCapturedStderr();

        EXPECT_TRUE(dev == nullptr);
        EXPECT_TRUE(s->closed);
    }
}

TEST(Discover, LinkLossOnPortIsNoMatch) {
    FakePorts ports;
    auto dead = ports.add("/dev/ttyUSB0", "");
    dead->replies.clear();
    dead->link_down = true;
    ports.add("/dev/ttyUSB1", "V2 ");

    auto dev = obf::discover({"/dev/ttyUSB0", "/dev/ttyUSB1"}, quiet(), ports.opener());
    ASSERT_TRUE(dev != nullptr);
    EXPECT_EQ(dev->name(), "/dev/ttyUSB1");
    EXPECT_TRUE(dead->closed);
}
