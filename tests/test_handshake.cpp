#include <doctest/doctest.h>
#include "ledlink/device.hpp"
#include "fake_device.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

using namespace ledlink;

namespace {

Options quiet_options() {
    Options o;
    o.host = "fake";
    o.timeout_ms = 1000;
    o.heartbeat_interval_ms = 60000;
    o.log_sink = [](LogLevel, const std::string&) {};
    return o;
}

struct Rig {
    std::shared_ptr<fake::FakeStream> stream = std::make_shared<fake::FakeStream>();
    fake::ScriptedController ctl;
    Device dev;

    explicit Rig(fake::Script s = fake::Script(), Options o = quiet_options())
    : ctl(std::move(s)), dev(std::move(o), fake::factory_for(stream)) {
        ctl.attach(*stream);
    }
};

} // namespace

TEST_CASE("Successful handshake caches guid, version and device info") {
    Rig rig;
    Error err;
    REQUIRE(rig.dev.connect(err));

    CHECK(rig.dev.is_connected());
    CHECK(rig.dev.guid() == "abc-123");
    CHECK(rig.dev.transport_version() == TRANSPORT_VERSION);

    auto info = rig.dev.cached_info();
    REQUIRE(info.has_value());
    CHECK(info->model == "C16");
    CHECK(info->screen_width == 128);

    auto reqs = rig.ctl.requests();
    REQUIRE(reqs.size() == 2);
    CHECK(reqs[0].find("guid=\"##GUID\"") != std::string::npos);
    CHECK(reqs[0].find("GetIFVersion") != std::string::npos);
    CHECK(reqs[1].find("guid=\"abc-123\"") != std::string::npos);
    CHECK(reqs[1].find("GetDeviceInfo") != std::string::npos);

    // first frame on the wire is the version ask
    auto w = rig.stream->written();
    REQUIRE_FALSE(w.empty());
    CHECK(w.front().command == CmdType::ServiceAsk);
}

TEST_CASE("Commands after connect carry the guid from the version answer") {
    Rig rig;
    Error err;
    REQUIRE(rig.dev.connect(err));

    SdkResponse resp;
    REQUIRE(rig.dev.send_command("GetDeviceInfo", "", resp, err));
    CHECK(resp.is_success());
    CHECK(resp.guid == "abc-123");

    auto reqs = rig.ctl.requests();
    REQUIRE(reqs.size() == 3);
    CHECK(reqs[2].find("guid=\"abc-123\"") != std::string::npos);
    CHECK(reqs[2].find("<in method=\"GetDeviceInfo\">") != std::string::npos);
}

TEST_CASE("Device info failure is not fatal") {
    fake::Script s;
    s.info_error = kInvalidMethod;
    Rig rig(s);

    Error err;
    REQUIRE(rig.dev.connect(err));
    CHECK(rig.dev.is_connected());
    CHECK_FALSE(rig.dev.cached_info().has_value());
    CHECK(rig.dev.guid() == "abc-123");
}

TEST_CASE("Error answer to the version ask fails the handshake and drops the link") {
    fake::Script s;
    s.version_error = kVersionTooLow;
    Rig rig(s);

    Error err;
    CHECK_FALSE(rig.dev.connect(err));
    CHECK(err.kind == ErrorKind::Handshake);
    CHECK(err.phase == Phase::Version);
    CHECK(err.device_code == kVersionTooLow);

    CHECK_FALSE(rig.dev.is_connected());
    CHECK(rig.dev.guid().empty());
    CHECK(rig.stream->is_shut());

    SdkResponse resp;
    CHECK_FALSE(rig.dev.send_command("GetDeviceInfo", "", resp, err));
    CHECK(err.kind == ErrorKind::NotConnected);
}

TEST_CASE("Unexpected answer to the version ask is a handshake error without a code") {
    fake::Script s;
    s.version_unexpected = true;
    Rig rig(s);

    Error err;
    CHECK_FALSE(rig.dev.connect(err));
    CHECK(err.kind == ErrorKind::Handshake);
    CHECK(err.phase == Phase::Version);
    CHECK(err.device_code == -1);
    CHECK(rig.stream->is_shut());
}

TEST_CASE("Placeholder or empty guid is replaced by a generated one") {
    for (const char* g : {"##GUID", ""}) {
        CAPTURE(g);
        fake::Script s;
        s.guid = g;
        Rig rig(s);

        Error err;
        REQUIRE(rig.dev.connect(err));
        const std::string guid = rig.dev.guid();
        REQUIRE(guid.size() == 36);
        CHECK(guid[14] == '4');
        CHECK(guid != "##GUID");

        auto reqs = rig.ctl.requests();
        REQUIRE(reqs.size() == 2);
        CHECK(reqs[1].find("guid=\"" + guid + "\"") != std::string::npos);
    }
}

TEST_CASE("Generated session guids are v4 and distinct") {
    const std::string a = make_session_guid();
    const std::string b = make_session_guid();
    REQUIRE(a.size() == 36);
    CHECK(a[8] == '-');
    CHECK(a[13] == '-');
    CHECK(a[14] == '4');
    CHECK(a[18] == '-');
    CHECK(std::string("89ab").find(a[19]) != std::string::npos);
    CHECK(a[23] == '-');
    CHECK(a != b);
}

TEST_CASE("Connect failure from the stream factory is a Connect error") {
    Device dev(quiet_options(), [](const Options&, Error& e) -> std::shared_ptr<transport::IStream> {
        e = connect_error("refused");
        return nullptr;
    });
    Error err;
    CHECK_FALSE(dev.connect(err));
    CHECK(err.kind == ErrorKind::Connect);
    CHECK_FALSE(dev.is_connected());
}

TEST_CASE("Silent device times out the handshake") {
    auto stream = std::make_shared<fake::FakeStream>();
    Options o = quiet_options();
    o.timeout_ms = 100;
    Device dev(o, fake::factory_for(stream));

    Error err;
    CHECK_FALSE(dev.connect(err));
    CHECK(err.kind == ErrorKind::Io);
    CHECK(err.io == IoFault::Timeout);
    CHECK(err.phase == Phase::Version);
    CHECK(stream->is_shut());
}

TEST_CASE("Reconnect tears down the previous connection first") {
    auto first = std::make_shared<fake::FakeStream>();
    auto second = std::make_shared<fake::FakeStream>();
    fake::Script s1;
    fake::Script s2;
    s2.guid = "second-guid";
    fake::ScriptedController c1(s1), c2(s2);
    c1.attach(*first);
    c2.attach(*second);

    int calls = 0;
    Device dev(quiet_options(), [&](const Options&, Error&) -> std::shared_ptr<transport::IStream> {
        return (calls++ == 0) ? first : second;
    });

    Error err;
    REQUIRE(dev.connect(err));
    CHECK(dev.guid() == "abc-123");

    REQUIRE(dev.connect(err));
    CHECK(first->is_shut());
    CHECK(dev.guid() == "second-guid");
    CHECK(dev.is_connected());
}

TEST_CASE("Close is idempotent and clears session state") {
    Rig rig;
    Error err;
    REQUIRE(rig.dev.connect(err));

    rig.dev.close();
    rig.dev.close();
    CHECK_FALSE(rig.dev.is_connected());
    CHECK(rig.dev.guid().empty());
    CHECK_FALSE(rig.dev.cached_info().has_value());
    CHECK(rig.dev.transport_version() == 0);

    Packet pkt;
    CHECK_FALSE(rig.dev.read_packet(pkt, err));
    CHECK(err.kind == ErrorKind::NotConnected);
    CHECK_FALSE(rig.dev.send_raw(make_heartbeat_ask(), err));
    CHECK(err.kind == ErrorKind::NotConnected);
}

TEST_CASE("Close from another thread releases a blocked read") {
    Rig rig;
    Error err;
    REQUIRE(rig.dev.connect(err));

    std::thread closer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        rig.dev.close();
    });

    Packet pkt;
    Error read_err;
    CHECK_FALSE(rig.dev.read_packet(pkt, read_err));
    closer.join();

    CHECK(read_err.kind == ErrorKind::Io);
    CHECK_FALSE(rig.dev.is_connected());
}

TEST_CASE("Raw send and read pass frames through unchanged") {
    Rig rig;
    Error err;
    REQUIRE(rig.dev.connect(err));

    rig.stream->push(fake::error_answer(kDeviceOccupied));
    Packet pkt;
    REQUIRE(rig.dev.read_packet(pkt, err));
    CHECK(pkt.command == CmdType::ErrorAnswer);

    const size_t before = rig.stream->count(CmdType::HeartbeatAsk);
    REQUIRE(rig.dev.send_raw(make_heartbeat_ask(), err));
    CHECK(rig.stream->count(CmdType::HeartbeatAsk) == before + 1);

    // the controller answers that heartbeat; read it raw
    REQUIRE(rig.dev.read_packet(pkt, err));
    CHECK(pkt.command == CmdType::HeartbeatAnswer);
}

TEST_CASE("Heartbeat answers interleaved with command answers are skipped") {
    fake::Script s;
    s.heartbeat_before_sdk_answer = true;
    s.utf8_bom = true;
    s.answer_chunk = 16;
    Rig rig(s);

    Error err;
    REQUIRE(rig.dev.connect(err));
    REQUIRE(rig.dev.cached_info().has_value());

    SdkResponse resp;
    REQUIRE(rig.dev.send_command("OpenScreen", "", resp, err));
    CHECK(resp.method == "OpenScreen");
    CHECK(resp.is_success());
}

TEST_CASE("Non-success result comes back as a successful call") {
    fake::Script s;
    s.methods["CloseScreen"] = {"kInvalidGuid", ""};
    Rig rig(s);

    Error err;
    REQUIRE(rig.dev.connect(err));
    SdkResponse resp;
    REQUIRE(rig.dev.send_command("CloseScreen", "", resp, err));
    CHECK_FALSE(resp.is_success());
    CHECK(resp.result == "kInvalidGuid");
    CHECK(rig.dev.is_connected());
}

TEST_CASE("Device error answer leaves the connection usable") {
    Rig rig;
    Error err;
    REQUIRE(rig.dev.connect(err));

    // next answer the reader sees is an error frame
    rig.stream->push(fake::error_answer(kDeviceOccupied));
    SdkResponse resp;
    CHECK_FALSE(rig.dev.send_command("GetFiles", "", resp, err));
    CHECK(err.kind == ErrorKind::Device);
    CHECK(err.device_code == kDeviceOccupied);
    CHECK(rig.dev.is_connected());

    // the real answer to GetFiles is still queued behind the error frame
    Packet stale;
    REQUIRE(rig.dev.read_packet(stale, err));
    CHECK(stale.command == CmdType::SdkCmdAnswer);

    REQUIRE(rig.dev.send_command("GetFiles", "", resp, err));
    CHECK(resp.is_success());
}

TEST_CASE("Device info answer arriving after the deadline fails the connect") {
    fake::Script s;
    s.info_delay_ms = 250;
    Options o = quiet_options();
    o.timeout_ms = 100;
    Rig rig(s, o);

    Error err;
    CHECK_FALSE(rig.dev.connect(err));
    CHECK(err.kind == ErrorKind::Io);
    CHECK(err.io == IoFault::Timeout);
    CHECK(err.phase == Phase::DeviceInfo);
    CHECK_FALSE(rig.dev.is_connected());
    CHECK(rig.stream->is_shut());

    // the late GetDeviceInfo answer must never be read as a reply
    SdkResponse resp;
    CHECK_FALSE(rig.dev.send_command("GetFiles", "", resp, err));
    CHECK(err.kind == ErrorKind::NotConnected);
    CHECK(resp.method.empty());
}

TEST_CASE("Answer for another method is refused") {
    Rig rig;
    Error err;
    REQUIRE(rig.dev.connect(err));

    // left over from an earlier request, already queued ahead of the real answer
    rig.stream->push_all(fake::sdk_answer(
        fake::response_xml(rig.dev.guid(), "GetDeviceInfo", "kSuccess", "<device model=\"C16\"/>")));

    SdkResponse resp;
    CHECK_FALSE(rig.dev.send_command("GetFiles", "", resp, err));
    CHECK(err.kind == ErrorKind::Protocol);
    CHECK(err.protocol == ProtocolFault::UnexpectedCommand);
    CHECK(resp.method.empty());
    CHECK(rig.dev.is_connected());
}

TEST_CASE("Attributes inside the inner xml do not change the answered method") {
    Rig rig;
    Error err;
    REQUIRE(rig.dev.connect(err));

    SdkResponse resp;
    REQUIRE(rig.dev.send_command("GetFiles", "<filter method=\"OpenScreen\" guid=\"x\"/>", resp, err));
    CHECK(resp.method == "GetFiles");
    CHECK(resp.guid == "abc-123");
}

TEST_CASE("Concurrent callers each receive the answer to their own request") {
    fake::Script s;
    s.answer_chunk = 32;
    s.heartbeat_before_sdk_answer = true;
    Options o = quiet_options();
    o.heartbeat_interval_ms = 2;
    Rig rig(s, o);

    Error err;
    REQUIRE(rig.dev.connect(err));

    // start once the keeper is already writing
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (rig.dev.heartbeats_sent() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    REQUIRE(rig.dev.heartbeats_sent() > 0);

    std::atomic<int> failures{0};
    std::atomic<int> mismatches{0};
    auto caller = [&](const char* method) {
        for (int i = 0; i < 100; ++i) {
            SdkResponse resp;
            Error e;
            if (!rig.dev.send_command(method, "", resp, e)) ++failures;
            else if (resp.method != method) ++mismatches;
        }
    };

    std::thread a(caller, "GetFiles");
    std::thread b(caller, "OpenScreen");
    a.join();
    b.join();

    CHECK(failures.load() == 0);
    CHECK(mismatches.load() == 0);
    CHECK(rig.dev.is_connected());
    CHECK(rig.ctl.requests().size() == 2 + 200);
}
