#include <doctest/doctest.h>
#include "ledlink/sdk_xml.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace ledlink;

TEST_CASE("Request envelope matches the controller's CRLF layout") {
    CHECK(build_sdk_xml("g-1", "GetDeviceInfo") ==
          "<?xml version=\"1.0\" encoding=\"utf-8\"?>\r\n"
          "<sdk guid=\"g-1\">\r\n"
          "  <in method=\"GetDeviceInfo\"></in>\r\n"
          "</sdk>");

    CHECK(build_sdk_xml("g-1", "DeleteFiles", "<files/>") ==
          "<?xml version=\"1.0\" encoding=\"utf-8\"?>\r\n"
          "<sdk guid=\"g-1\">\r\n"
          "  <in method=\"DeleteFiles\">\r\n"
          "    <files/>\r\n"
          "  </in>\r\n"
          "</sdk>");
}

TEST_CASE("Version request uses the placeholder guid and hex version") {
    const std::string x = build_version_xml();
    CHECK(x.find("guid=\"##GUID\"") != std::string::npos);
    CHECK(x.find("method=\"GetIFVersion\"") != std::string::npos);
    CHECK(x.find("<version value=\"1000000\"/>") != std::string::npos);
}

TEST_CASE("Escaping covers the five XML specials") {
    CHECK(xml_escape("a&b<c>d\"e'f") == "a&amp;b&lt;c&gt;d&quot;e&apos;f");
    CHECK(build_delete_files_xml({"a.png", "x&y.mp4"}) ==
          "<files><file name=\"a.png\"/><file name=\"x&amp;y.mp4\"/></files>");
}

TEST_CASE("clean_xml drops BOM and trims") {
    CHECK(clean_xml(std::string("\xEF\xBB\xBF  <a/>\r\n")) == "<a/>");
    CHECK(clean_xml(std::string(" \t\n")) == "");
    CHECK(clean_xml(Bytes{'<', 'b', '/', '>', ' '}) == "<b/>");
}

TEST_CASE("Response parse extracts guid, method, result and inner XML") {
    const std::string raw =
        "<?xml version=\"1.0\" encoding=\"utf-8\"?>\r\n"
        "<sdk guid=\"abc-123\">\r\n"
        "  <out method=\"GetFiles\" result=\"kSuccess\">\r\n"
        "    <files><file name=\"a.png\" size=\"10\"/></files>\r\n"
        "  </out>\r\n"
        "</sdk>";
    SdkResponse r;
    Error err;
    REQUIRE(parse_sdk_response(raw, r, err));
    CHECK(r.guid == "abc-123");
    CHECK(r.method == "GetFiles");
    CHECK(r.result == "kSuccess");
    CHECK(r.is_success());
    CHECK(r.inner_xml.find("<files>") == 0);
    CHECK(r.inner_xml.find("name=\"a.png\"") != std::string::npos);
    CHECK(r.raw_xml == raw);
}

TEST_CASE("Non-success result is data, not a parse failure") {
    SdkResponse r;
    Error err;
    REQUIRE(parse_sdk_response("<sdk guid=\"g\"><out method=\"OpenScreen\" result=\"kInvalidGuid\"/></sdk>", r, err));
    CHECK_FALSE(r.is_success());
    CHECK(r.result == "kInvalidGuid");
    CHECK(r.inner_xml.empty());
}

TEST_CASE("Response without guid or method is MalformedXml") {
    SdkResponse r;
    Error err;
    CHECK_FALSE(parse_sdk_response("<sdk><out result=\"kSuccess\"/></sdk>", r, err));
    CHECK(err.protocol == ProtocolFault::MalformedXml);

    err.clear();
    CHECK_FALSE(parse_sdk_response("<sdk guid=\"g\"><out", r, err));
    CHECK(err.protocol == ProtocolFault::MalformedXml);
}

TEST_CASE("A guid alone is enough for a response") {
    SdkResponse r;
    Error err;
    REQUIRE(parse_sdk_response("<sdk guid=\"only\"/>", r, err));
    CHECK(r.guid == "only");
    CHECK(r.method.empty());
}

TEST_CASE("Device info attributes map onto DeviceInfo") {
    DeviceInfo d;
    Error err;
    REQUIRE(parse_device_info(
        "<device cpu=\"A7\" model=\"C16\" id=\"C16-D00\" name=\"lobby sign\"/>"
        "<version fpga=\"1.2\" app=\"7.10\" kernel=\"4.9\"/>"
        "<screen width=\"128\" height=\"64\" rotation=\"90\"/>", d, err));
    CHECK(d.cpu == "A7");
    CHECK(d.model == "C16");
    CHECK(d.device_id == "C16-D00");
    CHECK(d.device_name == "lobby sign");
    CHECK(d.fpga_version == "1.2");
    CHECK(d.app_version == "7.10");
    CHECK(d.kernel_version == "4.9");
    CHECK(d.screen_width == 128);
    CHECK(d.screen_height == 64);
    CHECK(d.screen_rotation == 90);
}

TEST_CASE("File list collects every file element") {
    std::vector<RemoteFile> files;
    Error err;
    REQUIRE(parse_file_list(
        "<files>"
        "<file name=\"a.png\" size=\"20000\" existSize=\"20000\" md5=\"abc\" type=\"image\"/>"
        "<file name=\"b.mp4\" size=\"5000000000\" existSize=\"16000\" md5=\"def\" type=\"video\"/>"
        "</files>", files, err));
    REQUIRE(files.size() == 2);
    CHECK(files[0].name == "a.png");
    CHECK(files[0].size == 20000);
    CHECK(files[1].size == 5000000000ull);
    CHECK(files[1].exist_size == 16000);
    CHECK(files[1].type == "video");

    REQUIRE(parse_file_list("", files, err));
    CHECK(files.empty());

    CHECK_FALSE(parse_file_list("<file name=", files, err));
    CHECK(err.protocol == ProtocolFault::MalformedXml);
}

TEST_CASE("Responses parse correctly from several threads at once") {
    const std::string raw =
        "<?xml version=\"1.0\" encoding=\"utf-8\"?>\r\n"
        "<sdk guid=\"g\"><out method=\"GetFiles\" result=\"kSuccess\">"
        "<files><file name=\"a.png\" size=\"10\"/></files></out></sdk>";

    std::atomic<int> bad{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < 200; ++i) {
                SdkResponse r;
                std::vector<RemoteFile> files;
                Error err;
                if (!parse_sdk_response(raw, r, err) || r.method != "GetFiles" ||
                    !parse_file_list(r.inner_xml, files, err) || files.size() != 1) {
                    ++bad;
                }
            }
        });
    }
    for (auto& w : workers) w.join();
    CHECK(bad.load() == 0);
}
