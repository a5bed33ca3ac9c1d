#include <doctest/doctest.h>
#include "ledlink/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

using namespace ledlink;
namespace fs = std::filesystem;

namespace {

// Scratch directory removed on scope exit.
struct TempDir {
    fs::path path;
    TempDir() {
        path = fs::temp_directory_path() / ("ledlink_cfg_" + std::to_string(::getpid()));
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    std::string write(const std::string& name, const std::string& text) const {
        const fs::path p = path / name;
        std::ofstream(p) << text;
        return p.string();
    }
};

} // namespace

TEST_CASE("Defaults") {
    Options o;
    CHECK(o.host.empty());
    CHECK(o.port == 10001);
    CHECK(o.timeout_ms == 10000);
    CHECK(o.heartbeat_interval_ms == 30000);
    CHECK_FALSE(o.verbose);
}

TEST_CASE("Save then load restores every field") {
    TempDir dir;
    const std::string path = (dir.path / "nested" / "config.json").string();

    Options saved;
    saved.host = "192.168.6.1";
    saved.port = 10002;
    saved.timeout_ms = 2500;
    saved.heartbeat_interval_ms = 15000;
    saved.verbose = true;

    Error err;
    REQUIRE(save_options(path, saved, err));
    CHECK_FALSE(fs::exists(path + ".tmp"));

    Options loaded;
    REQUIRE(load_options(path, loaded, err));
    CHECK(loaded.host == saved.host);
    CHECK(loaded.port == saved.port);
    CHECK(loaded.timeout_ms == saved.timeout_ms);
    CHECK(loaded.heartbeat_interval_ms == saved.heartbeat_interval_ms);
    CHECK(loaded.verbose);
}

TEST_CASE("Keys absent from the file keep their current values") {
    TempDir dir;
    const std::string path = dir.write("partial.json", R"({"host": "lobby.local"})");

    Options o;
    o.port = 4000;
    Error err;
    REQUIRE(load_options(path, o, err));
    CHECK(o.host == "lobby.local");
    CHECK(o.port == 4000);
    CHECK(o.timeout_ms == DEFAULT_TIMEOUT_MS);
}

TEST_CASE("Missing file") {
    TempDir dir;
    const std::string path = (dir.path / "absent.json").string();
    Options o;
    Error err;

    CHECK(load_options(path, o, err, false));
    CHECK(err.ok());

    CHECK_FALSE(load_options(path, o, err, true));
    CHECK(err.kind == ErrorKind::Config);
}

TEST_CASE("Bad values are rejected and leave options untouched") {
    TempDir dir;
    Options o;
    o.host = "keep";
    Error err;

    SUBCASE("port zero") {
        CHECK_FALSE(load_options(dir.write("c.json", R"({"host": "x", "port": 0})"), o, err));
    }
    SUBCASE("port too large") {
        CHECK_FALSE(load_options(dir.write("c.json", R"({"port": 70000})"), o, err));
    }
    SUBCASE("negative timeout") {
        CHECK_FALSE(load_options(dir.write("c.json", R"({"timeout_ms": -1})"), o, err));
    }
    SUBCASE("zero heartbeat") {
        CHECK_FALSE(load_options(dir.write("c.json", R"({"heartbeat_interval_ms": 0})"), o, err));
    }
    SUBCASE("wrong type") {
        CHECK_FALSE(load_options(dir.write("c.json", R"({"host": "x", "port": "10001"})"), o, err));
    }
    SUBCASE("not json") {
        CHECK_FALSE(load_options(dir.write("c.json", "host = x"), o, err));
    }
    SUBCASE("not an object") {
        CHECK_FALSE(load_options(dir.write("c.json", "[1, 2]"), o, err));
    }

    CHECK(err.kind == ErrorKind::Config);
    CHECK(o.host == "keep");
    CHECK(o.port == DEFAULT_PORT);
}

TEST_CASE("Default config path honors XDG_CONFIG_HOME") {
    const char* old = std::getenv("XDG_CONFIG_HOME");
    const std::string saved = old ? old : "";

    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg-test", 1);
    CHECK(default_config_path() == "/tmp/xdg-test/ledlink/config.json");

    if (old) ::setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
    else ::unsetenv("XDG_CONFIG_HOME");
}

TEST_CASE("Logger threshold follows verbose") {
    std::string last;
    Options o;
    o.log_sink = [&](LogLevel, const std::string& line) { last = line; };

    Logger quiet = make_logger(o);
    quiet.info("hidden");
    CHECK(last.empty());
    quiet.warn("shown");
    CHECK(last == "shown");

    o.verbose = true;
    Logger loud = make_logger(o);
    loud.debug("detail");
    CHECK(last == "detail");
    CHECK(loud.threshold() == LogLevel::Debug);
}
