#include <doctest/doctest.h>
#include "wlanpipe/config.hpp"

#include <unistd.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace wlanpipe;
namespace fs = std::filesystem;

namespace {

struct TempFile {
    fs::path path;
    explicit TempFile(const std::string& body) {
        static int n = 0;
        path = fs::temp_directory_path() /
               ("wlanpipe-cfg-" + std::to_string(::getpid()) + "-" + std::to_string(n++) + ".json");
        std::ofstream out(path);
        out << body;
    }
    ~TempFile() { std::error_code ec; fs::remove(path, ec); }
};

} // namespace

TEST_CASE("Defaults match the documented wire and timing constants") {
    BrokerConfig c;
    CHECK(c.transport == TransportMode::None);
    CHECK(c.udp_port == 51000);
    CHECK(c.local_path == "/tmp/wlanpipe-51000.sock");
    CHECK(c.recv_timeout_ms == 1000);
    CHECK(c.target_prefix == "WiiU");
    CHECK(c.interface.empty());
}

TEST_CASE("File values override defaults, missing keys keep them") {
    TempFile f(R"({"udp_port": 52000, "interface": "wlan1", "target_prefix": "Pair", "extra": true})");
    BrokerConfig c;
    std::string err;

    REQUIRE(load_config_file(f.path.string(), c, true, err));
    CHECK(c.udp_port == 52000);
    CHECK(c.interface == "wlan1");
    CHECK(c.target_prefix == "Pair");
    CHECK(c.recv_timeout_ms == 1000);
    CHECK(c.local_path == "/tmp/wlanpipe-51000.sock");
}

TEST_CASE("Missing default file is fine, missing explicit file is not") {
    BrokerConfig c;
    std::string err;
    const std::string nowhere = "/nonexistent/wlanpipe/config.json";

    CHECK(load_config_file(nowhere, c, false, err));
    CHECK(c.udp_port == 51000);

    CHECK_FALSE(load_config_file(nowhere, c, true, err));
    CHECK(err.rfind("config_not_found", 0) == 0);
}

TEST_CASE("Bad JSON and wrong types leave the config untouched") {
    BrokerConfig c;
    c.udp_port = 40000;
    std::string err;

    SUBCASE("parse error") {
        TempFile f("{ not json");
        CHECK_FALSE(load_config_file(f.path.string(), c, true, err));
        CHECK(err.rfind("config_parse_error", 0) == 0);
    }
    SUBCASE("wrong type after a valid key") {
        TempFile f(R"({"interface": "wlan9", "udp_port": "fast"})");
        CHECK_FALSE(load_config_file(f.path.string(), c, true, err));
        CHECK(err == "config_type_error key=udp_port");
        CHECK(c.interface.empty());
    }
    SUBCASE("port out of range") {
        TempFile f(R"({"udp_port": 70000})");
        CHECK_FALSE(load_config_file(f.path.string(), c, true, err));
        CHECK(err == "config_range_error key=udp_port");
    }
    SUBCASE("integer wider than int") {
        TempFile f(R"({"recv_timeout_ms": 4294968296})");
        CHECK_FALSE(load_config_file(f.path.string(), c, true, err));
        CHECK(err == "config_range_error key=recv_timeout_ms");
    }
    SUBCASE("port wider than int") {
        TempFile f(R"({"udp_port": 4294967297})");
        CHECK_FALSE(load_config_file(f.path.string(), c, true, err));
        CHECK(err == "config_range_error key=udp_port");
    }
    SUBCASE("top level is not an object") {
        TempFile f("[1, 2, 3]");
        CHECK_FALSE(load_config_file(f.path.string(), c, true, err));
        CHECK(err == "config_not_object");
    }
    CHECK(c.udp_port == 40000);
}

TEST_CASE("validate_config rejects non-positive timeouts and empty prefix") {
    BrokerConfig c;
    std::string err;
    CHECK(validate_config(c, err));

    c.recv_timeout_ms = 0;
    CHECK_FALSE(validate_config(c, err));
    CHECK(err == "bad_value key=recv_timeout_ms");

    c = BrokerConfig{};
    c.target_prefix.clear();
    CHECK_FALSE(validate_config(c, err));
    CHECK(err == "bad_value key=target_prefix");
}

TEST_CASE("Default config path follows XDG_CONFIG_HOME") {
    const char* old = std::getenv("XDG_CONFIG_HOME");
    const std::string saved = old ? old : "";

    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg-test", 1);
    CHECK(default_config_path() == "/tmp/xdg-test/wlanpipe/config.json");

    if (old) ::setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
    else     ::unsetenv("XDG_CONFIG_HOME");
}
