// Copyright (c) 2025 The Raftwire Developers
// Tests for transport configuration loading

#include <catch2/catch_test_macros.hpp>
#include "network/transport_config.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace raftwire::network;

namespace {

class TempConfigFile {
public:
    explicit TempConfigFile(const std::string &content) {
        static int counter = 0;
        path_ = std::filesystem::temp_directory_path() /
                ("raftwire_config_test_" + std::to_string(::getpid()) + "_" +
                 std::to_string(counter++) + ".json");
        std::ofstream out(path_);
        out << content;
    }
    ~TempConfigFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

} // namespace

TEST_CASE("TransportConfig defaults", "[network][config]") {
    TransportConfig config;
    CHECK(config.election_timeout == std::chrono::milliseconds(10000));
    CHECK(config.io_threads == 1);
    CHECK(config.max_frame_size == 16 * 1024 * 1024);
    CHECK(config.send_queue_limit == 64 * 1024 * 1024);
}

TEST_CASE("LoadTransportConfig - valid files", "[network][config]") {
    SECTION("All keys") {
        TempConfigFile file(R"({"election_timeout_ms": 2500, "io_threads": 4,
                                "max_frame_size": 4096, "send_queue_limit": 65536})");
        auto config = LoadTransportConfig(file.path());
        REQUIRE(config.has_value());
        CHECK(config->election_timeout == std::chrono::milliseconds(2500));
        CHECK(config->io_threads == 4);
        CHECK(config->max_frame_size == 4096);
        CHECK(config->send_queue_limit == 65536);
    }

    SECTION("Missing keys keep defaults") {
        TempConfigFile file(R"({"io_threads": 2})");
        auto config = LoadTransportConfig(file.path());
        REQUIRE(config.has_value());
        CHECK(config->io_threads == 2);
        CHECK(config->election_timeout == defaults::ELECTION_TIMEOUT);
    }

    SECTION("Unknown keys are ignored") {
        TempConfigFile file(R"({"comment": "journal transport"})");
        CHECK(LoadTransportConfig(file.path()).has_value());
    }
}

TEST_CASE("LoadTransportConfig - rejected files", "[network][config]") {
    SECTION("Missing file") {
        CHECK_FALSE(LoadTransportConfig("/nonexistent/raftwire.json").has_value());
    }

    SECTION("Malformed JSON") {
        TempConfigFile file("{ election_timeout_ms: ");
        CHECK_FALSE(LoadTransportConfig(file.path()).has_value());
    }

    SECTION("Not an object") {
        TempConfigFile file("[1, 2, 3]");
        CHECK_FALSE(LoadTransportConfig(file.path()).has_value());
    }

    SECTION("Wrong type") {
        TempConfigFile file(R"({"election_timeout_ms": "10s"})");
        CHECK_FALSE(LoadTransportConfig(file.path()).has_value());
    }

    SECTION("Negative value") {
        TempConfigFile file(R"({"io_threads": -1})");
        CHECK_FALSE(LoadTransportConfig(file.path()).has_value());
    }

    SECTION("Zero value") {
        TempConfigFile file(R"({"max_frame_size": 0})");
        CHECK_FALSE(LoadTransportConfig(file.path()).has_value());
    }
}
