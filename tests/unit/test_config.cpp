// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "app_settings.h"
#include "config.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

#include <catch2/catch_all.hpp>

namespace fs = std::filesystem;
using namespace rocketscope;

namespace {

class ConfigFileFixture {
  public:
    ConfigFileFixture() {
        tmp_dir_ = fs::temp_directory_path() / ("rocketscope_test_config_" + std::to_string(getpid()));
        fs::create_directories(tmp_dir_);
        path_ = (tmp_dir_ / "rocketscopeconfig.json").string();
    }

    ~ConfigFileFixture() {
        std::error_code ec;
        fs::remove_all(tmp_dir_, ec);
        Config::get_instance()->reset_to_defaults();
    }

    void write(const std::string& content) {
        std::ofstream out(path_);
        out << content;
    }

    std::string read() const {
        std::ifstream in(path_);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

  protected:
    fs::path tmp_dir_;
    std::string path_;
};

} // namespace

// ============================================================================
// Config
// ============================================================================

TEST_CASE_METHOD(ConfigFileFixture, "Config writes defaults when file is missing", "[config]") {
    Config* config = Config::get_instance();
    REQUIRE(config->init(path_));
    REQUIRE(fs::exists(path_));

    auto saved = json::parse(read());
    REQUIRE(saved["source"]["type"] == "simulator");
    REQUIRE(saved["source"]["tcp"]["port"] == 5000);
    REQUIRE(config->get<int>("/history/capacity", 0) == 500);
}

TEST_CASE_METHOD(ConfigFileFixture, "Config merges file over defaults", "[config]") {
    write(R"({"source": {"type": "tcp", "tcp": {"host": "10.0.0.5"}}})");

    Config* config = Config::get_instance();
    REQUIRE(config->init(path_));
    REQUIRE(config->get<std::string>("/source/type", "") == "tcp");
    REQUIRE(config->get<std::string>("/source/tcp/host", "") == "10.0.0.5");
    // Missing keys keep defaults
    REQUIRE(config->get<int>("/source/tcp/port", 0) == 5000);
    REQUIRE(config->get<int>("/acquisition/interval_ms", 0) == 50);
}

TEST_CASE_METHOD(ConfigFileFixture, "Config falls back to defaults on bad files", "[config]") {
    Config* config = Config::get_instance();

    SECTION("malformed JSON") {
        write("{ not json");
        REQUIRE_FALSE(config->init(path_));
    }

    SECTION("not an object") {
        write("[1, 2, 3]");
        REQUIRE_FALSE(config->init(path_));
    }

    REQUIRE(config->get<std::string>("/source/type", "") == "simulator");
}

TEST_CASE_METHOD(ConfigFileFixture, "Config get returns default for mistyped values", "[config]") {
    write(R"({"history": {"capacity": "lots"}})");
    Config* config = Config::get_instance();
    REQUIRE(config->init(path_));

    REQUIRE(config->get<int>("/history/capacity", 123) == 123);
    REQUIRE(config->get<int>("/no/such/key", 7) == 7);
    REQUIRE_FALSE(config->exists("/no/such/key"));
    REQUIRE(config->exists("/history"));
}

TEST_CASE_METHOD(ConfigFileFixture, "Config set and save persist values", "[config]") {
    Config* config = Config::get_instance();
    REQUIRE(config->init(path_));

    config->set<std::string>("/source/serial/port", "/dev/ttyACM0");
    REQUIRE(config->save());

    REQUIRE(config->init(path_));
    REQUIRE(config->get<std::string>("/source/serial/port", "") == "/dev/ttyACM0");
}

// ============================================================================
// AppSettings
// ============================================================================

TEST_CASE_METHOD(ConfigFileFixture, "AppSettings defaults", "[config][settings]") {
    Config* config = Config::get_instance();
    REQUIRE(config->init(path_));

    AppSettings s = load_app_settings(*config);
    REQUIRE(s.source.type == SourceType::Simulator);
    REQUIRE(s.source.serial.port == "/dev/ttyUSB0");
    REQUIRE(s.source.serial.baud == 9600);
    REQUIRE(s.source.tcp.host == "192.168.1.100");
    REQUIRE(s.source.tcp.port == 5000);
    REQUIRE(s.acquisition_interval_ms == 50);
    REQUIRE(s.render_period_ms == 50);
    REQUIRE(s.history_capacity == 500);
    REQUIRE(s.log_lines == 5);
    REQUIRE(s.charts == std::vector<Metric>{Metric::Altitude, Metric::Velocity});
    REQUIRE(s.display_width == 1200);
    REQUIRE(s.display_height == 800);
    REQUIRE(s.log_level == "info");
}

TEST_CASE_METHOD(ConfigFileFixture, "AppSettings repairs invalid values", "[config][settings]") {
    write(R"({
        "source": {"type": "carrier-pigeon", "serial": {"baud": 12345, "settle_ms": -5}},
        "acquisition": {"interval_ms": 5},
        "history": {"capacity": 0},
        "charts": ["pressure", "bogus"]
    })");
    Config* config = Config::get_instance();
    REQUIRE(config->init(path_));

    AppSettings s = load_app_settings(*config);
    REQUIRE(s.source.type == SourceType::Simulator);
    REQUIRE(s.source.serial.baud == 9600);
    REQUIRE(s.source.serial.settle_ms == 0);
    REQUIRE(s.acquisition_interval_ms == 20);
    REQUIRE(s.history_capacity == 500);
    REQUIRE(s.charts == std::vector<Metric>{Metric::Pressure});
}

TEST_CASE_METHOD(ConfigFileFixture, "store_source_config round trips connection choices",
                 "[config][settings]") {
    Config* config = Config::get_instance();
    REQUIRE(config->init(path_));

    SourceConfig source;
    source.type = SourceType::Tcp;
    source.tcp.host = "127.0.0.1";
    source.tcp.port = 6000;
    source.serial.baud = 115200;
    store_source_config(*config, source);
    REQUIRE(config->save());

    REQUIRE(config->init(path_));
    AppSettings s = load_app_settings(*config);
    REQUIRE(s.source.type == SourceType::Tcp);
    REQUIRE(s.source.tcp.host == "127.0.0.1");
    REQUIRE(s.source.tcp.port == 6000);
    REQUIRE(s.source.serial.baud == 115200);
}
