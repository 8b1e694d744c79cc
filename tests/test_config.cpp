#include "gas_deblend/config/configuration.hpp"
#include "gas_deblend/core/errors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace cfgns = gas_deblend::config;

TEST_CASE("config_defaults_validate") {
    cfgns::Config cfg;
    REQUIRE_NOTHROW(cfg.validate());
    REQUIRE(cfg.data.upsample_factor == 3);
    REQUIRE(cfg.masks.strict_epsilon == Catch::Approx(1e-4f));
    REQUIRE(cfg.masks.loose_epsilon == Catch::Approx(1e-7f));
}

TEST_CASE("config_yaml_round_trip_keeps_non_default_values") {
    cfgns::Config cfg;
    cfg.data.upsample_factor = 5;
    cfg.peaks.cap_policy = "per_channel";
    cfg.peaks.max_peaks = 12;
    cfg.growth.factor_3d = 0.25f;
    cfg.output.write_2d = false;

    auto back = cfgns::Config::from_yaml(YAML::Load(YAML::Dump(cfg.to_yaml())));

    REQUIRE(back.data.upsample_factor == 5);
    REQUIRE(back.peaks.cap_policy == "per_channel");
    REQUIRE(back.peaks.max_peaks == 12);
    REQUIRE(back.growth.factor_3d == Catch::Approx(0.25f));
    REQUIRE_FALSE(back.output.write_2d);
    REQUIRE(back.output.write_fixed3d);
}

TEST_CASE("config_from_yaml_reads_partial_documents") {
    auto cfg = cfgns::Config::from_yaml(YAML::Load(
        "data:\n"
        "  upsample_factor: 2\n"
        "watershed:\n"
        "  connectivity_3d: 3\n"));

    REQUIRE(cfg.data.upsample_factor == 2);
    REQUIRE(cfg.watershed.connectivity_3d == 3);
    REQUIRE(cfg.watershed.connectivity_2d == 1);
}

TEST_CASE("config_from_yaml_wraps_type_errors") {
    REQUIRE_THROWS_AS(cfgns::Config::from_yaml(YAML::Load("data:\n  upsample_factor: three\n")),
                      gas_deblend::ConfigError);
}

TEST_CASE("config_validate_rejects_bad_values") {
    cfgns::Config cfg;
    cfg.watershed.connectivity_2d = 3;
    REQUIRE_THROWS_AS(cfg.validate(), gas_deblend::ValidationError);

    cfg = cfgns::Config();
    cfg.peaks.box_size = 4;
    REQUIRE_THROWS_AS(cfg.validate(), gas_deblend::ValidationError);

    cfg = cfgns::Config();
    cfg.masks.loose_epsilon = 1e-2f;
    REQUIRE_THROWS_AS(cfg.validate(), gas_deblend::ValidationError);

    cfg = cfgns::Config();
    cfg.data.upsample_factor = 0;
    REQUIRE_THROWS_AS(cfg.validate(), gas_deblend::ValidationError);

    cfg = cfgns::Config();
    cfg.peaks.cap_policy = "random";
    REQUIRE_THROWS_AS(cfg.validate(), gas_deblend::ValidationError);
}

TEST_CASE("config_schema_is_valid_json") {
    auto schema = nlohmann::json::parse(cfgns::get_schema_json());
    REQUIRE(schema["type"].get<std::string>() == "object");
    REQUIRE(schema["properties"].contains("peaks"));
}

TEST_CASE("config_load_reports_missing_file") {
    REQUIRE_THROWS_AS(cfgns::Config::load("/nonexistent/gas_deblend.yaml"),
                      gas_deblend::ConfigError);
}
