// Hyperdrive - Configuration Tests

#include <catch2/catch_test_macros.hpp>
#include <hyper/config.hpp>
#include <hyper/errors.hpp>
#include <hyper/log.hpp>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace hyper;

TEST_CASE("Decimal text", "[config]") {
    SECTION("Parsing") {
        REQUIRE(parse_fixed("1") == ONE);
        REQUIRE(parse_fixed("0.05") == U256(50000000000000000ULL));
        REQUIRE(parse_fixed("12.000000000000000001") == U256("12000000000000000001"));
        REQUIRE(parse_fixed(".5") == U256(500000000000000000ULL));
    }

    SECTION("Malformed input") {
        REQUIRE_THROWS_AS(parse_fixed(""), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_fixed("1.2.3"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_fixed("-1"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_fixed("0.0000000000000000001"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_fixed("."), std::invalid_argument);
    }

    SECTION("Formatting") {
        REQUIRE(format_fixed(ONE) == "1");
        REQUIRE(format_fixed(U256(1250000000000000000ULL)) == "1.25");
        REQUIRE(format_fixed(U256(1)) == "0.000000000000000001");
        REQUIRE(format_fixed(U256(0)) == "0");
    }
}

TEST_CASE("PoolConfig defaults and builders", "[config]") {
    PoolConfig config;
    REQUIRE(config.initial_vault_share_price == ONE);
    REQUIRE(config.position_duration == SECONDS_PER_YEAR);
    REQUIRE(config.checkpoint_duration == 86400);
    REQUIRE(config.time_stretch == calculate_time_stretch(U256(50000000000000000ULL)));
    REQUIRE_NOTHROW(config.validate());

    config.with_durations(7 * 86400, 86400)
          .with_fees(U256(100000000000000000ULL), U256(500000000000000ULL), U256(150000000000000000ULL))
          .with_log_level("debug");
    REQUIRE(config.position_duration == 7 * 86400);
    REQUIRE(config.fees.flat == U256(500000000000000ULL));
    REQUIRE(config.log_level == "debug");
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("Time stretch from the target rate", "[config]") {
    REQUIRE(calculate_time_stretch(U256(50000000000000000ULL)) == U256(44463125629060298ULL));
    REQUIRE(calculate_time_stretch(0) == 0);
    REQUIRE_THROWS_AS(calculate_time_stretch(U256_MAX / 50), ArithmeticError);
}

TEST_CASE("PoolConfig validation", "[config]") {
    auto code_of = [](const PoolConfig& config) {
        try {
            config.validate();
        } catch (const ValidationError& e) {
            return e.code();
        }
        return errors::OK;
    };

    SECTION("Position duration must be whole checkpoints") {
        REQUIRE(code_of(PoolConfig().with_durations(86400 * 7 + 1, 86400)) == errors::INVALID_CONFIG);
        REQUIRE(code_of(PoolConfig().with_durations(3600, 86400)) == errors::INVALID_CONFIG);
        REQUIRE(code_of(PoolConfig().with_durations(86400, 0)) == errors::INVALID_CONFIG);
    }

    SECTION("Time stretch in (0, 1)") {
        REQUIRE(code_of(PoolConfig().with_time_stretch(0)) == errors::INVALID_CONFIG);
        REQUIRE(code_of(PoolConfig().with_time_stretch(ONE)) == errors::INVALID_CONFIG);
    }

    SECTION("Fees at most one") {
        REQUIRE(code_of(PoolConfig().with_fees(ONE + 1, 0, 0)) == errors::INVALID_CONFIG);
        REQUIRE(code_of(PoolConfig().with_fees(ONE, ONE, ONE)) == errors::OK);
    }

    SECTION("Positive prices and reserves") {
        REQUIRE(code_of(PoolConfig().with_initial_vault_share_price(0)) == errors::INVALID_CONFIG);
        REQUIRE(code_of(PoolConfig().with_minimum_share_reserves(0)) == errors::INVALID_CONFIG);
    }

    SECTION("Unknown log level") {
        REQUIRE_THROWS_AS(PoolConfig().with_log_level("verbose").validate(), std::invalid_argument);
    }
}

TEST_CASE("PoolConfig from JSON", "[config]") {
    SECTION("Full document") {
        PoolConfig config = PoolConfig::from_json(R"({
            "initial_vault_share_price": "1.05",
            "minimum_share_reserves": "10",
            "minimum_transaction_amount": 0.001,
            "position_duration": 604800,
            "checkpoint_duration": 3600,
            "time_stretch": "0.0449",
            "fees": { "curve": "0.01", "flat": "0.0005", "governance": "0.15" },
            "log_level": "warn"
        })");

        REQUIRE(config.initial_vault_share_price == U256(1050000000000000000ULL));
        REQUIRE(config.minimum_share_reserves == U256(10) * ONE);
        REQUIRE(config.minimum_transaction_amount == U256(1000000000000000ULL));
        REQUIRE(config.position_duration == 604800);
        REQUIRE(config.checkpoint_duration == 3600);
        REQUIRE(config.time_stretch == U256(44900000000000000ULL));
        REQUIRE(config.fees.curve == U256(10000000000000000ULL));
        REQUIRE(config.fees.flat == U256(500000000000000ULL));
        REQUIRE(config.fees.governance == U256(150000000000000000ULL));
        REQUIRE(config.log_level == "warn");
    }

    SECTION("Target rate derives the time stretch") {
        PoolConfig config = PoolConfig::from_json(R"({ "target_rate": "0.1" })");
        REQUIRE(config.time_stretch == calculate_time_stretch(U256(100000000000000000ULL)));
        REQUIRE(config.time_stretch > PoolConfig().time_stretch);
    }

    SECTION("Omitted fields keep defaults") {
        PoolConfig config = PoolConfig::from_json("{}");
        REQUIRE(config.position_duration == SECONDS_PER_YEAR);
        REQUIRE(config.fees.curve == 0);
    }

    SECTION("Rejected documents") {
        REQUIRE_THROWS_AS(PoolConfig::from_json("{ not json"), std::runtime_error);
        REQUIRE_THROWS_AS(PoolConfig::from_json("[1, 2]"), std::runtime_error);
        REQUIRE_THROWS_AS(PoolConfig::from_json(R"({ "position_duration": -5 })"), std::runtime_error);
        REQUIRE_THROWS_AS(PoolConfig::from_json(R"({ "checkpoint_duration": 7 })"), ValidationError);
    }

    SECTION("From file") {
        const std::string path = "hyper_test_config.json";
        {
            std::ofstream out(path);
            out << R"({ "position_duration": 1209600, "checkpoint_duration": 86400 })";
        }
        PoolConfig config = PoolConfig::from_file(path);
        std::remove(path.c_str());
        REQUIRE(config.position_duration == 1209600);

        REQUIRE_THROWS_AS(PoolConfig::from_file("does_not_exist.json"), std::runtime_error);
    }
}

TEST_CASE("Leveled logging", "[config][log]") {
    std::vector<std::pair<log::Level, std::string>> lines;
    log::set_sink([&](log::Level level, const std::string& message) {
        lines.emplace_back(level, message);
    });
    log::Level previous = log::level();
    log::set_level(log::Level::WARN);

    log::info("dropped");
    log::warn("kept");
    log::error("also kept");

    log::set_level(previous);
    log::set_sink(nullptr);

    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0].first == log::Level::WARN);
    REQUIRE(lines[0].second == "kept");
    REQUIRE(log::parse_level("debug") == log::Level::DEBUG);
    REQUIRE_THROWS_AS(log::parse_level("loud"), std::invalid_argument);
}
