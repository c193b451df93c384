#include <catch2/catch_all.hpp>
#include "../utils/bqa_config.h"
#include "../utils/bqa_exceptions.h"
#include "../utils/bqa_log.h"
#include <cstdlib>

using namespace bqa;

namespace {

// Clears the variables that feed option defaults for the lifetime of a test.
struct clean_config_environment {
  clean_config_environment() {
    unsetenv("BQA_LOG_LEVEL");
    unsetenv("BQA_LOG_FILE");
    unsetenv("BQA_GIT_VERSION");
  }
  ~clean_config_environment() {
    unsetenv("BQA_LOG_LEVEL");
    unsetenv("BQA_LOG_FILE");
    unsetenv("BQA_GIT_VERSION");
  }
};

} // namespace

SCENARIO("bqa_check_config parses the checker command line") {
    clean_config_environment env;

    GIVEN("Only an input path") {
        bqa_check_config config = bqa_check_config::parse({"data/GDL-1900"});

        THEN("Defaults apply") {
            REQUIRE(config.input == "data/GDL-1900");
            REQUIRE(config.output == "output.jsonl");
            REQUIRE_FALSE(config.git_version.has_value());
            REQUIRE_FALSE(config.iiif_gallica_v3);
            REQUIRE_FALSE(config.random);
            REQUIRE(config.http_timeout_base == 1);
            REQUIRE(config.log.log_level == "INFO");
            REQUIRE(config.log.log_file.empty());
            REQUIRE_FALSE(config.show_help);
        }
    }

    GIVEN("Every option") {
        bqa_check_config config = bqa_check_config::parse({
            "--output", "-", "--git_version=v1.2.3", "--iiif-gallica-v3", "--random",
            "--http-timeout-base", "4", "--log-level", "debug", "--log-file=run.log", "pages.jsonl"});

        THEN("Each value is taken over") {
            REQUIRE(config.input == "pages.jsonl");
            REQUIRE(config.output == "-");
            REQUIRE(config.git_version == std::optional<std::string>("v1.2.3"));
            REQUIRE(config.iiif_gallica_v3);
            REQUIRE(config.random);
            REQUIRE(config.http_timeout_base == 4);
            REQUIRE(config.log.log_level == "debug");
            REQUIRE(config.log.log_file == "run.log");
        }
    }

    GIVEN("Environment defaults") {
        setenv("BQA_LOG_LEVEL", "WARNING", 1);
        setenv("BQA_GIT_VERSION", "abc123", 1);

        WHEN("The command line does not override them") {
            bqa_check_config config = bqa_check_config::parse({"in"});

            THEN("The environment values are used") {
                REQUIRE(config.log.log_level == "WARNING");
                REQUIRE(config.git_version == std::optional<std::string>("abc123"));
            }
        }

        WHEN("The command line overrides them") {
            bqa_check_config config = bqa_check_config::parse({"in", "--log-level", "ERROR"});

            THEN("The command line wins") {
                REQUIRE(config.log.log_level == "ERROR");
            }
        }
    }

    GIVEN("A help request") {
        THEN("Help is flagged even without input") {
            REQUIRE(bqa_check_config::parse({"--help"}).show_help);
            REQUIRE(bqa_check_config::parse({"-h"}).show_help);
            REQUIRE(bqa_check_config::usage("bboxqa").find("--iiif-gallica-v3") != std::string::npos);
        }
    }

    GIVEN("Invalid command lines") {
        THEN("A configuration error is raised") {
            REQUIRE_THROWS_AS(bqa_check_config::parse({}), bqa_config_error);
            REQUIRE_THROWS_AS(bqa_check_config::parse({"in", "--verbose"}), bqa_config_error);
            REQUIRE_THROWS_AS(bqa_check_config::parse({"in", "--output"}), bqa_config_error);
            REQUIRE_THROWS_AS(bqa_check_config::parse({"in", "other"}), bqa_config_error);
            REQUIRE_THROWS_AS(bqa_check_config::parse({"in", "--http-timeout-base", "soon"}), bqa_config_error);
            REQUIRE_THROWS_AS(bqa_check_config::parse({"in", "--http-timeout-base", "0"}), bqa_config_error);
        }
    }
}

SCENARIO("bqa_stats_config parses the statistics tool command line") {
    clean_config_environment env;

    GIVEN("Input and output") {
        bqa_stats_config config = bqa_stats_config::parse({"-i", "page.json", "--output", "stats.jsonl"});

        THEN("Both are set") {
            REQUIRE(config.input == "page.json");
            REQUIRE(config.output == "stats.jsonl");
        }
    }

    GIVEN("A missing output") {
        THEN("A configuration error is raised") {
            REQUIRE_THROWS_AS(bqa_stats_config::parse({"-i", "page.json"}), bqa_config_error);
            REQUIRE_THROWS_AS(bqa_stats_config::parse({"page.json"}), bqa_config_error);
        }
    }
}

SCENARIO("apply_log_config configures the logger") {
    GIVEN("A known level name in any case") {
        bqa_log_config config;
        config.log_level = "warning";

        THEN("The level is applied") {
            apply_log_config(config);
            REQUIRE(bqa_log::get_level() == log_level::WARNING);
            REQUIRE_FALSE(bqa_log::enabled(log_level::INFO));
            REQUIRE(bqa_log::enabled(log_level::ERROR));
            bqa_log::set_level(log_level::INFO);
        }
    }

    GIVEN("An unknown level name") {
        bqa_log_config config;
        config.log_level = "chatty";

        THEN("A configuration error is raised and the level is unchanged") {
            bqa_log::set_level(log_level::INFO);
            REQUIRE_THROWS_AS(apply_log_config(config), bqa_config_error);
            REQUIRE(bqa_log::get_level() == log_level::INFO);
        }
    }
}
