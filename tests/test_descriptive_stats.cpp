#include <catch2/catch_all.hpp>
#include "../qaprocesses/stats/bqa_descriptive_stats.h"

using namespace bqa;
using Catch::Approx;

SCENARIO("Descriptive statistics over a sequence of values") {
    GIVEN("An empty sequence") {
        bqa_descriptive_stats stats = bqa_descriptive_stats_calculator::compute({});

        THEN("Count is zero, mode is absent and everything else is zero") {
            REQUIRE(stats.count == 0);
            REQUIRE_FALSE(stats.mode.has_value());
            REQUIRE(stats.mean == 0);
            REQUIRE(stats.median == 0);
            REQUIRE(stats.min == 0);
            REQUIRE(stats.max == 0);
            REQUIRE(stats.range == 0);
            REQUIRE(stats.variance == 0);
            REQUIRE(stats.std_dev == 0);
            REQUIRE(stats.skewness == 0);
            REQUIRE(stats.kurtosis == 0);
        }
    }

    GIVEN("The values 10, 20, 20, 30") {
        bqa_descriptive_stats stats = bqa_descriptive_stats_calculator::compute({10, 20, 20, 30});

        THEN("Location and spread match the hand computed values") {
            REQUIRE(stats.count == 4);
            REQUIRE(stats.mean == 20);
            REQUIRE(stats.median == 20);
            REQUIRE(stats.mode.has_value());
            REQUIRE(*stats.mode == 20);
            REQUIRE(stats.min == 10);
            REQUIRE(stats.max == 30);
            REQUIRE(stats.range == 20);
            REQUIRE(stats.variance == Approx(66.67));
            REQUIRE(stats.std_dev == Approx(8.16));
        }

        THEN("The distribution is symmetric and flat") {
            REQUIRE(stats.skewness == 0);
            REQUIRE(stats.kurtosis == Approx(-1.87).margin(0.005));
        }
    }

    GIVEN("A single value") {
        bqa_descriptive_stats stats = bqa_descriptive_stats_calculator::compute({42.5});

        THEN("Spread and shape are zero") {
            REQUIRE(stats.count == 1);
            REQUIRE(stats.mean == 42.5);
            REQUIRE(stats.median == 42.5);
            REQUIRE(*stats.mode == 42.5);
            REQUIRE(stats.range == 0);
            REQUIRE(stats.variance == 0);
            REQUIRE(stats.std_dev == 0);
            REQUIRE(stats.skewness == 0);
            REQUIRE(stats.kurtosis == 0);
        }
    }

    GIVEN("Values where several are equally frequent") {
        bqa_descriptive_stats stats = bqa_descriptive_stats_calculator::compute({3, 1, 3, 1, 2});

        THEN("The smallest of the most frequent values is the mode") {
            REQUIRE(*stats.mode == 1);
            REQUIRE(stats.median == 2);
        }
    }

    GIVEN("Values whose mean is not a round number") {
        bqa_descriptive_stats stats = bqa_descriptive_stats_calculator::compute({1, 2, 2});

        THEN("Mean is rounded to two decimals and skew follows the rounded figures") {
            REQUIRE(stats.mean == Approx(1.67));
            REQUIRE(stats.median == 2);
            REQUIRE(stats.std_dev == Approx(0.58));
            REQUIRE(stats.skewness == Approx(-1.71));
        }
    }

    GIVEN("An even number of unsorted values") {
        bqa_descriptive_stats stats = bqa_descriptive_stats_calculator::compute({9, 1, 7, 3});

        THEN("The median averages the two middle values") {
            REQUIRE(stats.median == 5);
            REQUIRE(stats.min == 1);
            REQUIRE(stats.max == 9);
        }
    }
}

SCENARIO("round_to sends exact halves to the even digit") {
    REQUIRE(round_to(2.345, 1) == Approx(2.3));
    REQUIRE(round_to(0.125, 2) == Approx(0.12));
    REQUIRE(round_to(-0.125, 2) == Approx(-0.12));
    REQUIRE(round_to(0.375, 2) == Approx(0.38));
    REQUIRE(round_to(12.5, 0) == 12);
    REQUIRE(round_to(13.5, 0) == 14);
    REQUIRE(round_to(1.126, 2) == Approx(1.13));
}

SCENARIO("A mean landing on an exact half rounds to the even digit") {
    GIVEN("Seven ones and a two") {
        bqa_descriptive_stats stats = bqa_descriptive_stats_calculator::compute({1, 1, 1, 1, 1, 1, 1, 2});

        THEN("The mean 1.125 is written as 1.12") {
            REQUIRE(stats.mean == Approx(1.12).epsilon(0).margin(1e-9));
        }
    }
}
