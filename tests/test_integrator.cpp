#include <fleetfuel/core/units.hpp>
#include <fleetfuel/pipeline/integrator.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <vector>

using Catch::Approx;
using fleetfuel::Column;
using fleetfuel::GallonsPerHour;
using fleetfuel::GallonsPerSecond;
using fleetfuel::Timestamp;
using fleetfuel::pipeline::elapsed_hours;
using fleetfuel::pipeline::integrate;
using fleetfuel::pipeline::RateSeries;

namespace {

auto series(std::vector<std::int64_t> times, std::vector<double> rates) -> RateSeries {
    RateSeries out;
    for (auto t : times) {
        out.time.push_back(Timestamp{t});
    }
    for (auto r : rates) {
        out.rate.push_back(GallonsPerSecond{r});
    }
    return out;
}

}  // namespace

TEST_CASE("integrate - degenerate series integrate to zero", "[pipeline][integrator]") {
    REQUIRE(integrate(RateSeries{}) == 0.0);
    REQUIRE(integrate(series({42}, {5.0})) == 0.0);
}

TEST_CASE("integrate - left Riemann sum", "[pipeline][integrator]") {
    SECTION("uniform steps") {
        REQUIRE(integrate(series({0, 10}, {0.5, 99.0})) == Approx(5.0));
    }

    SECTION("non-uniform steps use each interval's left value") {
        // 1*2 + 3*5 + 2*1; the final rate opens no interval.
        REQUIRE(integrate(series({0, 2, 7, 8}, {1.0, 3.0, 2.0, 100.0})) == Approx(19.0));
    }
}

TEST_CASE("integrate - mismatched lengths throw", "[pipeline][integrator]") {
    auto bad = series({0, 1, 2}, {1.0, 1.0});
    REQUIRE_THROWS_AS(integrate(bad), std::invalid_argument);
}

TEST_CASE("elapsed_hours", "[pipeline][integrator]") {
    REQUIRE(elapsed_hours({}) == 0.0);

    std::vector<Timestamp> one{Timestamp{100}};
    REQUIRE(elapsed_hours(one) == 0.0);

    std::vector<Timestamp> times{Timestamp{1800}, Timestamp{0}, Timestamp{7200}};
    REQUIRE(elapsed_hours(times) == Approx(2.0));
}

TEST_CASE("mean", "[pipeline][integrator]") {
    REQUIRE_FALSE(fleetfuel::pipeline::mean({}).has_value());

    std::vector<double> speeds{30.0, 32.0};
    auto m = fleetfuel::pipeline::mean(speeds);
    REQUIRE(m.has_value());
    REQUIRE(*m == Approx(31.0));
}

TEST_CASE("Hourly rates convert to per-second once", "[core][units]") {
    static_assert(fleetfuel::to_per_second(GallonsPerHour{3600.0}).value == 1.0);
    static_assert(fleetfuel::to_per_hour(GallonsPerSecond{1.0}).value == 3600.0);

    // A constant 0.7 gal/h over one hour is 0.7 gallons.
    RateSeries hour;
    hour.time = Column<Timestamp>{Timestamp{0}, Timestamp{3600}};
    hour.rate = Column<GallonsPerSecond>{fleetfuel::to_per_second(GallonsPerHour{0.7}),
                                         fleetfuel::to_per_second(GallonsPerHour{0.7})};
    REQUIRE(integrate(hour) == Approx(0.7));
}
