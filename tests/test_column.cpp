#include <fleetfuel/core/column.hpp>
#include <fleetfuel/core/time.hpp>
#include <fleetfuel/core/units.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

TEST_CASE("Column<double> basic operations", "[core][column]") {
    fleetfuel::Column<double> col{812.5, 1004.0, 1500.25};

    SECTION("size and element access") {
        REQUIRE(col.size() == 3);
        REQUIRE_FALSE(col.empty());
        REQUIRE(col.at(0) == 812.5);
        REQUIRE(col[2] == 1500.25);
        REQUIRE(col.front() == 812.5);
        REQUIRE(col.back() == 1500.25);
    }

    SECTION("push_back grows the column") {
        col.push_back(990.0);
        REQUIRE(col.size() == 4);
        REQUIRE(col.at(3) == 990.0);
    }

    SECTION("span provides zero-copy view") {
        auto view = col.span();
        REQUIRE(view.size() == 3);
        REQUIRE(view.data() == &col[0]);
    }

    SECTION("at() throws on out-of-bounds") {
        REQUIRE_THROWS_AS(col.at(100), std::out_of_range);
    }

    SECTION("resize pads with the given value") {
        col.resize(5, 0.0);
        REQUIRE(col.size() == 5);
        REQUIRE(col[4] == 0.0);
    }
}

TEST_CASE("Column transform changes the element type", "[core][column]") {
    fleetfuel::Column<fleetfuel::GallonsPerHour> hourly{
        fleetfuel::GallonsPerHour{3600.0},
        fleetfuel::GallonsPerHour{0.7},
    };

    auto per_second = hourly.transform(
        [](fleetfuel::GallonsPerHour r) { return fleetfuel::to_per_second(r); });

    REQUIRE(per_second.size() == 2);
    REQUIRE(per_second[0].value == Catch::Approx(1.0));
    REQUIRE(per_second[1].value == Catch::Approx(0.7 / 3600.0));
}

TEST_CASE("Column of timestamps compares element-wise", "[core][column]") {
    using fleetfuel::Timestamp;
    fleetfuel::Column<Timestamp> a{Timestamp{0}, Timestamp{10}};
    fleetfuel::Column<Timestamp> b{Timestamp{0}, Timestamp{10}};

    REQUIRE(a == b);
    b.push_back(Timestamp{20});
    REQUIRE_FALSE(a == b);
}

TEST_CASE("Column default-constructs empty", "[core][column]") {
    fleetfuel::Column<double> col;

    REQUIRE(col.empty());
    REQUIRE(col.size() == 0);
}

TEST_CASE("Column range-for iteration", "[core][column]") {
    fleetfuel::Column<double> col{10.0, 20.0, 30.0};

    double sum = 0.0;
    for (auto val : col) {
        sum += val;
    }
    REQUIRE(sum == 60.0);
}
