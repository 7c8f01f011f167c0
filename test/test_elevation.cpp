#include <doctest/doctest.h>

#include "layerkit/layerkit.hpp"

#include <locale>
#include <sstream>

TEST_CASE("Elevation - Construction and equality") {
    SUBCASE("Same scalar gives equal values") {
        lk::Elevation a(45.5);
        lk::Elevation b(45.5);
        CHECK(a == b);
        CHECK(a.decimalDegrees() == doctest::Approx(45.5));
    }

    SUBCASE("Different scalars differ") { CHECK(lk::Elevation(10.0) != lk::Elevation(10.5)); }

    SUBCASE("Rebuilding from the scalar reproduces the value") {
        lk::Elevation original(-33.125);
        CHECK(lk::Elevation(original.decimalDegrees()) == original);
    }

    SUBCASE("Empty constant is a zero elevation") {
        static_assert(lk::EmptyElevation.decimalDegrees() == 0.0);
        CHECK(lk::EmptyElevation == lk::Elevation());
    }
}

TEST_CASE("Elevation - Text rendering") {
    CHECK(lk::Elevation(45.0).toString() == "45\xC2\xB0");
    CHECK(lk::Elevation(-12.5).toString() == "-12.5\xC2\xB0");
    CHECK(lk::Elevation(0.0).toString() == "0\xC2\xB0");
    CHECK(lk::Elevation(-0.0).toString() == "0\xC2\xB0");

    SUBCASE("Culture decimal separator") {
        lk::Culture comma{"comma", ',', '.'};
        CHECK(lk::Elevation(12.75).toString(comma) == "12,75\xC2\xB0");
    }

    SUBCASE("Stream output") {
        std::ostringstream oss;
        oss << lk::Elevation(30.25);
        CHECK(oss.str() == "30.25\xC2\xB0");
    }
}

TEST_CASE("Elevation - Parsing") {
    SUBCASE("Plain numbers") {
        CHECK(lk::Elevation::parse("45") == lk::Elevation(45.0));
        CHECK(lk::Elevation::parse("  -12.5 ") == lk::Elevation(-12.5));
        CHECK(lk::Elevation::parse("+7.25") == lk::Elevation(7.25));
    }

    SUBCASE("Degree sign") { CHECK(lk::Elevation::parse("45.5\xC2\xB0") == lk::Elevation(45.5)); }

    SUBCASE("Degrees, minutes and seconds") {
        CHECK(lk::Elevation::parse("45\xC2\xB0" "30'").decimalDegrees() == doctest::Approx(45.5));
        CHECK(lk::Elevation::parse("10\xC2\xB0 30' 36\"").decimalDegrees() == doctest::Approx(10.51));
        CHECK(lk::Elevation::parse("-10\xC2\xB0" "30'").decimalDegrees() == doctest::Approx(-10.5));
    }

    SUBCASE("Culture separators") {
        lk::Culture german{"de", ',', '.'};
        CHECK(lk::Elevation::parse("12,75", german) == lk::Elevation(12.75));
        CHECK(lk::Elevation::parse("1.234,5", german) == lk::Elevation(1234.5));
        CHECK(lk::Elevation::parse("1,234.5") == lk::Elevation(1234.5));
    }

    SUBCASE("Culture from the classic locale") {
        auto culture = lk::Culture::fromLocale(std::locale::classic());
        CHECK(culture.decimal_separator == '.');
        CHECK(lk::Elevation::parse("3.5", culture) == lk::Elevation(3.5));
    }

    SUBCASE("Exponent") { CHECK(lk::Elevation::parse("1.5e-20").decimalDegrees() == doctest::Approx(1.5e-20)); }

    SUBCASE("Standard value names") {
        CHECK(lk::Elevation::parse("Equator") == lk::elevations::Equator);
        CHECK(lk::Elevation::parse("northpole") == lk::Elevation(90.0));
        CHECK(lk::Elevation::parse("SouthPole") == lk::Elevation(-90.0));
        CHECK(lk::Elevation::parse("TropicOfCancer") == lk::Elevation(23.5));
        CHECK(lk::Elevation::parse(" TropicOfCapricorn ") == lk::Elevation(-23.5));
    }

    SUBCASE("Text round-trip") {
        for (double v : {0.0, 0.1, 45.5, -12.25, 89.999, 1234.5678}) {
            lk::Elevation e(v);
            CHECK(lk::Elevation::parse(e.toString()) == e);
        }
        lk::Culture german{"de", ',', '.'};
        lk::Elevation e(-3.75);
        CHECK(lk::Elevation::parse(e.toString(german), german) == e);
    }
}
