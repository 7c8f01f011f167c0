#include <doctest/doctest.h>

#include "layerkit/layerkit.hpp"

#include <cstdint>
#include <optional>
#include <string>

TEST_CASE("ElevationConverter - Supported kinds") {
    lk::ElevationConverter converter;

    SUBCASE("Convert from") {
        CHECK(converter.canConvertFrom(lk::RepresentationKind::Text));
        CHECK(converter.canConvertFrom(lk::RepresentationKind::Number));
        CHECK(converter.canConvertFrom(lk::RepresentationKind::Descriptor));
        CHECK(converter.canConvertFrom(lk::RepresentationKind::Elevation));
        CHECK_FALSE(converter.canConvertFrom(lk::RepresentationKind::Null));
        CHECK_FALSE(converter.canConvertFrom(lk::RepresentationKind::Integer));
        CHECK_FALSE(converter.canConvertFrom(lk::RepresentationKind::Boolean));
    }

    SUBCASE("Convert to") {
        CHECK(converter.canConvertTo(lk::RepresentationKind::Text));
        CHECK(converter.canConvertTo(lk::RepresentationKind::Number));
        CHECK(converter.canConvertTo(lk::RepresentationKind::Descriptor));
        CHECK(converter.canConvertTo(lk::RepresentationKind::Elevation));
        CHECK_FALSE(converter.canConvertTo(lk::RepresentationKind::Integer));
        CHECK_FALSE(converter.canConvertTo(lk::RepresentationKind::Boolean));
    }

    CHECK(std::string(converter.handledTypeName()) == "layerkit.Elevation");
}

TEST_CASE("ElevationConverter - Convert from") {
    lk::ElevationConverter converter;

    SUBCASE("Text") {
        auto e = converter.convertFrom(lk::Representation{std::string("45.5")});
        CHECK(e == lk::Elevation(45.5));
    }

    SUBCASE("Text with culture") {
        lk::Culture german{"de", ',', '.'};
        auto e = converter.convertFrom(lk::Representation{std::string("45,25")}, german);
        CHECK(e == lk::Elevation(45.25));
    }

    SUBCASE("Number") { CHECK(converter.convertFrom(lk::Representation{12.5}) == lk::Elevation(12.5)); }

    SUBCASE("Same type passes through") {
        lk::Elevation original(-7.0);
        CHECK(converter.convertFrom(lk::Representation{original}) == original);
    }

    SUBCASE("Descriptor is replayed") {
        auto descriptor = lk::InstanceDescriptor::constructor("layerkit.Elevation", 33.0);
        CHECK(converter.convertFrom(lk::Representation{descriptor}) == lk::Elevation(33.0));

        auto empty = lk::InstanceDescriptor::emptyConstant("layerkit.Elevation");
        CHECK(converter.convertFrom(lk::Representation{empty}) == lk::EmptyElevation);
    }

    SUBCASE("Malformed text") {
        CHECK_THROWS_AS(converter.convertFrom(lk::Representation{std::string("north-ish")}), lk::FormatError);
        CHECK_FALSE(converter.isValid(lk::Representation{std::string("north-ish")}));
        CHECK(converter.isValid(lk::Representation{std::string("12")}));
    }

    SUBCASE("Unsupported kinds") {
        CHECK_THROWS_AS(converter.convertFrom(lk::Representation{}), lk::UnsupportedConversionError);
        CHECK_THROWS_AS(converter.convertFrom(lk::Representation{std::int64_t{4}}), lk::UnsupportedConversionError);
        CHECK_THROWS_AS(converter.convertFrom(lk::Representation{true}), lk::UnsupportedConversionError);
        CHECK_FALSE(converter.isValid(lk::Representation{true}));
    }
}

TEST_CASE("ElevationConverter - Convert to") {
    lk::ElevationConverter converter;
    lk::Elevation value(45.0);

    SUBCASE("Same type") {
        auto r = converter.convertTo(value, lk::RepresentationKind::Elevation);
        REQUIRE(std::holds_alternative<lk::Elevation>(r));
        CHECK(std::get<lk::Elevation>(r) == value);
    }

    SUBCASE("Text") {
        auto r = converter.convertTo(value, lk::RepresentationKind::Text);
        REQUIRE(std::holds_alternative<std::string>(r));
        CHECK(std::get<std::string>(r) == "45\xC2\xB0");
    }

    SUBCASE("Null text is the zero sentinel") {
        auto r = converter.convertTo(std::nullopt, lk::RepresentationKind::Text);
        REQUIRE(std::holds_alternative<std::string>(r));
        CHECK(std::get<std::string>(r) == "0\xC2\xB0");
        CHECK(std::get<std::string>(r) == lk::NullElevationText);
    }

    SUBCASE("Number") {
        auto r = converter.convertTo(lk::Elevation(-12.75), lk::RepresentationKind::Number);
        REQUIRE(std::holds_alternative<double>(r));
        CHECK(std::get<double>(r) == -12.75);
    }

    SUBCASE("Descriptor") {
        auto r = converter.convertTo(value, lk::RepresentationKind::Descriptor);
        REQUIRE(std::holds_alternative<lk::InstanceDescriptor>(r));
        const auto &d = std::get<lk::InstanceDescriptor>(r);
        CHECK(d.type == "layerkit.Elevation");
        CHECK(d.isConstructor());
        REQUIRE(d.arguments.size() == 1);
        CHECK(d.arguments[0] == 45.0);
    }

    SUBCASE("Null descriptor names the empty constant") {
        auto r = converter.convertTo(std::nullopt, lk::RepresentationKind::Descriptor);
        REQUIRE(std::holds_alternative<lk::InstanceDescriptor>(r));
        const auto &d = std::get<lk::InstanceDescriptor>(r);
        CHECK(d.member == lk::InstanceDescriptor::Member::EmptyConstant);
        CHECK(d.arguments.empty());
    }

    SUBCASE("Unsupported kinds") {
        CHECK_THROWS_AS(converter.convertTo(value, lk::RepresentationKind::Integer), lk::UnsupportedConversionError);
        CHECK_THROWS_AS(converter.convertTo(value, lk::RepresentationKind::Boolean), lk::UnsupportedConversionError);
        CHECK_THROWS_AS(converter.convertTo(std::nullopt, lk::RepresentationKind::Number),
                        lk::UnsupportedConversionError);
    }
}

TEST_CASE("ElevationConverter - Round trips") {
    lk::ElevationConverter converter;

    SUBCASE("Number path is lossless") {
        for (double s : {0.0, 1e-12, 0.1, 45.123456789012345, -89.99999999, 1e300}) {
            lk::Elevation v(s);
            auto number = converter.convertTo(v, lk::RepresentationKind::Number);
            CHECK(converter.convertFrom(number) == v);
        }
    }

    SUBCASE("Text path under one culture") {
        lk::Culture german{"de", ',', '.'};
        for (double s : {0.0, 12.5, -45.25, 60.125}) {
            lk::Elevation v(s);
            auto text = converter.convertTo(v, lk::RepresentationKind::Text, german);
            CHECK(converter.convertFrom(text, german) == v);
        }
    }

    SUBCASE("Descriptor path") {
        lk::Elevation v(17.75);
        auto descriptor = converter.convertTo(v, lk::RepresentationKind::Descriptor);
        CHECK(converter.convertFrom(descriptor) == v);
    }
}

TEST_CASE("ElevationConverter - Standard values") {
    lk::ElevationConverter converter;

    CHECK(converter.getStandardValuesSupported());
    CHECK_FALSE(converter.getStandardValuesExclusive());

    auto values = converter.getStandardValues();
    REQUIRE(values.size() == 5);
    CHECK(values[0] == "Equator");
    CHECK(values[1] == "NorthPole");
    CHECK(values[2] == "SouthPole");
    CHECK(values[3] == "TropicOfCapricorn");
    CHECK(values[4] == "TropicOfCancer");

    CHECK(converter.getStandardValues() == values);

    SUBCASE("Every standard value converts") {
        for (const auto &name : values) {
            CHECK(converter.isValid(lk::Representation{name}));
        }
    }

    SUBCASE("Values outside the list are still accepted") {
        CHECK(converter.convertFrom(lk::Representation{std::string("12.5")}) == lk::Elevation(12.5));
    }
}
