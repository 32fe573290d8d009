/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CStringUtils.h>
#include <core/CoreTypes.h>

#include <boost/test/unit_test.hpp>

#include <cmath>
#include <string>

BOOST_AUTO_TEST_SUITE(CStringUtilsTest)

using namespace nrt;

BOOST_AUTO_TEST_CASE(testStringToType) {
    {
        double d{0.0};
        BOOST_TEST_REQUIRE(core::CStringUtils::stringToType("0.0412", d));
        BOOST_REQUIRE_EQUAL(0.0412, d);
        BOOST_TEST_REQUIRE(core::CStringUtils::stringToType("-1e-3", d));
        BOOST_REQUIRE_EQUAL(-0.001, d);
        BOOST_TEST_REQUIRE(core::CStringUtils::stringToType("nan", d));
        BOOST_TEST_REQUIRE(std::isnan(d));

        d = 7.0;
        BOOST_TEST_REQUIRE(core::CStringUtils::stringToType("", d) == false);
        BOOST_TEST_REQUIRE(core::CStringUtils::stringToType("0.3x", d) == false);
        BOOST_TEST_REQUIRE(core::CStringUtils::stringToTypeSilent("1e999", d) == false);
        BOOST_REQUIRE_EQUAL(7.0, d);
    }
    {
        core_t::TTime time{0};
        BOOST_TEST_REQUIRE(core::CStringUtils::stringToType("1577836800", time));
        BOOST_REQUIRE_EQUAL(1577836800, time);
        BOOST_TEST_REQUIRE(core::CStringUtils::stringToType("-86400", time));
        BOOST_REQUIRE_EQUAL(-86400, time);
        BOOST_TEST_REQUIRE(core::CStringUtils::stringToType("12.5", time) == false);
        BOOST_REQUIRE_EQUAL(-86400, time);
    }
    {
        std::size_t n{0};
        BOOST_TEST_REQUIRE(core::CStringUtils::stringToType("4", n));
        BOOST_REQUIRE_EQUAL(4, n);
        BOOST_TEST_REQUIRE(core::CStringUtils::stringToTypeSilent("-4", n) == false);
        BOOST_REQUIRE_EQUAL(4, n);
    }
    {
        bool b{false};
        BOOST_TEST_REQUIRE(core::CStringUtils::stringToType("True", b));
        BOOST_TEST_REQUIRE(b);
        BOOST_TEST_REQUIRE(core::CStringUtils::stringToType("0", b));
        BOOST_TEST_REQUIRE(b == false);
        BOOST_TEST_REQUIRE(core::CStringUtils::stringToTypeSilent("maybe", b) == false);
    }
}

BOOST_AUTO_TEST_CASE(testTypeToString) {
    BOOST_REQUIRE_EQUAL(std::string("42"), core::CStringUtils::typeToString(42));
    BOOST_REQUIRE_EQUAL(std::string("true"), core::CStringUtils::typeToString(true));
    BOOST_REQUIRE_EQUAL(std::string("0.500000"), core::CStringUtils::typeToString(0.5));
    BOOST_REQUIRE_EQUAL(std::string("0.333"),
                        core::CStringUtils::typeToStringPrecise(1.0 / 3.0, 3));
}

BOOST_AUTO_TEST_CASE(testTrim) {
    std::string str{"  \t pixel_0 \r\n"};
    core::CStringUtils::trimWhitespace(str);
    BOOST_REQUIRE_EQUAL(std::string("pixel_0"), str);

    str = " \t ";
    core::CStringUtils::trimWhitespace(str);
    BOOST_TEST_REQUIRE(str.empty());

    str = "\"quoted\"";
    core::CStringUtils::trim("\"", str);
    BOOST_REQUIRE_EQUAL(std::string("quoted"), str);

    BOOST_REQUIRE_EQUAL(std::string("nan"), core::CStringUtils::toLower("NaN"));
}

BOOST_AUTO_TEST_SUITE_END()
