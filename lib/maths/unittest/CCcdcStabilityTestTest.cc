/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CLogger.h>

#include <maths/common/CLinearAlgebraEigen.h>
#include <maths/common/CMathsFuncs.h>

#include <maths/time_series/CCcdcStabilityTest.h>

#include <test/BoostTestCloseAbsolute.h>
#include <test/CRandomNumbers.h>

#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

BOOST_AUTO_TEST_SUITE(CCcdcStabilityTestTest)

using namespace nrt;

namespace {
using TBoolVec = std::vector<bool>;
using TDoubleVec = std::vector<double>;
using TDenseMatrix = maths::common::CDenseMatrix<double>;
using TDenseVector = maths::common::CDenseVector<double>;
using TStabilityTest = maths::time_series::CCcdcStabilityTest;

const double NaN{std::numeric_limits<double>::quiet_NaN()};
}

BOOST_AUTO_TEST_CASE(testRmse) {
    TDenseMatrix residuals{TDenseMatrix::fromRows(
        {{1.0, NaN, NaN}, {-1.0, 2.0, NaN}, {1.0, 0.0, NaN}, {-1.0, 0.0, NaN}})};

    BOOST_REQUIRE_CLOSE_ABSOLUTE(1.0, TStabilityTest::rmse(residuals, 0), 1e-12);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(std::sqrt(4.0 / 3.0), TStabilityTest::rmse(residuals, 1), 1e-12);
    BOOST_REQUIRE(maths::common::CMathsFuncs::isNan(TStabilityTest::rmse(residuals, 2)));
}

BOOST_AUTO_TEST_CASE(testHandCalculated) {
    // Series 0 has rmse 1 and a first residual of 1 so it is stable for any
    // threshold above 1. Series 1 fails on its slope. Series 2's first
    // observed residual is 2 and its rmse is 1.1547. Series 3 and 4 have
    // no scale to test against.

    TDenseMatrix residuals{TDenseMatrix::fromRows({{1.0, 1.0, NaN, NaN, 0.0},
                                                   {-1.0, -1.0, 2.0, NaN, 0.0},
                                                   {1.0, 1.0, 0.0, NaN, 0.0},
                                                   {-1.0, -1.0, 0.0, NaN, 0.0}})};
    TDenseVector slope{TDenseVector::fromStdVector({0.5, 5.0, 0.0, 0.0, 0.0})};

    TBoolVec stable{TStabilityTest::isStable(slope, residuals, 3.0)};
    BOOST_REQUIRE_EQUAL(5, stable.size());
    BOOST_REQUIRE(stable[0]);
    BOOST_REQUIRE(stable[1] == false);
    BOOST_REQUIRE(stable[2]);
    BOOST_REQUIRE(stable[3] == false);
    BOOST_REQUIRE(stable[4] == false);

    stable = TStabilityTest::isStable(slope, residuals, 1.5);
    BOOST_REQUIRE(stable[0]);
    BOOST_REQUIRE(stable[2] == false);

    // The comparisons are strict.
    stable = TStabilityTest::isStable(slope, residuals, 1.0);
    BOOST_REQUIRE(stable[0] == false);
}

BOOST_AUTO_TEST_CASE(testNegativeSlope) {
    // A falling trend is as unstable as a rising one.

    TDenseMatrix residuals{TDenseMatrix::fromRows({{1.0}, {-1.0}, {1.0}, {-1.0}})};

    TBoolVec rising{TStabilityTest::isStable(TDenseVector::fromStdVector({5.0}), residuals, 3.0)};
    TBoolVec falling{TStabilityTest::isStable(TDenseVector::fromStdVector({-5.0}), residuals, 3.0)};
    TBoolVec flat{TStabilityTest::isStable(TDenseVector::fromStdVector({-0.5}), residuals, 3.0)};
    BOOST_REQUIRE(rising[0] == false);
    BOOST_REQUIRE(falling[0] == false);
    BOOST_REQUIRE(flat[0]);
}

BOOST_AUTO_TEST_CASE(testMonotoneInThreshold) {
    // Any series which is stable for a threshold is stable for all larger
    // thresholds.

    test::CRandomNumbers rng;

    std::size_t n{30};
    std::size_t k{200};

    TDoubleVec samples;
    rng.generateNormalSamples(0.0, 1.0, n * k, samples);
    TDenseMatrix residuals(n, k);
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = 0; j < k; ++j) {
            residuals(i, j) = samples[i * k + j];
        }
    }
    TDoubleVec slopes;
    rng.generateUniformSamples(-4.0, 4.0, k, slopes);
    TDenseVector slope{TDenseVector::fromStdVector(slopes)};

    TBoolVec previous(k, false);
    std::size_t numberStable{0};
    for (double threshold = 0.25; threshold <= 6.0; threshold += 0.25) {
        TBoolVec stable{TStabilityTest::isStable(slope, residuals, threshold)};
        for (std::size_t j = 0; j < k; ++j) {
            if (previous[j]) {
                BOOST_REQUIRE(stable[j]);
            }
        }
        numberStable = static_cast<std::size_t>(std::count(stable.begin(), stable.end(), true));
        previous = stable;
    }
    LOG_DEBUG(<< "stable at largest threshold = " << numberStable);
    BOOST_REQUIRE(numberStable > k / 2);
}

BOOST_AUTO_TEST_CASE(testInvalidArguments) {
    TDenseMatrix residuals{TDenseMatrix::Zero(4, 3)};
    BOOST_REQUIRE_THROW(TStabilityTest::isStable(TDenseVector::Zero(2), residuals, 3.0),
                        std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
