/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/common/CMathsFuncs.h>

#include <maths/common/CLinearAlgebraEigen.h>

#include <cmath>

namespace nrt {
namespace maths {
namespace common {

bool CMathsFuncs::isNan(double val) {
    return std::isnan(val);
}

bool CMathsFuncs::isInf(double val) {
    return std::isinf(val);
}

bool CMathsFuncs::isFinite(double val) {
    return std::isfinite(val);
}

bool CMathsFuncs::isNan(const CDenseVector<double>& val) {
    for (std::ptrdiff_t i = 0; i < val.size(); ++i) {
        if (isNan(val(i))) {
            return true;
        }
    }
    return false;
}

std::size_t CMathsFuncs::countNonMissing(const CDenseMatrix<double>& m, std::ptrdiff_t column) {
    std::size_t result{0};
    for (std::ptrdiff_t i = 0; i < m.rows(); ++i) {
        if (isNan(m(i, column)) == false) {
            ++result;
        }
    }
    return result;
}

std::size_t CMathsFuncs::countNonMissing(const CDenseMatrix<double>& m) {
    std::size_t result{0};
    for (std::ptrdiff_t j = 0; j < m.cols(); ++j) {
        result += countNonMissing(m, j);
    }
    return result;
}
}
}
}
