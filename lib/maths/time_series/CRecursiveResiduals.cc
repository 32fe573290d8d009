/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/time_series/CRecursiveResiduals.h>

#include <core/CLogger.h>

#include <maths/common/CLeastSquares.h>
#include <maths/common/CMathsFuncs.h>

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace nrt {
namespace maths {
namespace time_series {
namespace {
using TDenseMatrix = CRecursiveResiduals::TDenseMatrix;
using TDenseVector = CRecursiveResiduals::TDenseVector;

void checkSpan(const TDenseMatrix& x, std::size_t span) {
    std::size_t p{static_cast<std::size_t>(x.cols())};
    if (p == 0) {
        throw std::invalid_argument{"Design matrix has no columns"};
    }
    if (span < p || span > static_cast<std::size_t>(x.rows())) {
        std::ostringstream message;
        message << "Initial span " << span << " must be at least the number of coefficients "
                << p << " and at most the number of rows " << x.rows();
        throw std::invalid_argument{message.str()};
    }
}
}

CRecursiveResiduals::SState
CRecursiveResiduals::initialize(const TDenseMatrix& x, const TDenseVector& y, std::size_t span) {
    checkSpan(x, span);
    if (y.size() != x.rows()) {
        throw std::invalid_argument{"Observations and design matrix have different lengths"};
    }

    auto x0 = x.topRows(span);
    SState state;
    state.s_InverseGramian = common::CLeastSquares::inverseGramian(x0);
    state.s_Beta = state.s_InverseGramian * (x0.transpose() * y.head(span));
    return state;
}

CRecursiveResiduals::SStep
CRecursiveResiduals::update(SState& state, const TDenseVector& x, double y) {
    double residual{y - x.dot(state.s_Beta)};
    TDenseVector g{state.s_InverseGramian * x};
    double f{1.0 + x.dot(g)};
    state.s_InverseGramian -= g * g.transpose() / f;
    state.s_Beta += g * (residual / f);
    return {residual, f};
}

CRecursiveResiduals::TDenseVector
CRecursiveResiduals::compute(const TDenseMatrix& x, const TDenseVector& y, std::size_t span) {
    std::size_t n{static_cast<std::size_t>(x.rows())};
    checkSpan(x, span);
    if (span >= n) {
        std::ostringstream message;
        message << "Initial span " << span << " leaves no rows to update from " << n;
        throw std::invalid_argument{message.str()};
    }
    if (static_cast<std::size_t>(y.size()) != n) {
        throw std::invalid_argument{"Observations and design matrix have different lengths"};
    }
    if (common::CMathsFuncs::isNan(y)) {
        throw std::invalid_argument{"Recursive residuals need complete observations"};
    }

    TDenseVector result{TDenseVector::Constant(n, std::numeric_limits<double>::quiet_NaN())};

    SState state{initialize(x, y, span)};

    TDenseVector xj{x.row(span - 1).transpose()};
    double residual{y(span - 1) - xj.dot(state.s_Beta)};
    double variance{1.0 + xj.dot(state.s_InverseGramian * xj)};
    result(span - 1) = residual / std::sqrt(variance);

    for (std::size_t j = span; j < n; ++j) {
        xj = x.row(j).transpose();
        SStep step{update(state, xj, y(j))};
        result(j) = step.s_Residual / std::sqrt(step.s_Variance);
    }
    LOG_TRACE(<< "final beta = " << state.s_Beta.transpose());

    return result;
}
}
}
}
