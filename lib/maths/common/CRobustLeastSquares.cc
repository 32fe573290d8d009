/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/common/CRobustLeastSquares.h>

#include <core/CLogger.h>

#include <maths/common/CBasicStatistics.h>
#include <maths/common/CMathsFuncs.h>
#include <maths/common/CSingularMatrixError.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

namespace nrt {
namespace maths {
namespace common {
namespace {
using TDoubleVec = std::vector<double>;
using TDenseMatrix = CRobustLeastSquares::TDenseMatrix;

//! Get the robust scale of the non-missing entries of \p residuals.
double robustScale(const TDenseMatrix& residuals, double scaleConstant) {
    TDoubleVec absolute;
    absolute.reserve(residuals.rows());
    for (std::ptrdiff_t i = 0; i < residuals.rows(); ++i) {
        if (CMathsFuncs::isNan(residuals(i, 0)) == false) {
            absolute.push_back(std::fabs(residuals(i, 0)));
        }
    }
    return CBasicStatistics::median(absolute) / scaleConstant;
}

void checkParams(const CRobustLeastSquares::SParams& params) {
    if (params.s_Tolerance < 0.0) {
        throw std::invalid_argument{"IRLS tolerance must be non-negative"};
    }
    if (params.s_TuningConstant <= 0.0) {
        throw std::invalid_argument{"IRLS tuning constant must be positive"};
    }
    if (params.s_ScaleConstant <= 0.0) {
        throw std::invalid_argument{"IRLS scale constant must be positive"};
    }
}
}

CRobustLeastSquares::TFit CRobustLeastSquares::fit(const TDenseMatrix& x, const TDenseMatrix& y) {
    return fit(x, y, SParams{});
}

CRobustLeastSquares::TFit
CRobustLeastSquares::fit(const TDenseMatrix& x, const TDenseMatrix& y, const SParams& params) {
    checkParams(params);

    TFit result{CLeastSquares::fit(x, y)};

    for (std::ptrdiff_t j = 0; j < y.cols(); ++j) {
        TDenseMatrix yj{y.col(j)};
        TDenseMatrix beta{result.s_Coefficients.col(j)};
        TDenseMatrix residuals{result.s_Residuals.col(j)};
        TDenseMatrix weights{TDenseMatrix::Zero(y.rows(), 1)};

        double scale{robustScale(residuals, params.s_ScaleConstant)};
        std::size_t iteration{0};
        for (/**/; iteration < params.s_MaxIterations; ++iteration) {
            if (scale < std::numeric_limits<double>::epsilon()) {
                LOG_TRACE(<< "Series " << j << " is a perfect fit");
                break;
            }

            for (std::ptrdiff_t i = 0; i < y.rows(); ++i) {
                weights(i, 0) = CMathsFuncs::isNan(residuals(i, 0))
                                    ? 0.0
                                    : bisquare(residuals(i, 0) / scale,
                                               params.s_TuningConstant);
            }

            TFit reweighted;
            try {
                reweighted = CLeastSquares::weightedFit(x, yj, weights);
            } catch (const CSingularMatrixError& e) {
                LOG_DEBUG(<< "Keeping previous estimate for series " << j << ": " << e.what());
                break;
            }

            double change{(reweighted.s_Coefficients - beta).cwiseAbs().maxCoeff()};
            beta = std::move(reweighted.s_Coefficients);
            residuals = std::move(reweighted.s_Residuals);
            if (change <= params.s_Tolerance) {
                ++iteration;
                break;
            }
            if (params.s_UpdateScale) {
                scale = robustScale(residuals, params.s_ScaleConstant);
            }
        }
        LOG_TRACE(<< "Series " << j << " took " << iteration << " reweighting iterations");

        result.s_Coefficients.col(j) = beta.col(0);
        result.s_Residuals.col(j) = residuals.col(0);
    }

    return result;
}

double CRobustLeastSquares::bisquare(double u, double tuningConstant) {
    u /= tuningConstant;
    if (std::fabs(u) >= 1.0) {
        return 0.0;
    }
    double v{1.0 - u * u};
    return v * v;
}
}
}
}
