/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/time_series/COutlierScreen.h>

#include <core/CLogger.h>

#include <maths/common/CBasicStatistics.h>
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
using TSizeVec = std::vector<std::size_t>;
using TDenseMatrix = COutlierScreen::TDenseMatrix;
using TMeanVarAccumulator = common::CBasicStatistics::SSampleMeanVar::TAccumulator;

//! Get the residuals of fitting \p y's columns with \p fitter, skipping
//! those which have fewer observations than coefficients.
template<typename FITTER>
TDenseMatrix residuals(const TDenseMatrix& x, const TDenseMatrix& y, FITTER fitter) {
    if (x.rows() != y.rows()) {
        std::ostringstream message;
        message << "Design matrix has " << x.rows() << " rows but observations have "
                << y.rows();
        throw std::invalid_argument{message.str()};
    }

    TSizeVec columns;
    for (std::ptrdiff_t j = 0; j < y.cols(); ++j) {
        if (static_cast<std::ptrdiff_t>(common::CMathsFuncs::countNonMissing(y, j)) >= x.cols()) {
            columns.push_back(j);
        }
    }
    LOG_TRACE(<< y.cols() - static_cast<std::ptrdiff_t>(columns.size())
              << " series have too few observations to screen");

    TDenseMatrix result{TDenseMatrix::missing(y.rows(), y.cols())};
    if (columns.empty()) {
        return result;
    }

    TDenseMatrix ys(y.rows(), columns.size());
    for (std::size_t j = 0; j < columns.size(); ++j) {
        ys.col(j) = y.col(columns[j]);
    }
    common::CLeastSquares::SFit fit{fitter(x, ys)};
    for (std::size_t j = 0; j < columns.size(); ++j) {
        result.col(columns[j]) = fit.s_Residuals.col(j);
    }
    return result;
}
}

const double COutlierScreen::DUAL_BAND_THRESHOLD{0.04};

COutlierScreen::TDenseMatrix&
COutlierScreen::shewhart(const TDenseMatrix& x, TDenseMatrix& y, double controlLimit) {
    if ((controlLimit > 0.0) == false) {
        throw std::invalid_argument{"Control limit must be positive"};
    }

    TDenseMatrix r{residuals(x, y, [](const TDenseMatrix& x_, const TDenseMatrix& y_) {
        return common::CLeastSquares::fit(x_, y_);
    })};

    std::size_t removed{0};
    for (std::ptrdiff_t j = 0; j < r.cols(); ++j) {
        TMeanVarAccumulator moments;
        for (std::ptrdiff_t i = 0; i < r.rows(); ++i) {
            if (common::CMathsFuncs::isNan(r(i, j)) == false) {
                moments.add(r(i, j));
            }
        }
        double sigma{std::sqrt(common::CBasicStatistics::maximumLikelihoodVariance(moments))};
        for (std::ptrdiff_t i = 0; i < r.rows(); ++i) {
            if (std::fabs(r(i, j)) > controlLimit * sigma) {
                y(i, j) = std::numeric_limits<double>::quiet_NaN();
                ++removed;
            }
        }
    }
    LOG_DEBUG(<< "Shewhart chart removed " << removed << " observations");

    return y;
}

COutlierScreen::TBoolMatrix COutlierScreen::ccdcRirls(const TDenseMatrix& x,
                                                      TDenseMatrix& y,
                                                      const TDenseMatrixVec& green,
                                                      const TDenseMatrixVec& swir,
                                                      double scalingFactor) {
    return ccdcRirls(x, y, green, swir, scalingFactor, TRobustParams{});
}

COutlierScreen::TBoolMatrix COutlierScreen::ccdcRirls(const TDenseMatrix& x,
                                                      TDenseMatrix& y,
                                                      const TDenseMatrixVec& green,
                                                      const TDenseMatrixVec& swir,
                                                      double scalingFactor,
                                                      const TRobustParams& params) {
    if (green.size() != swir.size()) {
        throw std::invalid_argument{"Green and SWIR bands have different numbers of images"};
    }
    TDenseMatrix greenFlat{flatten(green)};
    TDenseMatrix swirFlat{flatten(swir)};
    if (greenFlat.cols() != swirFlat.cols()) {
        throw std::invalid_argument{"Green and SWIR images have different shapes"};
    }
    if (greenFlat.rows() != y.rows() || greenFlat.cols() != y.cols()) {
        std::ostringstream message;
        message << "Bands have " << greenFlat.rows() << " images of " << greenFlat.cols()
                << " pixels but observations are " << y.rows() << " x " << y.cols();
        throw std::invalid_argument{message.str()};
    }

    auto robust = [&params](const TDenseMatrix& x_, const TDenseMatrix& y_) {
        return common::CRobustLeastSquares::fit(x_, y_, params);
    };
    TDenseMatrix greenResiduals{residuals(x, greenFlat, robust)};
    TDenseMatrix swirResiduals{residuals(x, swirFlat, robust)};

    double threshold{DUAL_BAND_THRESHOLD * scalingFactor};
    TBoolMatrix clear{TBoolMatrix::Constant(y.rows(), y.cols(), true)};
    std::size_t outliers{0};
    for (std::ptrdiff_t j = 0; j < y.cols(); ++j) {
        for (std::ptrdiff_t i = 0; i < y.rows(); ++i) {
            if (greenResiduals(i, j) > threshold || swirResiduals(i, j) < -threshold) {
                clear(i, j) = false;
                y(i, j) = std::numeric_limits<double>::quiet_NaN();
                ++outliers;
            }
        }
    }

    std::size_t observed{common::CMathsFuncs::countNonMissing(greenFlat)};
    LOG_DEBUG(<< (observed == 0 ? 0.0
                                : 100.0 * static_cast<double>(outliers) /
                                      static_cast<double>(observed))
              << "% of (non nan) pixels removed.");

    return clear;
}

COutlierScreen::TDenseMatrix COutlierScreen::flatten(const TDenseMatrixVec& cube) {
    if (cube.empty()) {
        return TDenseMatrix(0, 0);
    }
    std::ptrdiff_t rows{cube[0].rows()};
    std::ptrdiff_t cols{cube[0].cols()};

    TDenseMatrix result(static_cast<std::ptrdiff_t>(cube.size()), rows * cols);
    for (std::size_t t = 0; t < cube.size(); ++t) {
        if (cube[t].rows() != rows || cube[t].cols() != cols) {
            throw std::invalid_argument{"All images must have the same shape"};
        }
        for (std::ptrdiff_t r = 0; r < rows; ++r) {
            for (std::ptrdiff_t c = 0; c < cols; ++c) {
                result(t, r * cols + c) = cube[t](r, c);
            }
        }
    }
    return result;
}
}
}
}
