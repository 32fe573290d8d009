/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/common/CLeastSquares.h>

#include <core/CLogger.h>

#include <maths/common/CMathsFuncs.h>
#include <maths/common/CSingularMatrixError.h>

#include <Eigen/LU>

#include <cmath>
#include <map>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace nrt {
namespace maths {
namespace common {
namespace {
using TBoolVec = std::vector<bool>;
using TSizeVec = std::vector<std::size_t>;
using TBoolVecSizeVecMap = std::map<TBoolVec, TSizeVec>;
using TDenseMatrix = CLeastSquares::TDenseMatrix;
using TLu = Eigen::FullPivLU<TDenseMatrix::TBase>;

void checkDimensions(const TDenseMatrix& x, const TDenseMatrix& y) {
    if (x.cols() == 0) {
        throw std::invalid_argument{"Design matrix has no columns"};
    }
    if (x.rows() != y.rows()) {
        std::ostringstream message;
        message << "Design matrix has " << x.rows() << " rows but observations have "
                << y.rows();
        throw std::invalid_argument{message.str()};
    }
}

TSizeVec nonMissingRows(const TBoolVec& mask) {
    TSizeVec result;
    for (std::size_t i = 0; i < mask.size(); ++i) {
        if (mask[i]) {
            result.push_back(i);
        }
    }
    return result;
}

void checkEnoughRows(std::size_t rows, std::ptrdiff_t coefficients) {
    if (static_cast<std::ptrdiff_t>(rows) < coefficients) {
        std::ostringstream message;
        message << "Can't fit " << coefficients << " coefficients to " << rows
                << " observations";
        throw CSingularMatrixError{message.str()};
    }
}

TLu factorizeGramian(const TDenseMatrix& x) {
    TDenseMatrix gramian{x.transpose() * x};
    TLu lu{gramian};
    if (lu.isInvertible() == false) {
        std::ostringstream message;
        message << "Gram matrix is singular: rank " << lu.rank() << " of " << gramian.rows();
        throw CSingularMatrixError{message.str()};
    }
    return lu;
}
}

CLeastSquares::SFit CLeastSquares::fit(const TDenseMatrix& x, const TDenseMatrix& y) {
    checkDimensions(x, y);

    std::ptrdiff_t n{x.rows()};
    std::ptrdiff_t p{x.cols()};
    std::ptrdiff_t k{y.cols()};

    // Group the columns by their pattern of missing observations.
    TBoolVecSizeVecMap batches;
    for (std::ptrdiff_t j = 0; j < k; ++j) {
        TBoolVec mask(n);
        for (std::ptrdiff_t i = 0; i < n; ++i) {
            mask[i] = CMathsFuncs::isNan(y(i, j)) == false;
        }
        batches[mask].push_back(j);
    }
    LOG_TRACE(<< "Fitting " << k << " series in " << batches.size() << " batches");

    SFit result{TDenseMatrix::missing(p, k), TDenseMatrix::missing(n, k)};

    for (const auto& batch : batches) {
        TSizeVec rows{nonMissingRows(batch.first)};
        const TSizeVec& columns{batch.second};
        checkEnoughRows(rows.size(), p);

        TDenseMatrix xs(rows.size(), p);
        TDenseMatrix ys(rows.size(), columns.size());
        for (std::size_t i = 0; i < rows.size(); ++i) {
            xs.row(i) = x.row(rows[i]);
            for (std::size_t j = 0; j < columns.size(); ++j) {
                ys(i, j) = y(rows[i], columns[j]);
            }
        }

        TLu lu{factorizeGramian(xs)};
        TDenseMatrix beta{lu.solve(xs.transpose() * ys)};
        TDenseMatrix fitted{xs * beta};

        for (std::size_t j = 0; j < columns.size(); ++j) {
            result.s_Coefficients.col(columns[j]) = beta.col(j);
            for (std::size_t i = 0; i < rows.size(); ++i) {
                result.s_Residuals(rows[i], columns[j]) = ys(i, j) - fitted(i, j);
            }
        }
    }

    return result;
}

CLeastSquares::SFit CLeastSquares::weightedFit(const TDenseMatrix& x,
                                               const TDenseMatrix& y,
                                               const TDenseMatrix& weights) {
    checkDimensions(x, y);
    if (weights.rows() != y.rows() || weights.cols() != y.cols()) {
        throw std::invalid_argument{"Weights must have the same shape as the observations"};
    }

    std::ptrdiff_t n{x.rows()};
    std::ptrdiff_t p{x.cols()};
    std::ptrdiff_t k{y.cols()};

    SFit result{TDenseMatrix::missing(p, k), TDenseMatrix::missing(n, k)};

    for (std::ptrdiff_t j = 0; j < k; ++j) {
        TSizeVec rows;
        for (std::ptrdiff_t i = 0; i < n; ++i) {
            if (CMathsFuncs::isNan(y(i, j)) == false) {
                if (weights(i, j) < 0.0 || CMathsFuncs::isFinite(weights(i, j)) == false) {
                    throw std::invalid_argument{"Weights must be finite and non-negative"};
                }
                rows.push_back(i);
            }
        }
        checkEnoughRows(rows.size(), p);

        // Solve the ordinary problem for sqrt(W) X and sqrt(W) y.
        TDenseMatrix xs(rows.size(), p);
        TDenseMatrix ys(rows.size(), 1);
        for (std::size_t i = 0; i < rows.size(); ++i) {
            double root{std::sqrt(weights(rows[i], j))};
            xs.row(i) = root * x.row(rows[i]);
            ys(i, 0) = root * y(rows[i], j);
        }

        TLu lu{factorizeGramian(xs)};
        TDenseMatrix beta{lu.solve(xs.transpose() * ys)};

        result.s_Coefficients.col(j) = beta.col(0);
        for (std::size_t i : rows) {
            result.s_Residuals(i, j) = y(i, j) - x.row(i).dot(beta.col(0));
        }
    }

    return result;
}

CLeastSquares::TDenseMatrix CLeastSquares::inverseGramian(const TDenseMatrix& x) {
    if (x.cols() == 0) {
        throw std::invalid_argument{"Design matrix has no columns"};
    }
    checkEnoughRows(static_cast<std::size_t>(x.rows()), x.cols());
    TLu lu{factorizeGramian(x)};
    return lu.inverse();
}
}
}
}
