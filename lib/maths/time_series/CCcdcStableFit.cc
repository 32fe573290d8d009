/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/time_series/CCcdcStableFit.h>

#include <core/CLogger.h>

#include <maths/common/CLeastSquares.h>
#include <maths/common/CMathsFuncs.h>

#include <maths/time_series/CCcdcStabilityTest.h>
#include <maths/time_series/CInsufficientCoverageError.h>

#include <algorithm>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace nrt {
namespace maths {
namespace time_series {
namespace {
using TSizeVec = CCcdcStableFit::TSizeVec;
using TDenseMatrix = CCcdcStableFit::TDenseMatrix;
using TDenseVector = common::CDenseVector<double>;

//! Count the observations of column \p column of \p y in rows [\p start, n).
std::size_t countObservations(const TDenseMatrix& y, std::ptrdiff_t column, std::size_t start) {
    std::size_t result{0};
    for (std::ptrdiff_t i = static_cast<std::ptrdiff_t>(start); i < y.rows(); ++i) {
        if (common::CMathsFuncs::isNan(y(i, column)) == false) {
            ++result;
        }
    }
    return result;
}

std::size_t countIn(const CCcdcStableFit::TColumnStateVec& states,
                    CCcdcStableFit::EColumnState state) {
    return static_cast<std::size_t>(std::count(states.begin(), states.end(), state));
}
}

const std::size_t CCcdcStableFit::NO_WINDOW{std::numeric_limits<std::size_t>::max()};

CCcdcStableFit::CCcdcStableFit() : CCcdcStableFit{SParams{}} {
}

CCcdcStableFit::CCcdcStableFit(const SParams& params, TIterationObserver observer)
    : m_Params{params}, m_Observer{std::move(observer)} {
    checkParams(m_Params);
}

const CCcdcStableFit::SParams& CCcdcStableFit::params() const {
    return m_Params;
}

CCcdcStableFit::SResult
CCcdcStableFit::fit(const TDenseMatrix& x, const TDenseMatrix& y, const TTimeVec& dates) const {

    std::size_t n{static_cast<std::size_t>(x.rows())};
    std::size_t p{static_cast<std::size_t>(x.cols())};
    std::size_t k{static_cast<std::size_t>(y.cols())};

    if (static_cast<std::size_t>(y.rows()) != n || dates.size() != n) {
        std::ostringstream message;
        message << "Design matrix has " << n << " rows, observations " << y.rows()
                << " and dates " << dates.size();
        throw std::invalid_argument{message.str()};
    }
    if (p <= m_Params.s_SlopeRow) {
        std::ostringstream message;
        message << "Slope row " << m_Params.s_SlopeRow << " is out of range for " << p
                << " coefficients";
        throw std::invalid_argument{message.str()};
    }
    if (n == 0 || dates.back() - dates.front() < m_Params.s_MinimumSpan) {
        std::ostringstream message;
        message << "Dates span " << (n == 0 ? 0 : dates.back() - dates.front())
                << "s but at least " << m_Params.s_MinimumSpan << "s is required";
        throw CInsufficientCoverageError{message.str()};
    }

    double minimumObservations{m_Params.s_MinimumObservationsFactor * static_cast<double>(p)};

    SResult result{TDenseMatrix::missing(p, k), TDenseMatrix::missing(n, k),
                   TBoolVec(k, false), TColumnStateVec(k, E_Iterating),
                   TSizeVec(k, NO_WINDOW)};

    for (std::size_t j = 0; j < k; ++j) {
        if (static_cast<double>(countObservations(y, j, 0)) <= minimumObservations) {
            result.s_States[j] = E_InsufficientData;
        }
    }
    LOG_TRACE(<< countIn(result.s_States, E_InsufficientData) << " of " << k
              << " series have too little data to fit");

    std::size_t start{0};
    for (std::size_t iteration = 0; countIn(result.s_States, E_Iterating) > 0; ++iteration) {
        if (start >= n) {
            break;
        }

        TSizeVec active;
        for (std::size_t j = 0; j < k; ++j) {
            if (result.s_States[j] == E_Iterating) {
                active.push_back(j);
            }
        }

        std::size_t m{n - start};
        TDenseMatrix xs{x.bottomRows(m)};
        TDenseMatrix ys(m, active.size());
        for (std::size_t j = 0; j < active.size(); ++j) {
            ys.col(j) = y.col(active[j]).tail(m);
        }

        common::CLeastSquares::SFit window{common::CLeastSquares::fit(xs, ys)};

        for (std::size_t j = 0; j < active.size(); ++j) {
            std::size_t column{active[j]};
            result.s_Coefficients.col(column) = window.s_Coefficients.col(j);
            result.s_Residuals.col(column).head(start).setConstant(
                std::numeric_limits<double>::quiet_NaN());
            result.s_Residuals.col(column).tail(m) = window.s_Residuals.col(j);
            result.s_WindowStart[column] = start;
        }

        TDenseVector slope{window.s_Coefficients.row(m_Params.s_SlopeRow).transpose()};
        TBoolVec stable{CCcdcStabilityTest::isStable(slope, window.s_Residuals,
                                                     m_Params.s_Threshold)};

        SIterationEvent event{iteration, start, active.size(), 0, 0, 0, {}};
        for (std::size_t j = 0; j < active.size(); ++j) {
            if (stable[j]) {
                result.s_States[active[j]] = E_Stable;
                result.s_IsStable[active[j]] = true;
                ++event.s_NewlyStable;
            }
        }
        LOG_DEBUG(<< "Fitted " << event.s_NewlyStable << " stable series");

        // Shrink the window.
        start += m_Params.s_WindowStep;
        bool exhausted{start >= n || dates.back() - dates[start] < m_Params.s_MinimumSpan};

        if (exhausted == false) {
            for (std::size_t column : active) {
                if (result.s_States[column] == E_Iterating &&
                    static_cast<double>(countObservations(y, column, start)) <= minimumObservations) {
                    result.s_States[column] = E_InsufficientData;
                    ++event.s_NewlyInsufficient;
                }
            }
        }

        event.s_Remaining = countIn(result.s_States, E_Iterating);
        event.s_States = result.s_States;
        LOG_TRACE(<< "iteration " << iteration << ": window start = " << event.s_WindowStart
                  << ", fitted = " << event.s_Fitted << ", stable = " << event.s_NewlyStable
                  << ", insufficient = " << event.s_NewlyInsufficient
                  << ", remaining = " << event.s_Remaining);
        if (m_Observer) {
            m_Observer(event);
        }

        if (exhausted) {
            LOG_DEBUG(<< event.s_Remaining << " series are inconclusive after the window "
                      << "shrank below the minimum span");
            break;
        }
    }

    return result;
}

const char* CCcdcStableFit::print(EColumnState state) {
    switch (state) {
    case E_Iterating:
        return "iterating";
    case E_Stable:
        return "stable";
    case E_InsufficientData:
        return "insufficient_data";
    }
    return "unknown";
}

void CCcdcStableFit::checkParams(const SParams& params) {
    if (params.s_Threshold <= 0.0) {
        throw std::invalid_argument{"Stability threshold must be positive"};
    }
    if (params.s_WindowStep == 0) {
        throw std::invalid_argument{"Window step must be at least one row"};
    }
    if (params.s_MinimumObservationsFactor < 0.0) {
        throw std::invalid_argument{"Minimum observations factor must be non-negative"};
    }
}

std::ostream& operator<<(std::ostream& o, CCcdcStableFit::EColumnState state) {
    return o << CCcdcStableFit::print(state);
}
}
}
}
