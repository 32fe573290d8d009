/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#ifndef INCLUDED_nrt_maths_time_series_CCcdcStableFit_h
#define INCLUDED_nrt_maths_time_series_CCcdcStableFit_h

#include <core/Constants.h>
#include <core/CoreTypes.h>

#include <maths/common/CLinearAlgebraEigen.h>

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <limits>
#include <vector>

namespace nrt {
namespace maths {
namespace time_series {

//! \brief Finds the stable trailing window of many series at once.
//!
//! DESCRIPTION:\n
//! This is an adaptation of the model initialisation of Continuous Change
//! Detection and Classification (Zhu and Woodcock, 2014). Every series is
//! first fit by ordinary least squares on all its observations. A series
//! whose fit fails the stability test (see CCcdcStabilityTest) has its
//! oldest observations dropped and is refit. This continues while
//! -# some series are neither stable nor short of data,
//! -# the window still spans at least SParams::s_MinimumSpan and
//! -# a series has more than SParams::s_MinimumObservationsFactor times
//! the number of coefficients observations in the window.
//!
//! The design matrix X (n x p) is shared by all series, which are the
//! columns of Y (n x k), and missing observations are NaN.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Each series is in exactly one of the states EColumnState. Stable and
//! insufficient data are absorbing, so a series is never refit once it
//! has left the iterating state. The series still iterating are fit as
//! one batch per iteration.
//!
//! The state of the window is published after every iteration to an
//! optional observer, in addition to trace logging.
class CCcdcStableFit {
public:
    using TBoolVec = std::vector<bool>;
    using TSizeVec = std::vector<std::size_t>;
    using TTimeVec = std::vector<core_t::TTime>;
    using TDenseMatrix = common::CDenseMatrix<double>;

    //! The state of a series.
    enum EColumnState {
        //! Still being refit on shrinking windows. A series which ends the
        //! fit in this state is inconclusive.
        E_Iterating,
        //! The last fit passed the stability test.
        E_Stable,
        //! Too few observations remained to refit.
        E_InsufficientData
    };
    using TColumnStateVec = std::vector<EColumnState>;

    //! Marks a series which was never fit.
    static const std::size_t NO_WINDOW;

    //! \brief The parameters of the fit.
    struct SParams {
        //! The stability test threshold.
        double s_Threshold{3.0};
        //! The number of oldest rows dropped from the window per iteration.
        std::size_t s_WindowStep{2};
        //! A series needs more than this multiple of the number of
        //! coefficients observations to be fit.
        double s_MinimumObservationsFactor{1.5};
        //! The row of the coefficients which holds the trend.
        std::size_t s_SlopeRow{1};
        //! The shortest window, from its first to the last date.
        core_t::TTime s_MinimumSpan{core::constants::GREGORIAN_YEAR};
    };

    //! \brief Describes one iteration of the fit.
    struct SIterationEvent {
        //! The iteration, counting from zero.
        std::size_t s_Iteration;
        //! The first row of the window which was fit.
        std::size_t s_WindowStart;
        //! The number of series fit.
        std::size_t s_Fitted;
        //! The number of series which became stable.
        std::size_t s_NewlyStable;
        //! The number of series which ran out of data.
        std::size_t s_NewlyInsufficient;
        //! The number of series still iterating.
        std::size_t s_Remaining;
        //! The state of every series at the end of the iteration.
        TColumnStateVec s_States;
    };
    using TIterationObserver = std::function<void(const SIterationEvent&)>;

    //! \brief The fit of every series.
    struct SResult {
        //! The coefficients of the last fit of each series (p x k). These
        //! are NaN for series which were never fit.
        TDenseMatrix s_Coefficients;
        //! The residuals of the last fit of each series (n x k), aligned to
        //! the original rows and NaN outside its window.
        TDenseMatrix s_Residuals;
        //! True if and only if the series is stable.
        TBoolVec s_IsStable;
        //! The final state of each series.
        TColumnStateVec s_States;
        //! The first row of the last window each series was fit on or
        //! NO_WINDOW if it was never fit.
        TSizeVec s_WindowStart;
    };

public:
    CCcdcStableFit();
    explicit CCcdcStableFit(const SParams& params,
                            TIterationObserver observer = TIterationObserver{});

    //! Get the parameters.
    const SParams& params() const;

    //! Fit the stable windows of the columns of \p y.
    //!
    //! \param[in] x The design matrix whose rows correspond to \p dates.
    //! \param[in] y The series to fit, one per column.
    //! \param[in] dates The time of each row in increasing order.
    //! \throws CInsufficientCoverageError if \p dates span less than
    //! SParams::s_MinimumSpan.
    //! \throws common::CSingularMatrixError if a window can't be fit.
    //! \throws std::invalid_argument if the dimensions don't match.
    SResult fit(const TDenseMatrix& x, const TDenseMatrix& y, const TTimeVec& dates) const;

    //! Get a printable name for \p state.
    static const char* print(EColumnState state);

private:
    //! Check the parameters are usable.
    static void checkParams(const SParams& params);

private:
    SParams m_Params;
    TIterationObserver m_Observer;
};

std::ostream& operator<<(std::ostream& o, CCcdcStableFit::EColumnState state);
}
}
}

#endif // INCLUDED_nrt_maths_time_series_CCcdcStableFit_h
