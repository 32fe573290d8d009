/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#ifndef INCLUDED_nrt_maths_common_CRobustLeastSquares_h
#define INCLUDED_nrt_maths_common_CRobustLeastSquares_h

#include <core/CNonInstantiatable.h>

#include <maths/common/CLeastSquares.h>

#include <cstddef>

namespace nrt {
namespace maths {
namespace common {

//! \brief Robust regression by iteratively reweighted least squares.
//!
//! DESCRIPTION:\n
//! Each column starts from its ordinary least squares fit.  The residuals
//! are then scaled by a robust estimate of their spread, the median of the
//! absolute residuals divided by SParams::s_ScaleConstant, and reweighted
//! with Tukey's bisquare function
//! <pre class="fragment">
//!   w(u) = (1 - u^2)^2 if |u| < 1, 0 otherwise, with u = r / (scale c)
//! </pre>
//! where c is SParams::s_TuningConstant.  The weighted problem is solved
//! and the process repeats until the largest change in any coefficient is
//! at most SParams::s_Tolerance or the iteration limit is reached.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Convergence is tracked per column.  A column whose scale drops below
//! machine epsilon is already a perfect fit and stops iterating.  A column
//! whose reweighted system becomes singular keeps its previous estimate.
class CRobustLeastSquares : private core::CNonInstantiatable {
public:
    using TDenseMatrix = CLeastSquares::TDenseMatrix;
    using TFit = CLeastSquares::SFit;

    //! \brief The iteration controls.
    struct SParams {
        //! The maximum number of reweighting iterations.
        std::size_t s_MaxIterations{50};
        //! Stop when no coefficient changes by more than this.
        double s_Tolerance{1e-8};
        //! The bisquare tuning constant which gives 95% efficiency for
        //! normally distributed errors.
        double s_TuningConstant{4.685};
        //! The ratio of the median absolute deviation to the standard
        //! deviation for a normal distribution.
        double s_ScaleConstant{0.6745};
        //! If false the scale is estimated once from the ordinary fit.
        bool s_UpdateScale{true};
    };

public:
    //! Fit each column of \p y with the default parameters.
    static TFit fit(const TDenseMatrix& x, const TDenseMatrix& y);

    //! Fit each column of \p y.
    static TFit fit(const TDenseMatrix& x, const TDenseMatrix& y, const SParams& params);

    //! Get the bisquare weight of the standardized residual \p u.
    static double bisquare(double u, double tuningConstant);
};
}
}
}

#endif // INCLUDED_nrt_maths_common_CRobustLeastSquares_h
