/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#ifndef INCLUDED_nrt_maths_time_series_CRecursiveResiduals_h
#define INCLUDED_nrt_maths_time_series_CRecursiveResiduals_h

#include <core/CNonInstantiatable.h>

#include <maths/common/CLinearAlgebraEigen.h>

#include <cstddef>

namespace nrt {
namespace maths {
namespace time_series {

//! \brief Standardized recursive residuals of a linear regression.
//!
//! DESCRIPTION:\n
//! The recursive residual at row j is the one step ahead prediction
//! error of the least squares fit to rows [0, j) scaled by its standard
//! deviation in units of the noise standard deviation:
//! <pre class="fragment">
//!   w_j = (y_j - x_j beta_{j-1}) / sqrt(1 + x_j (X_{j-1}'X_{j-1})^-1 x_j')
//! </pre>
//! Under the null hypothesis of no structural break these are i.i.d.
//! with zero mean, so cumulative sums of them detect breaks.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Each step is a Sherman-Morrison rank one update of the inverse Gram
//! matrix, so the cost per row is O(p^2) rather than a fresh O(p^3)
//! solve.  The state of the recursion is an explicit value owned by the
//! caller and threaded through update().
class CRecursiveResiduals : private core::CNonInstantiatable {
public:
    using TDenseMatrix = common::CDenseMatrix<double>;
    using TDenseVector = common::CDenseVector<double>;

    //! \brief The state of the recursion.
    struct SState {
        //! The least squares coefficients of the rows seen so far.
        TDenseVector s_Beta;
        //! (X'X)^-1 of the rows seen so far.
        TDenseMatrix s_InverseGramian;
    };

    //! \brief The prediction error of one row.
    struct SStep {
        //! y_j - x_j beta using beta from the rows strictly before j.
        double s_Residual;
        //! 1 + x_j M x_j' using M from the rows strictly before j.
        double s_Variance;
    };

public:
    //! Fit rows [0, \p span) of \p x and \p y by explicit inversion of
    //! the normal equations.
    //!
    //! \throws common::CSingularMatrixError if X0'X0 is singular.
    static SState initialize(const TDenseMatrix& x, const TDenseVector& y, std::size_t span);

    //! Predict \p y from \p x with \p state and then add the row to \p state.
    static SStep update(SState& state, const TDenseVector& x, double y);

    //! Get the standardized recursive residuals of every row from
    //! \p span - 1 onwards. Earlier rows are NaN.
    //!
    //! \throws std::invalid_argument unless p <= \p span < n and \p y has
    //! n values none of which are missing.
    static TDenseVector compute(const TDenseMatrix& x, const TDenseVector& y, std::size_t span);
};
}
}
}

#endif // INCLUDED_nrt_maths_time_series_CRecursiveResiduals_h
