/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#ifndef INCLUDED_nrt_maths_common_CLeastSquares_h
#define INCLUDED_nrt_maths_common_CLeastSquares_h

#include <core/CNonInstantiatable.h>

#include <maths/common/CLinearAlgebraEigen.h>

namespace nrt {
namespace maths {
namespace common {

//! \brief Ordinary least squares fits of many series sharing a design matrix.
//!
//! DESCRIPTION:\n
//! Given a design matrix X (n x p) and observations Y (n x k), one series
//! per column, this fits each column of Y on the rows where it isn't
//! missing.  Missing observations are NaN.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Columns which share exactly the same pattern of missing rows are solved
//! together with a single factorization of the Gram matrix, so a batch of
//! complete series costs one p x p decomposition.
//!
//! A singular Gram matrix, which includes the case a column has fewer
//! observations than coefficients, throws CSingularMatrixError and argument
//! misuse throws std::invalid_argument.
class CLeastSquares : private core::CNonInstantiatable {
public:
    using TDenseMatrix = CDenseMatrix<double>;
    using TDenseVector = CDenseVector<double>;

    //! \brief The fit of every column of an observation matrix.
    struct SFit {
        //! The coefficients, one column per series (p x k).
        TDenseMatrix s_Coefficients;
        //! The residuals aligned with the observations (n x k). These
        //! are missing wherever the observation is missing.
        TDenseMatrix s_Residuals;
    };

public:
    //! Fit each column of \p y on the non-missing rows of \p x.
    static SFit fit(const TDenseMatrix& x, const TDenseMatrix& y);

    //! Fit each column of \p y minimising the sum of squared residuals
    //! weighted by the corresponding column of \p weights.
    //!
    //! \note The returned residuals are unweighted.
    static SFit weightedFit(const TDenseMatrix& x, const TDenseMatrix& y, const TDenseMatrix& weights);

    //! Get (X'X)^-1 for \p x.
    static TDenseMatrix inverseGramian(const TDenseMatrix& x);
};
}
}
}

#endif // INCLUDED_nrt_maths_common_CLeastSquares_h
