/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#ifndef INCLUDED_nrt_maths_time_series_CCcdcStabilityTest_h
#define INCLUDED_nrt_maths_time_series_CCcdcStabilityTest_h

#include <core/CNonInstantiatable.h>

#include <maths/common/CLinearAlgebraEigen.h>

#include <vector>

namespace nrt {
namespace maths {
namespace time_series {

//! \brief The CCDC test for a stable regression fit.
//!
//! DESCRIPTION:\n
//! Following Zhu and Woodcock (2014), a fit is stable if the trend and
//! both ends of its residual series are small compared to the root mean
//! square residual, i.e. all of
//! <pre class="fragment">
//!   |slope| / rmse < threshold
//!   |first residual| / rmse < threshold
//!   |last residual| / rmse < threshold
//! </pre>
//! hold. The first and last residuals are the first and last which aren't
//! missing.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Comparisons against NaN are false, so a column without any residuals
//! or with rmse 0/0 is not stable.  The result is monotone in threshold.
class CCcdcStabilityTest : private core::CNonInstantiatable {
public:
    using TBoolVec = std::vector<bool>;
    using TDenseMatrix = common::CDenseMatrix<double>;
    using TDenseVector = common::CDenseVector<double>;

public:
    //! Test each column of \p residuals, whose trend coefficient is the
    //! corresponding entry of \p slope.
    //!
    //! \throws std::invalid_argument if \p slope and \p residuals don't
    //! have the same number of series.
    static TBoolVec isStable(const TDenseVector& slope, const TDenseMatrix& residuals, double threshold);

    //! Get the root mean square of the non-missing entries of column
    //! \p column of \p residuals.
    static double rmse(const TDenseMatrix& residuals, std::ptrdiff_t column);
};
}
}
}

#endif // INCLUDED_nrt_maths_time_series_CCcdcStabilityTest_h
