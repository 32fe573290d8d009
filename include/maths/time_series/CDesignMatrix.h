/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#ifndef INCLUDED_nrt_maths_time_series_CDesignMatrix_h
#define INCLUDED_nrt_maths_time_series_CDesignMatrix_h

#include <core/CNonInstantiatable.h>
#include <core/CoreTypes.h>

#include <maths/common/CLinearAlgebraEigen.h>

#include <cstddef>
#include <vector>

namespace nrt {
namespace maths {
namespace time_series {

//! \brief Builds the regressors of a trend plus harmonic season model.
//!
//! DESCRIPTION:\n
//! The model of a series observed at decimal years t is
//! <pre class="fragment">
//!   y(t) = a + b t + sum_i { c_i cos(2 pi i t) + d_i sin(2 pi i t) }
//! </pre>
//! and the design matrix has one row per date with the columns in the
//! order intercept, trend (if requested) and then the cosine and sine of
//! each harmonic. The trend coefficient is therefore row 1, which is
//! the row CCcdcStableFit tests by default.
class CDesignMatrix : private core::CNonInstantiatable {
public:
    using TDenseMatrix = common::CDenseMatrix<double>;
    using TTimeVec = std::vector<core_t::TTime>;

public:
    //! Build the design matrix for \p dates.
    static TDenseMatrix build(const TTimeVec& dates, bool trend, std::size_t harmonicOrder);

    //! Get the number of columns of the design matrix.
    static std::size_t numberCoefficients(bool trend, std::size_t harmonicOrder);

    //! Get \p time as a decimal year, i.e. the calendar year plus the
    //! fraction of that year which has elapsed at \p time (UTC).
    static double decimalYear(core_t::TTime time);
};
}
}
}

#endif // INCLUDED_nrt_maths_time_series_CDesignMatrix_h
