/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#ifndef INCLUDED_nrt_maths_time_series_COutlierScreen_h
#define INCLUDED_nrt_maths_time_series_COutlierScreen_h

#include <core/CNonInstantiatable.h>

#include <maths/common/CLinearAlgebraEigen.h>
#include <maths/common/CRobustLeastSquares.h>

#include <vector>

namespace nrt {
namespace maths {
namespace time_series {

//! \brief Screens observations which are likely clouds or other outliers.
//!
//! DESCRIPTION:\n
//! Both screens fit the series, one per column of Y, on a shared design
//! matrix and set observations with unusual residuals to NaN in place.
//!
//! The Shewhart control chart (Brooks et al., 2013) removes observations
//! whose ordinary least squares residual exceeds L standard deviations.
//!
//! The dual band screen (Zhu and Woodcock, 2014) fits the green and short
//! wave infrared bands robustly and flags an observation if its green
//! residual is more than 0.04 above, or its SWIR residual more than 0.04
//! below, the fit, in reflectance units. Clouds are bright in green and
//! cloud shadows are dark in SWIR, which is why the tests are one sided.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Series with fewer observations than coefficients can't be fit and are
//! left untouched.
class COutlierScreen : private core::CNonInstantiatable {
public:
    using TDenseMatrix = common::CDenseMatrix<double>;
    using TDenseMatrixVec = std::vector<TDenseMatrix>;
    using TBoolMatrix = common::CDenseMatrix<bool>;
    using TRobustParams = common::CRobustLeastSquares::SParams;

    //! The band residual, in reflectance units, above which an observation
    //! is an outlier.
    static const double DUAL_BAND_THRESHOLD;

public:
    //! Remove the observations of \p y whose absolute residual exceeds
    //! \p controlLimit times the residual standard deviation of their series.
    //!
    //! \return \p y.
    //! \throws std::invalid_argument if \p controlLimit isn't positive.
    static TDenseMatrix& shewhart(const TDenseMatrix& x, TDenseMatrix& y, double controlLimit);

    //! Remove the observations of \p y which the green and SWIR bands flag
    //! as clouds or cloud shadows.
    //!
    //! \param[in] x The design matrix.
    //! \param[in,out] y The series to screen, one per pixel.
    //! \param[in] green The green band, one image per row of \p x.
    //! \param[in] swir The SWIR band, one image per row of \p x.
    //! \param[in] scalingFactor The factor which converts band values to
    //! reflectance in [0, 1].
    //! \return A matrix which is true for the observations which are clear.
    //! The pixel in row r and column c of an image is column r * cols + c.
    //! \throws std::invalid_argument if the shapes are inconsistent.
    static TBoolMatrix ccdcRirls(const TDenseMatrix& x,
                                 TDenseMatrix& y,
                                 const TDenseMatrixVec& green,
                                 const TDenseMatrixVec& swir,
                                 double scalingFactor = 1.0);

    //! Overload with explicit robust fit parameters.
    static TBoolMatrix ccdcRirls(const TDenseMatrix& x,
                                 TDenseMatrix& y,
                                 const TDenseMatrixVec& green,
                                 const TDenseMatrixVec& swir,
                                 double scalingFactor,
                                 const TRobustParams& params);

    //! Flatten a cube of images to a matrix with one row per image.
    static TDenseMatrix flatten(const TDenseMatrixVec& cube);
};
}
}
}

#endif // INCLUDED_nrt_maths_time_series_COutlierScreen_h
