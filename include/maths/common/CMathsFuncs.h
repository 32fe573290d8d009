/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#ifndef INCLUDED_nrt_maths_common_CMathsFuncs_h
#define INCLUDED_nrt_maths_common_CMathsFuncs_h

#include <core/CNonInstantiatable.h>

#include <maths/common/CLinearAlgebraFwd.h>

#include <cstddef>

namespace nrt {
namespace maths {
namespace common {

//! \brief
//! Portable maths functions
//!
//! DESCRIPTION:\n
//! Portable maths functions
//!
//! IMPLEMENTATION DECISIONS:\n
//! Uses double - it's best that we DON'T use long double, as its size varies
//! between platforms and compilers.
//!
//! Missing observations are represented by quiet NaN throughout, so the
//! column helpers here treat NaN as "missing" rather than as an error.
//!
class CMathsFuncs : private core::CNonInstantiatable {
public:
    //! Wrapper around std::isnan() which avoids the need to add
    //! cryptic brackets everywhere to deal with macros.
    static bool isNan(double val);

    //! Wrapper around std::isinf() which avoids the need to add
    //! cryptic brackets everywhere to deal with macros.
    static bool isInf(double val);

    //! Neither infinite nor NaN.
    static bool isFinite(double val);

    //! Check if any of the components are NaN.
    static bool isNan(const CDenseVector<double>& val);

    //! Count the entries of column \p column of \p m which aren't missing.
    static std::size_t countNonMissing(const CDenseMatrix<double>& m, std::ptrdiff_t column);

    //! Count the entries of \p m which aren't missing.
    static std::size_t countNonMissing(const CDenseMatrix<double>& m);
};
}
}
}

#endif // INCLUDED_nrt_maths_common_CMathsFuncs_h
