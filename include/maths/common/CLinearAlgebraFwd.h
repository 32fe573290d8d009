/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#ifndef INCLUDED_nrt_maths_common_CLinearAlgebraFwd_h
#define INCLUDED_nrt_maths_common_CLinearAlgebraFwd_h

#include <cstddef>

// Unfortunately, Eigen headers seem to be super fragile to
// include directly so we just forward declare here ourselves.
namespace Eigen {
template<typename, int, int, int, int, int>
class Matrix;
}

namespace nrt {
namespace maths {
namespace common {

//! \brief Get a constant initialized version of \p TYPE.
//!
//! Each of our vector and matrix types provides a specialization
//! of this class and define a static get method which takes the
//! dimension(s) and the constant value.
template<typename TYPE>
struct SConstant {
    static_assert(sizeof(TYPE) < 0, "Missing specialisation of SConstant");
};

template<typename SCALAR>
class CDenseVector;
template<typename SCALAR>
class CDenseMatrix;
}
}
}

#endif // INCLUDED_nrt_maths_common_CLinearAlgebraFwd_h
