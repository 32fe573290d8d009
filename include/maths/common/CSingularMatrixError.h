/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#ifndef INCLUDED_nrt_maths_common_CSingularMatrixError_h
#define INCLUDED_nrt_maths_common_CSingularMatrixError_h

#include <stdexcept>
#include <string>

namespace nrt {
namespace maths {
namespace common {

//! \brief Thrown when a system of normal equations can't be solved.
//!
//! DESCRIPTION:\n
//! This is raised if a Gram matrix X'X is singular, which includes the
//! case that there are fewer observations than coefficients.  It aborts
//! the whole fitting call and no partial output is produced.
class CSingularMatrixError : public std::runtime_error {
public:
    explicit CSingularMatrixError(const std::string& what)
        : std::runtime_error{what} {}
};
}
}
}

#endif // INCLUDED_nrt_maths_common_CSingularMatrixError_h
