/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#ifndef INCLUDED_nrt_maths_time_series_CInsufficientCoverageError_h
#define INCLUDED_nrt_maths_time_series_CInsufficientCoverageError_h

#include <stdexcept>
#include <string>

namespace nrt {
namespace maths {
namespace time_series {

//! \brief Thrown if a batch of series doesn't span enough time to be fit.
class CInsufficientCoverageError : public std::runtime_error {
public:
    explicit CInsufficientCoverageError(const std::string& what)
        : std::runtime_error{what} {}
};
}
}
}

#endif // INCLUDED_nrt_maths_time_series_CInsufficientCoverageError_h
