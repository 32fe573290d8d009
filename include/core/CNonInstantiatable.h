/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_nrt_core_CNonInstantiatable_h
#define INCLUDED_nrt_core_CNonInstantiatable_h

namespace nrt {
namespace core {

//! \brief
//! Private base for classes that are only a bag of static functions.
//!
//! DESCRIPTION:\n
//! The maths utilities, such as the least squares solvers and the
//! outlier screens, have no state and derive privately from this.
//!
class CNonInstantiatable {
public:
    CNonInstantiatable() = delete;
    CNonInstantiatable(const CNonInstantiatable&) = delete;
};
}
}

#endif // INCLUDED_nrt_core_CNonInstantiatable_h
