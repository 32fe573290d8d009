/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_nrt_core_CNonCopyable_h
#define INCLUDED_nrt_core_CNonCopyable_h

namespace nrt {
namespace core {

//! \brief
//! Private base for classes that own a unique resource.
//!
//! DESCRIPTION:\n
//! The logger singleton and its scoped handler guard derive privately
//! from this so that copies cannot be taken of them.
//!
class CNonCopyable {
protected:
    CNonCopyable() = default;
    ~CNonCopyable() = default;

public:
    CNonCopyable(const CNonCopyable&) = delete;
    CNonCopyable& operator=(const CNonCopyable&) = delete;
};
}
}

#endif // INCLUDED_nrt_core_CNonCopyable_h
