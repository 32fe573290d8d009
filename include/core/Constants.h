/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#ifndef INCLUDED_nrt_core_Constants_h
#define INCLUDED_nrt_core_Constants_h

#include <core/CoreTypes.h>

namespace nrt {
namespace core {
namespace constants {

//! A minute in seconds.
constexpr core_t::TTime MINUTE{60};

//! An hour in seconds.
constexpr core_t::TTime HOUR{3600};

//! A day in seconds.
constexpr core_t::TTime DAY{86400};

//! A week in seconds.
constexpr core_t::TTime WEEK{604800};

//! 365 days in seconds.
constexpr core_t::TTime YEAR{31536000};

//! The average length of a Gregorian year, 365.2425 days, in seconds.
//!
//! \note A span of exactly 365 days is shorter than this.
constexpr core_t::TTime GREGORIAN_YEAR{31556952};

#ifdef Windows
const char PATH_SEPARATOR = '\\';
#else
const char PATH_SEPARATOR = '/';
#endif
}
}
}

#endif // INCLUDED_nrt_core_Constants_h
