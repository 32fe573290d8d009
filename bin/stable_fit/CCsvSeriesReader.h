/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_nrt_stable_fit_CCsvSeriesReader_h
#define INCLUDED_nrt_stable_fit_CCsvSeriesReader_h

#include <core/CCsvLineParser.h>
#include <core/CoreTypes.h>

#include <maths/common/CLinearAlgebraEigen.h>

#include <iosfwd>
#include <string>
#include <vector>

namespace nrt {
namespace stable_fit {

//! \brief
//! Reads a set of pixel time series from CSV.
//!
//! DESCRIPTION:\n
//! The first line is a header whose first field is "time" and whose
//! remaining fields name the pixels. Every following line holds a time
//! in seconds since the epoch and one observation per pixel. An empty
//! field or "nan" (in any case) is a missing observation. Blank lines are
//! skipped and times must be strictly increasing.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The whole input is read before anything is returned because every
//! series is fit over the same dates.
//!
class CCsvSeriesReader {
public:
    using TDoubleVec = std::vector<double>;
    using TStrVec = std::vector<std::string>;
    using TTimeVec = std::vector<core_t::TTime>;
    using TDenseMatrix = maths::common::CDenseMatrix<double>;

public:
    //! The name of the first header field.
    static const std::string TIME_FIELD;

public:
    //! Read everything from \p strm. Returns false and logs an error if
    //! the input is malformed.
    bool read(std::istream& strm);

    //! Get the pixel identifiers in column order.
    const TStrVec& pixels() const;

    //! Get the time of each row.
    const TTimeVec& dates() const;

    //! Get the observations, one row per date and one column per pixel.
    const TDenseMatrix& values() const;

private:
    bool parseHeader(const std::string& line);
    bool parseRecord(const std::string& line, std::size_t lineNumber, TDoubleVec& values);

private:
    core::CCsvLineParser m_LineParser;
    TStrVec m_Fields;
    TStrVec m_Pixels;
    TTimeVec m_Dates;
    TDenseMatrix m_Values;
};
}
}

#endif // INCLUDED_nrt_stable_fit_CCsvSeriesReader_h
