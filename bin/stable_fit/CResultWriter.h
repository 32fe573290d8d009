/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_nrt_stable_fit_CResultWriter_h
#define INCLUDED_nrt_stable_fit_CResultWriter_h

#include <core/CoreTypes.h>

#include <maths/time_series/CCcdcStableFit.h>

#include <iosfwd>
#include <string>
#include <vector>

namespace nrt {
namespace stable_fit {

//! \brief
//! Write the stable fit of each pixel in JSON format.
//!
//! DESCRIPTION:\n
//! One document is written per line and pixel, of the form:
//!
//! {"pixel":"p1","stable":true,"state":"stable","window_start":1546300800,
//!  "coefficients":[...],"residuals":[...]}
//!
//! The state is one of "stable", "insufficient_data" or "inconclusive".
//! Missing coefficients and residuals, and the window start of a pixel
//! which was never fit, are null.
//!
class CResultWriter {
public:
    using TStrVec = std::vector<std::string>;
    using TTimeVec = std::vector<core_t::TTime>;
    using TStableFit = maths::time_series::CCcdcStableFit;

public:
    //! \param[in] outputStream The stream to which to write results.
    explicit CResultWriter(std::ostream& outputStream);

    //! Write one document for each of \p pixels.
    void write(const TStrVec& pixels, const TTimeVec& dates, const TStableFit::SResult& result);

    //! Get the name written for \p state.
    static const char* stateName(TStableFit::EColumnState state);

private:
    std::ostream& m_OutputStream;
};
}
}

#endif // INCLUDED_nrt_stable_fit_CResultWriter_h
