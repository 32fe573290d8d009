/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_nrt_stable_fit_CCmdLineParser_h
#define INCLUDED_nrt_stable_fit_CCmdLineParser_h

#include <maths/time_series/CCcdcStableFit.h>

#include <cstddef>
#include <string>

namespace nrt {
namespace stable_fit {

//! \brief
//! Very simple command line parser.
//!
//! DESCRIPTION:\n
//! Very simple command line parser.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Put in a class rather than main to allow testing.
//!
class CCmdLineParser {
public:
    using TStableFitParams = maths::time_series::CCcdcStableFit::SParams;

public:
    //! Parse the arguments and return options if appropriate. Options
    //! which aren't supplied leave the corresponding argument unchanged.
    static bool parse(int argc,
                      const char* const* argv,
                      std::string& inputFileName,
                      std::string& outputFileName,
                      std::string& logProperties,
                      std::string& logLevel,
                      TStableFitParams& params,
                      std::size_t& harmonicOrder,
                      bool& trend,
                      double& shewhartLimit);

private:
    static const std::string DESCRIPTION;
};
}
}

#endif // INCLUDED_nrt_stable_fit_CCmdLineParser_h
