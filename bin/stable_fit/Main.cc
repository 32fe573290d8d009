/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
//! \brief
//! Finds the stable trailing window of a set of pixel time series.
//!
//! DESCRIPTION:\n
//! Reads pixel time series as CSV, fits each with a harmonic regression
//! model and writes the stable window of each pixel as JSON. The input
//! format is described in CCsvSeriesReader and the output format in
//! CResultWriter.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Standalone program.
//!
//! Any failure, including data which can't be fit at all, logs a fatal
//! message and exits with a non-zero status without writing any results.
//!
#include <core/CLogger.h>

#include <maths/common/CLinearAlgebraEigen.h>
#include <maths/time_series/CCcdcStableFit.h>
#include <maths/time_series/CDesignMatrix.h>
#include <maths/time_series/COutlierScreen.h>

#include "CCmdLineParser.h"
#include "CCsvSeriesReader.h"
#include "CResultWriter.h"

#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

int main(int argc, char** argv) {
    using TStableFit = nrt::maths::time_series::CCcdcStableFit;
    using TDenseMatrix = nrt::maths::common::CDenseMatrix<double>;

    // Read command line options
    std::string inputFileName;
    std::string outputFileName;
    std::string logProperties;
    std::string logLevel;
    TStableFit::SParams params;
    std::size_t harmonicOrder{2};
    bool trend{true};
    double shewhartLimit{0.0};
    if (nrt::stable_fit::CCmdLineParser::parse(argc, argv, inputFileName, outputFileName,
                                               logProperties, logLevel, params, harmonicOrder,
                                               trend, shewhartLimit) == false) {
        return EXIT_FAILURE;
    }

    if (logProperties.empty() == false &&
        nrt::core::CLogger::instance().reconfigureFromFile(logProperties) == false) {
        LOG_FATAL(<< "Could not reconfigure logging");
        return EXIT_FAILURE;
    }
    if (logLevel.empty() == false) {
        nrt::core::CLogger::ELevel level;
        std::istringstream strm{logLevel};
        if (!(strm >> level) || nrt::core::CLogger::instance().setLoggingLevel(level) == false) {
            LOG_FATAL(<< "Invalid log level '" << logLevel << "'");
            return EXIT_FAILURE;
        }
    }

    std::ifstream inputFile;
    if (inputFileName.empty() == false) {
        inputFile.open(inputFileName);
        if (inputFile.is_open() == false) {
            LOG_FATAL(<< "Could not open input file '" << inputFileName << "'");
            return EXIT_FAILURE;
        }
    }
    std::istream& input{inputFileName.empty() ? std::cin : inputFile};

    nrt::stable_fit::CCsvSeriesReader reader;
    if (reader.read(input) == false) {
        LOG_FATAL(<< "Failed to read pixel series");
        return EXIT_FAILURE;
    }

    TStableFit::SResult result;
    try {
        TDenseMatrix x{nrt::maths::time_series::CDesignMatrix::build(
            reader.dates(), trend, harmonicOrder)};
        TDenseMatrix y{reader.values()};
        if (shewhartLimit > 0.0) {
            nrt::maths::time_series::COutlierScreen::shewhart(x, y, shewhartLimit);
        }

        TStableFit fitter{params, [](const TStableFit::SIterationEvent& event) {
                              LOG_DEBUG(<< "Iteration " << event.s_Iteration << " fit "
                                        << event.s_Fitted << " pixels from row "
                                        << event.s_WindowStart << ": "
                                        << event.s_NewlyStable << " stable, "
                                        << event.s_NewlyInsufficient
                                        << " insufficient data, " << event.s_Remaining
                                        << " remaining");
                          }};
        result = fitter.fit(x, y, reader.dates());
    } catch (const std::exception& e) {
        LOG_FATAL(<< "Stable fit failed: " << e.what());
        return EXIT_FAILURE;
    }

    std::ofstream outputFile;
    if (outputFileName.empty() == false) {
        outputFile.open(outputFileName);
        if (outputFile.is_open() == false) {
            LOG_FATAL(<< "Could not open output file '" << outputFileName << "'");
            return EXIT_FAILURE;
        }
    }
    std::ostream& output{outputFileName.empty() ? std::cout : outputFile};

    nrt::stable_fit::CResultWriter writer{output};
    writer.write(reader.pixels(), reader.dates(), result);
    if (output.fail()) {
        LOG_FATAL(<< "Failed writing results");
        return EXIT_FAILURE;
    }

    // This message makes it easier to spot process crashes in a log file - if
    // this isn't present in the log for a given PID and there's no other log
    // message indicating early exit then the process has probably core dumped
    LOG_INFO(<< "stable_fit exiting");

    return EXIT_SUCCESS;
}
