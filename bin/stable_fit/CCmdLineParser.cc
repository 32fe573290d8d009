/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include "CCmdLineParser.h"

#include <boost/program_options.hpp>

#include <iostream>

namespace nrt {
namespace stable_fit {

const std::string CCmdLineParser::DESCRIPTION = "Usage: stable_fit [options]\n"
                                                "Options";

bool CCmdLineParser::parse(int argc,
                           const char* const* argv,
                           std::string& inputFileName,
                           std::string& outputFileName,
                           std::string& logProperties,
                           std::string& logLevel,
                           TStableFitParams& params,
                           std::size_t& harmonicOrder,
                           bool& trend,
                           double& shewhartLimit) {
    try {
        boost::program_options::options_description desc(DESCRIPTION);
        // clang-format off
        desc.add_options()
            ("help", "Display this information and exit")
            ("input", boost::program_options::value<std::string>(),
                        "CSV file to read the series from - default is STDIN")
            ("output", boost::program_options::value<std::string>(),
                        "File to write the results to - default is STDOUT")
            ("logProperties", boost::program_options::value<std::string>(),
                        "Optional Boost.Log settings file")
            ("logLevel", boost::program_options::value<std::string>(),
                        "Optional level to log at - TRACE, DEBUG, INFO, WARN, ERROR or FATAL")
            ("threshold", boost::program_options::value<double>(),
                        "Stability test threshold in units of RMSE - default is 3")
            ("windowStep", boost::program_options::value<std::size_t>(),
                        "Number of oldest observations to drop per iteration - default is 2")
            ("minObsFactor", boost::program_options::value<double>(),
                        "A series needs more than this multiple of the number of coefficients observations - default is 1.5")
            ("harmonics", boost::program_options::value<std::size_t>(),
                        "Number of annual harmonics in the model - default is 2")
            ("noTrend", "Don't include a linear trend in the model")
            ("shewhart", boost::program_options::value<double>(),
                        "Screen outliers beyond this many standard deviations of the residuals before fitting")
        ;
        // clang-format on

        boost::program_options::variables_map vm;
        boost::program_options::store(
            boost::program_options::parse_command_line(argc, argv, desc), vm);
        boost::program_options::notify(vm);

        if (vm.count("help") > 0) {
            std::cerr << desc << std::endl;
            return false;
        }
        if (vm.count("input") > 0) {
            inputFileName = vm["input"].as<std::string>();
        }
        if (vm.count("output") > 0) {
            outputFileName = vm["output"].as<std::string>();
        }
        if (vm.count("logProperties") > 0) {
            logProperties = vm["logProperties"].as<std::string>();
        }
        if (vm.count("logLevel") > 0) {
            logLevel = vm["logLevel"].as<std::string>();
        }
        if (vm.count("threshold") > 0) {
            params.s_Threshold = vm["threshold"].as<double>();
        }
        if (vm.count("windowStep") > 0) {
            params.s_WindowStep = vm["windowStep"].as<std::size_t>();
        }
        if (vm.count("minObsFactor") > 0) {
            params.s_MinimumObservationsFactor = vm["minObsFactor"].as<double>();
        }
        if (vm.count("harmonics") > 0) {
            harmonicOrder = vm["harmonics"].as<std::size_t>();
        }
        if (vm.count("noTrend") > 0) {
            trend = false;
        }
        if (vm.count("shewhart") > 0) {
            shewhartLimit = vm["shewhart"].as<double>();
            if ((shewhartLimit > 0.0) == false) {
                std::cerr << "Shewhart control limit must be positive" << std::endl;
                return false;
            }
        }
    } catch (std::exception& e) {
        std::cerr << "Error processing command line: " << e.what() << std::endl;
        return false;
    }

    return true;
}
}
}
