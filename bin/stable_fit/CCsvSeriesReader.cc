/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include "CCsvSeriesReader.h"

#include <core/CLogger.h>
#include <core/CStringUtils.h>

#include <istream>
#include <limits>

namespace nrt {
namespace stable_fit {

const std::string CCsvSeriesReader::TIME_FIELD{"time"};

bool CCsvSeriesReader::read(std::istream& strm) {
    m_Pixels.clear();
    m_Dates.clear();

    TDoubleVec values;
    std::string line;
    bool haveHeader{false};
    std::size_t lineNumber{0};

    while (std::getline(strm, line)) {
        ++lineNumber;
        core::CStringUtils::trimWhitespace(line);
        if (line.empty()) {
            continue;
        }
        if (haveHeader == false) {
            if (this->parseHeader(line) == false) {
                return false;
            }
            haveHeader = true;
            continue;
        }
        if (this->parseRecord(line, lineNumber, values) == false) {
            return false;
        }
    }
    if (strm.bad()) {
        LOG_ERROR(<< "Input stream went bad after line " << lineNumber);
        return false;
    }
    if (haveHeader == false) {
        LOG_ERROR(<< "Input has no header");
        return false;
    }

    std::size_t n{m_Dates.size()};
    std::size_t k{m_Pixels.size()};
    m_Values = TDenseMatrix(n, k);
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = 0; j < k; ++j) {
            m_Values(i, j) = values[i * k + j];
        }
    }
    LOG_DEBUG(<< "Read " << n << " observations of " << k << " pixels");

    return true;
}

const CCsvSeriesReader::TStrVec& CCsvSeriesReader::pixels() const {
    return m_Pixels;
}

const CCsvSeriesReader::TTimeVec& CCsvSeriesReader::dates() const {
    return m_Dates;
}

const CCsvSeriesReader::TDenseMatrix& CCsvSeriesReader::values() const {
    return m_Values;
}

bool CCsvSeriesReader::parseHeader(const std::string& line) {
    if (m_LineParser.parseLine(line, m_Fields) == false) {
        LOG_ERROR(<< "Unable to parse header '" << line << "'");
        return false;
    }
    if (m_Fields.size() < 2) {
        LOG_ERROR(<< "Header '" << line << "' names no pixels");
        return false;
    }
    core::CStringUtils::trimWhitespace(m_Fields[0]);
    if (core::CStringUtils::toLower(m_Fields[0]) != TIME_FIELD) {
        LOG_ERROR(<< "First header field should be '" << TIME_FIELD << "' but is '"
                  << m_Fields[0] << "'");
        return false;
    }
    m_Pixels.assign(m_Fields.begin() + 1, m_Fields.end());
    for (auto& pixel : m_Pixels) {
        core::CStringUtils::trimWhitespace(pixel);
    }
    return true;
}

bool CCsvSeriesReader::parseRecord(const std::string& line, std::size_t lineNumber, TDoubleVec& values) {
    if (m_LineParser.parseLine(line, m_Fields) == false) {
        LOG_ERROR(<< "Unable to parse line " << lineNumber << " '" << line << "'");
        return false;
    }
    if (m_Fields.size() != m_Pixels.size() + 1) {
        LOG_ERROR(<< "Line " << lineNumber << " has " << m_Fields.size()
                  << " fields but the header has " << m_Pixels.size() + 1);
        return false;
    }

    core_t::TTime time{0};
    core::CStringUtils::trimWhitespace(m_Fields[0]);
    if (core::CStringUtils::stringToType(m_Fields[0], time) == false) {
        LOG_ERROR(<< "Invalid time '" << m_Fields[0] << "' on line " << lineNumber);
        return false;
    }
    if (m_Dates.empty() == false && time <= m_Dates.back()) {
        LOG_ERROR(<< "Time " << time << " on line " << lineNumber
                  << " is not after the previous time " << m_Dates.back());
        return false;
    }
    m_Dates.push_back(time);

    for (std::size_t j = 1; j < m_Fields.size(); ++j) {
        std::string& field{m_Fields[j]};
        core::CStringUtils::trimWhitespace(field);
        double value{std::numeric_limits<double>::quiet_NaN()};
        if (field.empty() == false && core::CStringUtils::toLower(field) != "nan" &&
            core::CStringUtils::stringToType(field, value) == false) {
            LOG_ERROR(<< "Invalid value '" << field << "' for pixel " << m_Pixels[j - 1]
                      << " on line " << lineNumber);
            return false;
        }
        values.push_back(value);
    }
    return true;
}
}
}
