/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include "CResultWriter.h"

#include <maths/common/CMathsFuncs.h>

#include <boost/json.hpp>

#include <cstdint>
#include <ostream>
#include <stdexcept>

namespace json = boost::json;
namespace nrt {
namespace stable_fit {
namespace {
const std::string PIXEL_TAG{"pixel"};
const std::string STABLE_TAG{"stable"};
const std::string STATE_TAG{"state"};
const std::string WINDOW_START_TAG{"window_start"};
const std::string COEFFICIENTS_TAG{"coefficients"};
const std::string RESIDUALS_TAG{"residuals"};

json::value toJson(double value) {
    if (maths::common::CMathsFuncs::isFinite(value) == false) {
        return nullptr;
    }
    return value;
}

template<typename COLUMN>
json::array toJsonArray(const COLUMN& column) {
    json::array result;
    result.reserve(static_cast<std::size_t>(column.size()));
    for (std::ptrdiff_t i = 0; i < column.size(); ++i) {
        result.push_back(toJson(column(i)));
    }
    return result;
}
}

CResultWriter::CResultWriter(std::ostream& outputStream)
    : m_OutputStream{outputStream} {
}

void CResultWriter::write(const TStrVec& pixels,
                          const TTimeVec& dates,
                          const TStableFit::SResult& result) {
    if (static_cast<std::ptrdiff_t>(pixels.size()) != result.s_Coefficients.cols()) {
        throw std::invalid_argument{"Need one pixel identifier per fitted series"};
    }

    for (std::size_t j = 0; j < pixels.size(); ++j) {
        json::object doc;
        doc[PIXEL_TAG] = pixels[j];
        doc[STABLE_TAG] = static_cast<bool>(result.s_IsStable[j]);
        doc[STATE_TAG] = stateName(result.s_States[j]);
        std::size_t start{result.s_WindowStart[j]};
        if (start == TStableFit::NO_WINDOW) {
            doc[WINDOW_START_TAG] = nullptr;
        } else {
            doc[WINDOW_START_TAG] = static_cast<std::int64_t>(dates[start]);
        }
        doc[COEFFICIENTS_TAG] = toJsonArray(result.s_Coefficients.col(j));
        doc[RESIDUALS_TAG] = toJsonArray(result.s_Residuals.col(j));
        m_OutputStream << json::serialize(doc) << '\n';
    }
    m_OutputStream.flush();
}

const char* CResultWriter::stateName(TStableFit::EColumnState state) {
    switch (state) {
    case TStableFit::E_Stable:
        return "stable";
    case TStableFit::E_InsufficientData:
        return "insufficient_data";
    case TStableFit::E_Iterating:
        break;
    }
    return "inconclusive";
}
}
}
