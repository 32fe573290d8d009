/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/time_series/CDesignMatrix.h>

#include <boost/date_time/gregorian/gregorian_types.hpp>
#include <boost/date_time/posix_time/conversion.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/math/constants/constants.hpp>

#include <cmath>

namespace nrt {
namespace maths {
namespace time_series {

CDesignMatrix::TDenseMatrix
CDesignMatrix::build(const TTimeVec& dates, bool trend, std::size_t harmonicOrder) {
    std::size_t p{numberCoefficients(trend, harmonicOrder)};
    TDenseMatrix result(dates.size(), p);

    for (std::size_t i = 0; i < dates.size(); ++i) {
        double t{decimalYear(dates[i])};
        std::size_t j{0};
        result(i, j++) = 1.0;
        if (trend) {
            result(i, j++) = t;
        }
        for (std::size_t order = 1; order <= harmonicOrder; ++order) {
            double phase{boost::math::double_constants::two_pi * static_cast<double>(order) * t};
            result(i, j++) = std::cos(phase);
            result(i, j++) = std::sin(phase);
        }
    }

    return result;
}

std::size_t CDesignMatrix::numberCoefficients(bool trend, std::size_t harmonicOrder) {
    return 1 + (trend ? 1 : 0) + 2 * harmonicOrder;
}

double CDesignMatrix::decimalYear(core_t::TTime time) {
    boost::posix_time::ptime instant{boost::posix_time::from_time_t(time)};
    int year{instant.date().year()};
    boost::posix_time::ptime start{boost::gregorian::date(year, 1, 1)};
    boost::posix_time::ptime end{boost::gregorian::date(year + 1, 1, 1)};
    double elapsed{static_cast<double>((instant - start).total_seconds())};
    double length{static_cast<double>((end - start).total_seconds())};
    return static_cast<double>(year) + elapsed / length;
}
}
}
}
