/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#ifndef INCLUDED_nrt_maths_common_CBasicStatistics_h
#define INCLUDED_nrt_maths_common_CBasicStatistics_h

#include <algorithm>
#include <cstddef>
#include <vector>

namespace nrt {
namespace maths {
namespace common {

//! \brief Some basic stats utilities.
//!
//! DESCRIPTION:\n
//! Some utilities for computing basic sample statistics such
//! as central moments and the median.
class CBasicStatistics {
public:
    using TDoubleVec = std::vector<double>;

public:
    //! Compute the mean of a vector.
    static double mean(const TDoubleVec& data);

    //! Compute the sample median.
    static double median(const TDoubleVec& data);

    //! Compute the median absolute deviation.
    static double mad(const TDoubleVec& data);

    //! \brief An accumulator class for sample central moments.
    //!
    //! DESCRIPTION:\n
    //! This function object accumulates sample central moments for a set
    //! of samples passed to its function operator.
    //!
    //! The updates are done in a numerically stable way, i.e. the mean is
    //! updated incrementally rather than summing the values and dividing
    //! by the count at the end.
    //!
    //! \tparam ORDER The highest order moment to gather, one or two.
    template<unsigned int ORDER>
    struct SSampleCentralMoments {
        static_assert(ORDER == 1 || ORDER == 2, "Only mean and variance are supported");

        SSampleCentralMoments() : s_Count(0.0) {
            std::fill_n(s_Moments, ORDER, 0.0);
        }

        //! Define a function operator for use with std:: algorithms.
        inline void operator()(double x) { this->add(x); }

        //! Update the moments with \p x. \p n is the optional number
        //! of times to add \p x.
        void add(double x, double n = 1.0) {
            if (n == 0.0) {
                return;
            }

            s_Count += n;

            double alpha{n / s_Count};
            double beta{1.0 - alpha};

            double mean{s_Moments[0]};
            s_Moments[0] = beta * mean + alpha * x;

            if (ORDER > 1) {
                double r{x - s_Moments[0]};
                double dMean{mean - s_Moments[0]};
                s_Moments[ORDER - 1] = beta * (s_Moments[ORDER - 1] + dMean * dMean) +
                                       alpha * r * r;
            }
        }

        //! The count of samples.
        double s_Count;

        //! The central moments.
        double s_Moments[ORDER];
    };

    //! \brief Wrapper to make creating a mean accumulator easier.
    struct SSampleMean {
        using TAccumulator = SSampleCentralMoments<1>;
    };

    //! \brief Wrapper to make creating a mean and variance accumulator easier.
    struct SSampleMeanVar {
        using TAccumulator = SSampleCentralMoments<2>;
    };

    //! Extract the count from an accumulator object.
    template<unsigned int N>
    static inline double count(const SSampleCentralMoments<N>& accumulator) {
        return accumulator.s_Count;
    }

    //! Extract the mean from an accumulator object.
    template<unsigned int N>
    static inline double mean(const SSampleCentralMoments<N>& accumulator) {
        return accumulator.s_Moments[0];
    }

    //! Extract the variance from an accumulator object.
    //!
    //! \note This is the unbiased form.
    static inline double variance(const SSampleCentralMoments<2>& accumulator) {
        if (accumulator.s_Count <= 1.0) {
            return 0.0;
        }
        double bias{accumulator.s_Count / (accumulator.s_Count - 1.0)};
        return bias * accumulator.s_Moments[1];
    }

    //! Extract the maximum likelihood variance from an accumulator object.
    //!
    //! \note This is the biased form, i.e. the population variance.
    static inline double maximumLikelihoodVariance(const SSampleCentralMoments<2>& accumulator) {
        return accumulator.s_Moments[1];
    }
};
}
}
}

#endif // INCLUDED_nrt_maths_common_CBasicStatistics_h
