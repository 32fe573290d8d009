/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#ifndef INCLUDED_nrt_maths_common_CLinearAlgebraEigen_h
#define INCLUDED_nrt_maths_common_CLinearAlgebraEigen_h

#include <maths/common/CLinearAlgebraFwd.h>

#include <Eigen/Core>
#include <Eigen/LU>

#include <cstddef>
#include <limits>
#include <utility>
#include <vector>

namespace nrt {
namespace maths {
namespace common {

//! \brief Decorates an Eigen matrix with some useful methods.
//!
//! Observation matrices are stored one series per column so a column
//! block is contiguous in memory.
template<typename SCALAR>
class CDenseMatrix : public Eigen::Matrix<SCALAR, Eigen::Dynamic, Eigen::Dynamic> {
public:
    using TBase = Eigen::Matrix<SCALAR, Eigen::Dynamic, Eigen::Dynamic>;

public:
    //! Forwarding constructor.
    template<typename... ARGS>
    CDenseMatrix(ARGS&&... args) : TBase(std::forward<ARGS>(args)...) {}

    //! \name Copy and Move Semantics
    //@{
    CDenseMatrix(const CDenseMatrix& other) = default;
    CDenseMatrix(CDenseMatrix&& other) = default;
    CDenseMatrix& operator=(const CDenseMatrix& other) = default;
    CDenseMatrix& operator=(CDenseMatrix&& other) = default;
    // @}

    //! Get a matrix of the given size filled with the missing value.
    static CDenseMatrix missing(std::ptrdiff_t rows, std::ptrdiff_t cols) {
        return TBase::Constant(rows, cols, std::numeric_limits<SCALAR>::quiet_NaN());
    }

    //! Convert from row major nested vectors.
    static CDenseMatrix fromRows(const std::vector<std::vector<SCALAR>>& rows) {
        std::ptrdiff_t cols{rows.empty() ? 0 : static_cast<std::ptrdiff_t>(rows[0].size())};
        CDenseMatrix result(static_cast<std::ptrdiff_t>(rows.size()), cols);
        for (std::size_t i = 0; i < rows.size(); ++i) {
            for (std::ptrdiff_t j = 0; j < cols; ++j) {
                result(i, j) = rows[i][j];
            }
        }
        return result;
    }
};

//! \brief Gets a constant dense square matrix with specified dimension or with
//! specified numbers of rows and columns.
template<typename SCALAR>
struct SConstant<CDenseMatrix<SCALAR>> {
    static CDenseMatrix<SCALAR> get(std::ptrdiff_t dimension, SCALAR constant) {
        return get(dimension, dimension, constant);
    }
    static CDenseMatrix<SCALAR> get(std::ptrdiff_t rows, std::ptrdiff_t cols, SCALAR constant) {
        return CDenseMatrix<SCALAR>::Constant(rows, cols, constant);
    }
};

//! \brief Decorates an Eigen column vector with some useful methods.
template<typename SCALAR>
class CDenseVector : public Eigen::Matrix<SCALAR, Eigen::Dynamic, 1> {
public:
    using TBase = Eigen::Matrix<SCALAR, Eigen::Dynamic, 1>;

public:
    //! Forwarding constructor.
    template<typename... ARGS>
    CDenseVector(ARGS&&... args) : TBase(std::forward<ARGS>(args)...) {}

    //! \name Copy and Move Semantics
    //@{
    CDenseVector(const CDenseVector& other) = default;
    CDenseVector(CDenseVector&& other) = default;
    CDenseVector& operator=(const CDenseVector& other) = default;
    CDenseVector& operator=(CDenseVector&& other) = default;
    // @}

    //! Convert to a std::vector.
    //!
    //! It is assumed that COLLECTION supports reserve and push_back.
    template<typename COLLECTION>
    COLLECTION to() const {
        COLLECTION result;
        result.reserve(this->size());
        for (int i = 0; i < this->size(); ++i) {
            result.push_back(this->coeff(i));
        }
        return result;
    }

    //! Convert from a std::vector.
    static CDenseVector<SCALAR> fromStdVector(const std::vector<SCALAR>& vector) {
        CDenseVector<SCALAR> result(vector.size());
        for (std::size_t i = 0; i < vector.size(); ++i) {
            result(i) = vector[i];
        }
        return result;
    }
};

//! \brief Gets a constant dense vector with specified dimension.
template<typename SCALAR>
struct SConstant<CDenseVector<SCALAR>> {
    static CDenseVector<SCALAR> get(std::ptrdiff_t dimension, SCALAR constant) {
        return CDenseVector<SCALAR>::Constant(dimension, constant);
    }
};
}
}
}

#endif // INCLUDED_nrt_maths_common_CLinearAlgebraEigen_h
