// =============================================================================
//  SEQUIN
//  
//  Copyright © 2008-present: The SEQUIN Authors
//            Please see the AUTHORS.md file.
//  
//  All rights reserved. This program and the accompanying materials
//  are made available under the terms of the GNU Public License v3.0 (or, at
//  your option, any later version) which accompanies this distribution, and
//  is available at http://www.gnu.org/licenses/gpl.html
// =============================================================================

/**
 * @file 
 * Defines a rectangular dense matrix that can be factorized if it is square
 */

#ifndef LIBSEQUIN_DENSEMATRIX_HPP_
#define LIBSEQUIN_DENSEMATRIX_HPP_

#include "sequin/sequinCompilerInfo.hpp"
#include "common/CompilerSpecific.hpp"
#include "LapackInterface.hpp"

#include <ostream>
#include <algorithm>

namespace sequin
{

namespace linalg
{

namespace detail
{

	/**
	 * @brief Dense matrix base class providing factorization and equilibration
	 * @details LAPACK uses column-major storage, whereas this class uses row-major.
	 *          Thus, what we call a row here is actually a column for LAPACK.
	 *          The transposed LAPACK operations are used for solution and
	 *          matrix-vector multiplication. The ordering is irrelevant for the
	 *          factorization.
	 *
	 *          Memory is managed by the derived classes.
	 */
	class DenseMatrixBase
	{
	public:

		~DenseMatrixBase() SEQUIN_NOEXCEPT { }

		/**
		 * @brief Sets all matrix elements to the given value
		 * @param [in] val Value all matrix elements are set to
		 */
		inline void setAll(double val)
		{
			std::fill(_data, _data + stride() * _rows, val);
		}

		/**
		 * @brief Accesses an element in the matrix
		 * @param [in] row Index of the row
		 * @param [in] col Index of the column
		 * @return Matrix element at the given position
		 */
		inline double& native(unsigned int row, unsigned int col)
		{
			sequin_assert(row < _rows);
			sequin_assert(col < _cols);
			return _data[row * stride() + col];
		}

		inline const double native(unsigned int row, unsigned int col) const
		{
			sequin_assert(row < _rows);
			sequin_assert(col < _cols);
			return _data[row * stride() + col];
		}

		inline unsigned int elements() const SEQUIN_NOEXCEPT { return _cols * _rows; }
		inline unsigned int columns() const SEQUIN_NOEXCEPT { return _cols; }
		inline unsigned int rows() const SEQUIN_NOEXCEPT { return _rows; }

		inline double* data() SEQUIN_NOEXCEPT { return _data; }
		inline double const* data() const SEQUIN_NOEXCEPT { return _data; }

		inline unsigned int stride() const SEQUIN_NOEXCEPT { return _cols; }

		/**
		 * @brief Provides access to the underlying data in the given row
		 * @param [in] idx Index of the row
		 * @return Pointer to first element in the given row
		 */
		inline double* rowPtr(unsigned int idx)
		{
			sequin_assert(idx < _rows);
			return _data + stride() * idx;
		}

		inline double const* rowPtr(unsigned int idx) const
		{
			sequin_assert(idx < _rows);
			return _data + stride() * idx;
		}

		/**
		 * @brief Multiplies this matrix with a vector, @f$ y = Ax @f$
		 * @param [in] x Vector @f$ x @f$ with as many elements as there are columns
		 * @param [out] y Vector @f$ y @f$ with as many elements as there are rows
		 */
		inline void multiplyVector(const double* const x, double* const y) const
		{
			multiplyVector(x, 1.0, 0.0, y);
		}

		/**
		 * @brief Multiplies this matrix with a vector, @f$ y = \alpha Ax + \beta y @f$
		 */
		void multiplyVector(const double* const x, double alpha, double beta, double* const y) const;

		/**
		 * @brief Factorizes the matrix using LAPACK (performs LU factorization)
		 * @details The factorization is done in place. The matrix has to be square.
		 * @return @c true if the factorization was successful, otherwise @c false
		 */
		bool factorize();

		/**
		 * @brief Uses the factorized matrix to solve the equation @f$ Ax = y @f$ with LAPACK
		 * @details Before the equation can be solved, the matrix has to be factorized first by calling factorize().
		 * @param [in,out] rhs On entry, right hand side of the equation system. On exit, solution of the system.
		 * @return @c true if the system was solved correctly, otherwise @c false
		 */
		bool solve(double* rhs) const;

		/**
		 * @brief Solves a system whose rows were scaled by scaleRows() before factorize()
		 * @details The right hand side is scaled with the same factors before solving.
		 * @param [in] scalingFactors Row scaling factors
		 * @param [in,out] rhs On entry, right hand side of the equation system. On exit, solution of the system.
		 * @return @c true if the system was solved correctly, otherwise @c false
		 */
		bool solve(double const* scalingFactors, double* rhs) const;

		/**
		 * @brief Divides each row by its scaling factor
		 * @param [in] scalingFactors Array with one factor per row
		 */
		void scaleRows(double const* scalingFactors);

		/**
		 * @brief Computes row scaling factors that equilibrate the matrix
		 * @details The factor of a row is its maximum absolute entry, or @c 1 if the row is zero.
		 *          Pass the factors to scaleRows() to equilibrate the matrix.
		 * @param [out] scalingFactors Array with one factor per row
		 */
		void rowScaleFactors(double* scalingFactors) const;

		/**
		 * @brief Copies the elements of a matrix of the same size
		 * @param [in] src Source matrix
		 */
		inline void copyFrom(const DenseMatrixBase& src)
		{
			sequin_assert(_rows == src._rows);
			sequin_assert(_cols == src._cols);
			std::copy(src._data, src._data + src.elements(), _data);
		}

	protected:

		double* _data; //!< Row-major storage of the elements
		unsigned int _rows;
		unsigned int _cols;
		lapackInt_t* _pivot; //!< Pivot array of the LU factorization

		DenseMatrixBase() SEQUIN_NOEXCEPT : _data(nullptr), _rows(0), _cols(0), _pivot(nullptr) { }
	};

	std::ostream& operator<<(std::ostream& out, const DenseMatrixBase& mat);

} // namespace detail


/**
 * @brief Dense matrix that owns its memory
 * @details No memory is allocated on construction without size. Users have to call resize() first.
 */
class DenseMatrix : public detail::DenseMatrixBase
{
public:

	DenseMatrix() SEQUIN_NOEXCEPT { }

	DenseMatrix(unsigned int rows, unsigned int cols)
	{
		resize(rows, cols);
	}

	~DenseMatrix() SEQUIN_NOEXCEPT
	{
		delete[] _pivot;
		delete[] _data;
	}

	DenseMatrix(const DenseMatrix& cpy)
	{
		resize(cpy._rows, cpy._cols);
		copyFrom(cpy);
	}

	DenseMatrix(DenseMatrix&& cpy) SEQUIN_NOEXCEPT
	{
		_data = cpy._data;
		_pivot = cpy._pivot;
		_rows = cpy._rows;
		_cols = cpy._cols;
		cpy._data = nullptr;
		cpy._pivot = nullptr;
		cpy._rows = 0;
		cpy._cols = 0;
	}

	DenseMatrix& operator=(const DenseMatrix& cpy)
	{
		if (this == &cpy)
			return *this;

		resize(cpy._rows, cpy._cols);
		copyFrom(cpy);
		return *this;
	}

	DenseMatrix& operator=(DenseMatrix&& cpy) SEQUIN_NOEXCEPT
	{
		delete[] _pivot;
		delete[] _data;

		_data = cpy._data;
		_pivot = cpy._pivot;
		_rows = cpy._rows;
		_cols = cpy._cols;
		cpy._data = nullptr;
		cpy._pivot = nullptr;
		cpy._rows = 0;
		cpy._cols = 0;
		return *this;
	}

	/**
	 * @brief Allocates memory for the given size
	 * @details Existing elements are not preserved. Memory is only reallocated if the size changes.
	 * @param [in] rows Number of rows
	 * @param [in] cols Number of columns
	 */
	inline void resize(unsigned int rows, unsigned int cols)
	{
		if ((rows == _rows) && (cols == _cols) && _data)
			return;

		delete[] _pivot;
		delete[] _data;

		_rows = rows;
		_cols = cols;
		_data = new double[std::max(rows * cols, 1u)];
		_pivot = new lapackInt_t[std::max(std::min(rows, cols), 1u)];
	}
};

} // namespace linalg

} // namespace sequin

#endif  // LIBSEQUIN_DENSEMATRIX_HPP_
