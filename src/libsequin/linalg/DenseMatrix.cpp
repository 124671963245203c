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

#include "linalg/DenseMatrix.hpp"

#include <cmath>
#include <algorithm>

namespace sequin
{

namespace linalg
{

namespace detail
{

void DenseMatrixBase::multiplyVector(const double* const x, double alpha, double beta, double* const y) const
{
	// LAPACK sees the transposed matrix, so rows and columns interchange
	lapackInt_t m = _cols;
	lapackInt_t n = _rows;
	lapackInt_t lda = stride();
	lapackInt_t inc = 1;

	char trans[] = "T";

	// LAPACK computes y <- alpha * A * x + beta * y
	LapackMultiplyDense(trans, &m, &n, &alpha, const_cast<double*>(_data), &lda, const_cast<double*>(x), &inc, &beta, y, &inc);
}

bool DenseMatrixBase::factorize()
{
	sequin_assert(_rows == _cols);

	lapackInt_t n = _rows;
	lapackInt_t lda = stride();
	lapackInt_t flag = 0;

	LapackFactorDense(&n, &n, _data, &lda, _pivot, &flag);

	// A positive flag indicates an exactly singular U factor
	return flag == 0;
}

bool DenseMatrixBase::solve(double* rhs) const
{
	sequin_assert(_rows == _cols);

	lapackInt_t n = _rows;
	lapackInt_t nrhs = 1;
	lapackInt_t lda = stride();
	lapackInt_t flag = 0;

	// Solve the transposed equation, which uses the original matrix
	char trans[] = "T";

	LapackSolveDense(trans, &n, &nrhs, const_cast<double*>(_data), &lda, const_cast<lapackInt_t*>(_pivot), rhs, &n, &flag);
	return flag == 0;
}

bool DenseMatrixBase::solve(double const* scalingFactors, double* rhs) const
{
	for (unsigned int i = 0; i < _rows; ++i)
		rhs[i] /= scalingFactors[i];
	return solve(rhs);
}

void DenseMatrixBase::scaleRows(double const* scalingFactors)
{
	const unsigned int ld = stride();
	for (unsigned int i = 0; i < _rows; ++i)
	{
		for (unsigned int j = 0; j < _cols; ++j)
			_data[i * ld + j] /= scalingFactors[i];
	}
}

void DenseMatrixBase::rowScaleFactors(double* scalingFactors) const
{
	const unsigned int ld = stride();
	for (unsigned int i = 0; i < _rows; ++i)
	{
		double maxAbs = 0.0;
		for (unsigned int j = 0; j < _cols; ++j)
			maxAbs = std::max(maxAbs, std::abs(_data[i * ld + j]));

		scalingFactors[i] = (maxAbs > 0.0) ? maxAbs : 1.0;
	}
}

std::ostream& operator<<(std::ostream& out, const DenseMatrixBase& mat)
{
	out << "[";
	for (unsigned int r = 0; r < mat.rows(); ++r)
	{
		for (unsigned int c = 0; c < mat.columns(); ++c)
		{
			out << mat.native(r, c);
			if (c < mat.columns() - 1)
				out << ",";
		}
		if (r < mat.rows() - 1)
			out << ";\n";
	}
	out << "]";
	return out;
}

} // namespace detail

} // namespace linalg

} // namespace sequin
