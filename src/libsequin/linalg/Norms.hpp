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
 * Provides vector norms.
 */

#ifndef LIBSEQUIN_NORMS_HPP_
#define LIBSEQUIN_NORMS_HPP_

#include <cmath>
#include <algorithm>

namespace sequin 
{

namespace linalg
{
	inline double sqr(double x) { return x * x; }

	/**
	 * @brief Computes the squared (discrete) @f$\ell^2@f$-norm of the given vector
	 * @param [in] x Pointer to vector whose norm is to be evaluated
	 * @param [in] size Number of elements in the vector
	 * @return The squared @f$\ell^2@f$-norm of the vector
	 */
	inline double l2NormSquared(double const* const x, int size)
	{
		double res = 0.0;
		for (int i = 0; i < size; ++i)
			res += sqr(x[i]);
		return res;
	}

	inline double l2Norm(double const* const x, int size)
	{
		return std::sqrt(l2NormSquared(x, size));
	}

	/**
	 * @brief Computes the (discrete) @f$\ell^\infty@f$-norm of the given vector
	 * @details A @c NaN element propagates to the result.
	 * @param [in] x Pointer to vector whose norm is to be evaluated
	 * @param [in] size Number of elements in the vector
	 * @return The @f$\ell^\infty@f$-norm of the vector
	 */
	inline double linfNorm(double const* const x, int size)
	{
		double res = 0.0;
		for (int i = 0; i < size; ++i)
		{
			if (std::isnan(x[i]))
				return x[i];
			res = std::max(std::abs(x[i]), res);
		}
		return res;
	}

	/**
	 * @brief Computes the (discrete) @f$\ell^2@f$-norm of the difference of the given vectors
	 * @param [in] x Pointer to vector @f$ x @f$
	 * @param [in] y Pointer to vector @f$ y @f$
	 * @param [in] size Number of elements in the vector
	 * @return The @f$\ell^2@f$-norm of the difference
	 */
	inline double l2NormDiff(double const* const x, double const* const y, int size)
	{
		double res = 0.0;
		for (int i = 0; i < size; ++i)
			res += sqr(x[i] - y[i]);
		return std::sqrt(res);
	}

} // namespace linalg

} // namespace sequin

#endif  // LIBSEQUIN_NORMS_HPP_
