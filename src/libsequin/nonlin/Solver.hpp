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
 * Interface of the square system solvers used by the solver adapter
 */

#ifndef LIBSEQUIN_NONLINSOLVER_HPP_
#define LIBSEQUIN_NONLINSOLVER_HPP_

#include <functional>
#include <string>

namespace sequin
{

class IParameterProvider;

namespace linalg
{
	namespace detail
	{
		class DenseMatrixBase;
	}
}

namespace nonlin
{

	/**
	 * @brief Solves a square system of equality constraints @f$ F(x) = 0 @f$
	 * @details The unknowns are the free variables of an equation block in gather order.
	 */
	class Solver
	{
	public:
		virtual ~Solver() { }

		/**
		 * @brief Returns the identifier that createSolver() accepts for this solver
		 * @return Identifier of the solver
		 */
		virtual const char* name() const = 0;

		/**
		 * @brief Reads solver options like @c MAX_ITERATIONS from @p paramProvider
		 * @details Options that are not present keep their current value.
		 * @param [in] paramProvider Solver options
		 * @return @c true if all options were accepted, otherwise @c false
		 */
		virtual bool configure(IParameterProvider& paramProvider) = 0;

		/**
		 * @brief Returns the number of doubles that solve() needs as working memory
		 * @param [in] problemSize Number of unknowns
		 * @return Size of the working memory
		 */
		virtual unsigned int workspaceSize(unsigned int problemSize) const = 0;

		/**
		 * @brief Solves the system starting from @p point
		 * @details @p residual and @p jacobian return @c false if they cannot be evaluated at the
		 *          given point, which stops the iteration.
		 * @param [in] residual Evaluates the constraint residuals at a point
		 * @param [in] jacobian Evaluates the Jacobian of the residuals at a point
		 * @param [in] tol Tolerance on the residual norm
		 * @param [in,out] point Initial guess on entry, last accepted iterate on exit
		 * @param [in] workingMemory Memory of size workspaceSize()
		 * @param [in,out] jacMatrix Square matrix of size @p size that holds the Jacobian
		 * @param [in] size Number of unknowns and equations
		 * @return @c true if the tolerance was met, otherwise @c false
		 */
		virtual bool solve(std::function<bool(double const* const, double* const)> residual, std::function<bool(double const* const, linalg::detail::DenseMatrixBase& jac)> jacobian,
			double tol, double* const point, double* const workingMemory, linalg::detail::DenseMatrixBase& jacMatrix, unsigned int size) const = 0;
	};

	/**
	 * @brief Creates the solver with the given identifier
	 * @details An empty @p name selects the composite solver with its default subsolvers.
	 * @param [in] name Identifier of the solver
	 * @return Solver owned by the caller or @c nullptr if @p name is unknown
	 */
	Solver* createSolver(const std::string& name);

} // namespace nonlin

} // namespace sequin

#endif  // LIBSEQUIN_NONLINSOLVER_HPP_
