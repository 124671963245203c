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
 * Defines the solver adapter used to solve equation blocks.
 */

#ifndef LIBSEQUIN_SOLVERADAPTER_HPP_
#define LIBSEQUIN_SOLVERADAPTER_HPP_

#include "sequin/Model.hpp"

namespace sequin
{

class IParameterProvider;

namespace model
{
	class EquationBlock;
}

/**
 * @brief Outcome of a solve
 */
struct SolverResult
{
	SolverStatus status; //!< Termination status
	unsigned int numUnknowns; //!< Number of unknowns of the solved system
	double residualNorm; //!< Maximum norm of the scaled residual at the final iterate
};

/**
 * @brief Synchronous solver of equation blocks
 * @details A solve never retries and never modifies fixed flags. On any status, the unknowns
 *          of the block hold the final iterate of the solver on return.
 */
class ISolverAdapter
{
public:
	virtual ~ISolverAdapter() SEQUIN_NOEXCEPT { }

	/**
	 * @brief Solves the given equation block
	 * @param [in,out] block Equation block
	 * @param [in] options Solver options
	 * @return Result of the solve
	 */
	virtual SolverResult solve(model::EquationBlock& block, IParameterProvider& options) = 0;
};

/**
 * @brief Solves equation blocks with the nonlinear solvers of the library
 * @details The solver is selected by @c SOLVER_NAME (default: error oriented and then residual
 *          oriented adaptive trust region Newton method). The termination tolerance is given by
 *          @c TOLERANCE (default @c 1e-6). All other options are passed on to the nonlinear solver.
 */
class NonlinearSolverAdapter : public ISolverAdapter
{
public:
	NonlinearSolverAdapter();
	virtual ~NonlinearSolverAdapter() SEQUIN_NOEXCEPT;

	virtual SolverResult solve(model::EquationBlock& block, IParameterProvider& options);
};

} // namespace sequin

#endif  // LIBSEQUIN_SOLVERADAPTER_HPP_
