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

#ifndef LIBSEQUIN_COMPOSITESOLVER_HPP_
#define LIBSEQUIN_COMPOSITESOLVER_HPP_

#include "nonlin/Solver.hpp"
#include <vector>

namespace sequin
{

namespace nonlin
{

	/**
	 * @brief Tries its subsolvers in order until one meets the tolerance
	 * @details The subsolvers default to @c ATRN_ERR followed by @c ATRN_RES. The option
	 *          @c SUBSOLVERS replaces them by a list of solver identifiers. Each subsolver
	 *          continues from the last accepted iterate of its predecessor.
	 */
	class CompositeSolver : public Solver
	{
	public:
		CompositeSolver();
		virtual ~CompositeSolver();

		static const char* identifier() { return "COMPOSITE"; }
		virtual const char* name() const { return CompositeSolver::identifier(); }

		virtual bool configure(IParameterProvider& paramProvider);
		virtual unsigned int workspaceSize(unsigned int problemSize) const;

		virtual bool solve(std::function<bool(double const* const, double* const)> residual, std::function<bool(double const* const, linalg::detail::DenseMatrixBase& jac)> jacobian,
			double tol, double* const point, double* const workingMemory, linalg::detail::DenseMatrixBase& jacMatrix, unsigned int size) const;

	private:
		void clearSubsolvers();

		std::vector<Solver*> _solvers; //!< Owned subsolvers
	};

} // namespace nonlin

} // namespace sequin

#endif  // LIBSEQUIN_COMPOSITESOLVER_HPP_
