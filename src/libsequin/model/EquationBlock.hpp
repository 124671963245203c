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
 * Provides a numerical view of the active equation system of a block.
 */

#ifndef LIBSEQUIN_EQUATIONBLOCK_HPP_
#define LIBSEQUIN_EQUATIONBLOCK_HPP_

#include "sequin/sequinCompilerInfo.hpp"

#include <vector>

namespace sequin
{

namespace linalg
{
	namespace detail
	{
		class DenseMatrixBase;
	}
}

namespace model
{

class Block;
class Variable;
class Constraint;

/**
 * @brief Square or non-square nonlinear equation system extracted from a block subtree
 * @details The system consists of the active constraints and the unknowns (unfixed variables
 *          referenced by an active constraint) at the time of construction. Unknowns are
 *          exposed in scaled coordinates @f$ z_j = x_j / s_j @f$ with @f$ s_j = \max(|x_j|, 1) @f$
 *          computed from the values at construction (see computeScaling()).
 *          
 *          Evaluating residuals or Jacobians writes the evaluation point into the variables.
 */
class EquationBlock
{
public:
	explicit EquationBlock(Block& root);

	inline Block& root() const SEQUIN_NOEXCEPT { return _root; }

	inline unsigned int numUnknowns() const SEQUIN_NOEXCEPT { return _unknowns.size(); }
	inline unsigned int numEquations() const SEQUIN_NOEXCEPT { return _constraints.size(); }
	inline int degreesOfFreedom() const SEQUIN_NOEXCEPT { return static_cast<int>(_unknowns.size()) - static_cast<int>(_constraints.size()); }
	inline bool isSquare() const SEQUIN_NOEXCEPT { return _unknowns.size() == _constraints.size(); }

	inline const std::vector<Variable*>& unknowns() const SEQUIN_NOEXCEPT { return _unknowns; }
	inline const std::vector<Constraint*>& constraints() const SEQUIN_NOEXCEPT { return _constraints; }

	/**
	 * @brief Recomputes the scaling factors of the unknowns from their current values
	 */
	void computeScaling();

	/**
	 * @brief Writes the current values of the unknowns in scaled coordinates
	 * @details Unknowns without value are gathered as @c 0.
	 * @param [out] x Scaled unknowns
	 */
	void gather(double* const x) const;

	/**
	 * @brief Sets the values of the unknowns from scaled coordinates
	 * @param [in] x Scaled unknowns
	 */
	void scatter(double const* const x);

	/**
	 * @brief Evaluates the residuals of all active constraints at the given point
	 * @param [in] x Scaled unknowns
	 * @param [out] res Residuals
	 * @return @c true if all residuals are finite, otherwise @c false
	 */
	bool residual(double const* const x, double* const res);

	/**
	 * @brief Evaluates the residuals at the current variable values
	 * @param [out] res Residuals
	 * @return @c true if all residuals are finite, otherwise @c false
	 */
	bool residual(double* const res) const;

	/**
	 * @brief Computes the Jacobian with respect to the scaled unknowns by forward differences
	 * @details On exit, the variables are set to @p x.
	 * @param [in] x Scaled unknowns
	 * @param [out] jac Jacobian matrix of size numEquations() x numUnknowns()
	 * @return @c true if all entries are finite, otherwise @c false
	 */
	bool jacobian(double const* const x, linalg::detail::DenseMatrixBase& jac);

	/**
	 * @brief Returns the @f$ \ell^\infty @f$-norm of the residual at the current variable values
	 * @return Residual norm, which is not finite if a residual could not be evaluated
	 */
	double residualNorm() const;

protected:
	Block& _root;
	std::vector<Constraint*> _constraints;
	std::vector<Variable*> _unknowns;
	std::vector<double> _scaling;
	std::vector<double> _work;
};

} // namespace model

} // namespace sequin

#endif  // LIBSEQUIN_EQUATIONBLOCK_HPP_
