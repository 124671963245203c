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
 * Provides adaptive trust-region Newton methods for solving nonlinear equation systems
 */

#ifndef LIBSEQUIN_ADAPTRUSTNEWTON_HPP_
#define LIBSEQUIN_ADAPTRUSTNEWTON_HPP_

#include "common/CompilerSpecific.hpp"
#include "nonlin/Solver.hpp"

#include <cmath>
#include <functional>
#include <algorithm>

#include "linalg/Norms.hpp"

namespace sequin
{

namespace nonlin
{

	/**
	 * @brief Iterate output policy that does nothing
	 */
	struct VoidNewtonIterateOutputPolicy
	{
		inline static void outerIteration(unsigned int idxIter, double norm, double damping, unsigned int size) { }
		inline static void innerIteration(unsigned int idxIter, double norm, double damping, double mu, unsigned int size) { }
	};

	namespace detail
	{
		inline double predictDamping(double numerator, double sumSquares)
		{
			if (sumSquares <= 0.0)
				return 1.0;
			return numerator / std::sqrt(sumSquares);
		}
	}

	/**
	 * @brief Solves nonlinear equations using a residual oriented descent based global adaptive trust-region Newton method
	 * @details This is an implementation of the NLEQ-RES algorithm described in \cite Deuflhard2011 (p. 131).
	 *          It is a global adaptive trust-region Newton method based on affine contravariance.
	 *          The solution of the inner trust region problems is a point on the ordinary Newton step
	 *          line segment, i.e., the algorithm is an adaptively damped Newton method.
	 *          
	 *          A solution is indicated by the error test
	 *          @f[\begin{align} \left\lVert f(x) \right\rVert_{\ell^2} \leq \text{tol}. \end{align}@f]
	 *          
	 *          The initial damping factor @p damping and the minimal damping factor @p minDamping
	 *          can be chosen based on reference values for different problem difficulties:
	 *          | Difficulty          | damping | minDamping |
	 *          | ------------------- | ------- | ---------- |
	 *          | Mildly nonlinear    | 1.0     | 1e-4       |
	 *          | Highly nonlinear    | 1e-2    | 1e-4       |
	 *          | Extremely nonlinear | 1e-4    | 1e-8       |
	 *          
	 *          Since this method is based on residual monotonicity, it can stall on ill-conditioned
	 *          Jacobians (see pp. 137 in the Deuflhard book).
	 * @param [in] residual Function providing the residual @f$ f(x) @f$ at position @f$ x @f$
	 * @param [in] jacobianSolver Function computing the solution of @f$ J_f(x) \Delta x = r@f$ in-place
	 * @param [in] maxIter Maximum number of iterations
	 * @param [in] resTol Termination criterion on the residual @f$\ell^2@f$-norm
	 * @param [in] damping Initial damping factor (see details for advice)
	 * @param [in] minDamping Minimal damping factor (see details for advice)
	 * @param [in,out] point On entry initial guess, on exit solution or last accepted iterate
	 * @param [in] workingMemory Additional memory of size @f$ 4n @f$, where @f$ n @f$ is the problem @p size
	 * @param [in] size Size of the problem
	 * @tparam IterateOutputPolicy Policy that handles output of intermediate values, see VoidNewtonIterateOutputPolicy
	 * @return @c true if a solution meeting the residual tolerance was found, @c false otherwise
	 */
	template <typename IterateOutputPolicy = VoidNewtonIterateOutputPolicy>
	bool adaptiveTrustRegionNewtonMethod(std::function<bool(double const* const, double* const)> residual, std::function<bool(double const* const, double* const)> jacobianSolver,
		unsigned int maxIter, double resTol, double damping, double minDamping, double* const point, double* const workingMemory, unsigned int size)
	{
		double mu = 0.0;
		double lastResidualNorm = 0.0;

		// Split working memory into parts
		double* const residualMem = workingMemory;
		double* const dx = workingMemory + size;
		double* const trialPoint = workingMemory + 2 * size;
		double* const lastResidual = workingMemory + 3 * size;

		if (!residual(point, lastResidual))
			return false;

		std::copy(lastResidual, lastResidual + size, dx);

		double residualNorm = linalg::l2Norm(lastResidual, size);

		IterateOutputPolicy::outerIteration(0, residualNorm, damping, size);

		for (unsigned int kIter = 0; kIter < maxIter; ++kIter)
		{
			if (residualNorm <= resTol)
				return true;

			// Solve F'(x) * dx = F(x)
			// The minus sign is omitted here and taken care of when updating the iterate
			if (!jacobianSolver(point, dx))
				return false;

			if (kIter > 0)
			{
				// Compute prediction of damping factor
				mu *= lastResidualNorm / residualNorm;
				damping = std::min(1.0, mu);
			}

			lastResidualNorm = residualNorm;
			bool reduced = false;

			// Line search loop: Use regularity test as abort condition
			while (damping >= minDamping)
			{
				for (unsigned int i = 0; i < size; ++i)
					trialPoint[i] = point[i] - damping * dx[i];

				if (!residual(trialPoint, residualMem))
					return false;

				residualNorm = linalg::l2Norm(residualMem, size);

				const double theta = residualNorm / lastResidualNorm;

				double sumSq = 0.0;
				const double factor = 1.0 - damping;
				for (unsigned int i = 0; i < size; ++i)
					sumSq += linalg::sqr(residualMem[i] - factor * lastResidual[i]);

				mu = detail::predictDamping(0.5 * lastResidualNorm * damping * damping, sumSq);

				IterateOutputPolicy::innerIteration(kIter + 1, residualNorm, damping, mu, size);

				if (theta >= 1.0)
				{
					// Shrink damping and try again
					damping = std::min(mu, 0.5 * damping);
					reduced = true;
					continue;
				}

				const double dampingNew = std::min(1.0, mu);
				if (!reduced && (dampingNew >= 4.0 * damping))
				{
					damping = dampingNew;
					continue;
				}

				// Accept the step
				break;
			}

			// Regularity test failed
			if (damping < minDamping)
				return false;

			IterateOutputPolicy::outerIteration(kIter + 1, residualNorm, damping, size);

			std::copy(trialPoint, trialPoint + size, point);
			std::copy(residualMem, residualMem + size, lastResidual);
			std::copy(residualMem, residualMem + size, dx);
		}

		return residualNorm <= resTol;
	}

	/**
	 * @brief Uses an adaptive trust-region Newton method for solving nonlinear equations
	 * @details Wraps adaptiveTrustRegionNewtonMethod() function.
	 */
	class AdaptiveTrustRegionNewtonSolver : public Solver
	{
	public:
		AdaptiveTrustRegionNewtonSolver();
		virtual ~AdaptiveTrustRegionNewtonSolver();

		static const char* identifier() { return "ATRN_RES"; }
		virtual const char* name() const { return AdaptiveTrustRegionNewtonSolver::identifier(); }
		virtual bool configure(IParameterProvider& paramProvider);

		virtual unsigned int workspaceSize(unsigned int problemSize) const
		{
			// Method requires 4 * problemSize plus problemSize row scaling factors
			return 5 * problemSize;
		}

		virtual bool solve(std::function<bool(double const* const, double* const)> residual, std::function<bool(double const* const, linalg::detail::DenseMatrixBase& jac)> jacobian,
			double tol, double* const point, double* const workingMemory, linalg::detail::DenseMatrixBase& jacMatrix, unsigned int size) const;
	
	protected:
		double _initDamping; //!< Initial damping factor
		double _minDamping; //!< Minimal damping factor
		unsigned int _maxIter; //!< Maximum number of iterations
	};

	/**
	 * @brief Solves nonlinear equations using an error oriented descent based global adaptive trust-region Newton method
	 * @details This is an implementation of the NLEQ-ERR algorithm described in \cite Deuflhard2011 (pp. 148).
	 *          It is a global adaptive trust-region Newton method based on affine covariance.
	 *          
	 *          A solution is indicated by the error test
	 *          @f[\begin{align} \left\lVert \Delta x \right\rVert_{\ell^2} \leq \text{tol}. \end{align}@f]
	 *          
	 *          The linear system is solved several times with varying right hand sides. A repeated
	 *          solution is requested by @p jacobianResolver, which is always preceeded by a call to
	 *          @p jacobianSolver. Thus, a dense matrix is factorized once in @p jacobianSolver and
	 *          reused in subsequent calls of @p jacobianResolver.
	 *          
	 *          A damping increase is only attempted if the damping has not been reduced in the
	 *          current step, which prevents the inner loop from alternating between two factors.
	 * @param [in] residual Function providing the residual @f$ f(x) @f$ at position @f$ x @f$
	 * @param [in] jacobianSolver Function computing the solution of @f$ J_f(x) \Delta x = r@f$ in-place
	 * @param [in] jacobianResolver Function solving @f$ J_f(x) \Delta x = r@f$ with the factorization of the last @p jacobianSolver call
	 * @param [in] maxIter Maximum number of iterations
	 * @param [in] errTol Termination criterion on the Newton step size @f$\ell^2@f$-norm
	 * @param [in] damping Initial damping factor
	 * @param [in] minDamping Minimal damping factor
	 * @param [in,out] point On entry initial guess, on exit solution or last accepted iterate
	 * @param [in] workingMemory Additional memory of size @f$ 4n @f$, where @f$ n @f$ is the problem @p size
	 * @param [in] size Size of the problem
	 * @tparam IterateOutputPolicy Policy that handles output of intermediate values, see VoidNewtonIterateOutputPolicy
	 * @return @c true if a solution meeting the error tolerance was found, @c false otherwise
	 */
	template <typename IterateOutputPolicy = VoidNewtonIterateOutputPolicy>
	bool robustAdaptiveTrustRegionNewtonMethod(std::function<bool(double const* const, double* const)> residual, std::function<bool(double const* const, double* const)> jacobianSolver,
		std::function<bool(double* const)> jacobianResolver, unsigned int maxIter, double errTol, double damping, double minDamping, double* const point, 
		double* const workingMemory, unsigned int size)
	{
		double mu = 0.0;

		// Split working memory into parts
		double* const dx = workingMemory;
		double* const trialPoint = workingMemory + size;
		double* const lastDxBar = workingMemory + 2 * size;
		double* const lastResidual = workingMemory + 3 * size;

		if (!residual(point, dx))
			return false;

		double errNorm = 0.0;
		double lastErrNorm = 0.0;
		double errNormTrial = 0.0;

		for (unsigned int kIter = 0; kIter < maxIter; ++kIter)
		{
			// Solve F'(x) * dx = F(x)
			// The minus sign is omitted here and taken care of when updating the iterate
			if (!jacobianSolver(point, dx))
				return false;

			lastErrNorm = errNorm;
			errNorm = linalg::l2Norm(dx, size);

			IterateOutputPolicy::outerIteration(kIter, errNorm, damping, size);

			if (errNorm <= errTol)
			{
				for (unsigned int i = 0; i < size; ++i)
					point[i] -= dx[i];
				return true;
			}

			if (kIter > 0)
			{
				// Compute prediction of damping factor
				double sumSq = 0.0;
				for (unsigned int i = 0; i < size; ++i)
					sumSq += linalg::sqr(lastDxBar[i] - dx[i]);

				mu = detail::predictDamping(lastErrNorm * errNormTrial * damping / errNorm, sumSq);
				damping = std::min(1.0, mu);
			}

			bool reduced = false;
			bool converged = false;

			// Line search loop: Use regularity test as abort condition
			while (damping >= minDamping)
			{
				for (unsigned int i = 0; i < size; ++i)
					trialPoint[i] = point[i] - damping * dx[i];

				// Evaluate residual and compute simplified Newton correction
				if (!residual(trialPoint, lastResidual))
					return false;

				std::copy(lastResidual, lastResidual + size, lastDxBar);

				if (!jacobianResolver(lastDxBar))
					return false;

				errNormTrial = linalg::l2Norm(lastDxBar, size);
				const double theta = errNormTrial / errNorm;

				double sumSq = 0.0;
				const double factor = 1.0 - damping;
				for (unsigned int i = 0; i < size; ++i)
					sumSq += linalg::sqr(lastDxBar[i] - factor * dx[i]);

				mu = detail::predictDamping(0.5 * errNorm * damping * damping, sumSq);

				IterateOutputPolicy::innerIteration(kIter + 1, errNormTrial, damping, mu, size);

				if (theta >= 1.0)
				{
					// Shrink damping and try again
					damping = std::min(mu, 0.5 * damping);
					reduced = true;
					continue;
				}

				const double dampingNew = std::min(1.0, mu);

				if ((damping == 1.0) && (dampingNew == 1.0) && (errNormTrial <= errTol))
				{
					// Full step with small simplified correction: x* = x_trial - dxBar
					for (unsigned int i = 0; i < size; ++i)
						point[i] = trialPoint[i] - lastDxBar[i];
					converged = true;
					break;
				}

				if (!reduced && (dampingNew >= 4.0 * damping))
				{
					damping = dampingNew;
					continue;
				}

				// Accept the step
				break;
			}

			if (converged)
				return true;

			// Regularity test failed
			if (damping < minDamping)
				return false;

			std::copy(trialPoint, trialPoint + size, point);
			std::copy(lastResidual, lastResidual + size, dx);
		}

		return false;
	}

	/**
	 * @brief Uses a more robust adaptive trust-region Newton method for solving nonlinear equations
	 * @details Wraps robustAdaptiveTrustRegionNewtonMethod() function.
	 */
	class RobustAdaptiveTrustRegionNewtonSolver : public Solver
	{
	public:
		RobustAdaptiveTrustRegionNewtonSolver();
		virtual ~RobustAdaptiveTrustRegionNewtonSolver();

		static const char* identifier() { return "ATRN_ERR"; }
		virtual const char* name() const { return RobustAdaptiveTrustRegionNewtonSolver::identifier(); }
		virtual bool configure(IParameterProvider& paramProvider);

		virtual unsigned int workspaceSize(unsigned int problemSize) const
		{
			// Method requires 4 * problemSize plus problemSize row scaling factors
			return 5 * problemSize;
		}

		virtual bool solve(std::function<bool(double const* const, double* const)> residual, std::function<bool(double const* const, linalg::detail::DenseMatrixBase& jac)> jacobian,
			double tol, double* const point, double* const workingMemory, linalg::detail::DenseMatrixBase& jacMatrix, unsigned int size) const;
	
	protected:
		double _initDamping; //!< Initial damping factor
		double _minDamping; //!< Minimum damping factor
		unsigned int _maxIter; //!< Maximum number of iterations
	};

} // namespace nonlin

} // namespace sequin

#endif  // LIBSEQUIN_ADAPTRUSTNEWTON_HPP_
