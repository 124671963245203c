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

#include "nonlin/AdaptiveTrustRegionNewton.hpp"
#include "sequin/ParameterProvider.hpp"
#include "sequin/Exceptions.hpp"
#include "linalg/DenseMatrix.hpp"
#include "Logging.hpp"

namespace sequin
{

namespace nonlin
{

namespace
{
	struct DebugLogIterateOutputPolicy
	{
		inline static void outerIteration(unsigned int idxIter, double norm, double damping, unsigned int size)
		{
			LOG(Trace) << "iter " << idxIter << " norm " << norm << " damping " << damping << " size " << size;
		}

		inline static void innerIteration(unsigned int idxIter, double norm, double damping, double mu, unsigned int size)
		{
			LOG(Trace) << "  iter " << idxIter << " trial norm " << norm << " damping " << damping << " mu " << mu;
		}
	};

	void readDampingParameters(IParameterProvider& paramProvider, double& initDamping, double& minDamping, unsigned int& maxIter)
	{
		if (paramProvider.exists("INIT_DAMPING"))
			initDamping = paramProvider.getDouble("INIT_DAMPING");
		if (paramProvider.exists("MIN_DAMPING"))
			minDamping = paramProvider.getDouble("MIN_DAMPING");
		if (paramProvider.exists("MAX_ITERATIONS"))
		{
			const int mi = paramProvider.getInt("MAX_ITERATIONS");
			if (mi <= 0)
				throw InvalidParameterException("MAX_ITERATIONS has to be positive");
			maxIter = static_cast<unsigned int>(mi);
		}

		if ((initDamping <= 0.0) || (initDamping > 1.0))
			throw InvalidParameterException("INIT_DAMPING has to be in (0, 1]");
		if ((minDamping <= 0.0) || (minDamping > initDamping))
			throw InvalidParameterException("MIN_DAMPING has to be in (0, INIT_DAMPING]");
	}

	std::function<bool(double const* const, double* const)> makeJacobianSolver(const std::function<bool(double const* const, linalg::detail::DenseMatrixBase& jac)>& jacobian,
		linalg::detail::DenseMatrixBase& jacMatrix, double* const scaleFactors)
	{
		return [&jacobian, &jacMatrix, scaleFactors](double const* const x, double* const y) -> bool {
			if (!jacobian(x, jacMatrix))
				return false;

			jacMatrix.rowScaleFactors(scaleFactors);
			jacMatrix.scaleRows(scaleFactors);

			return jacMatrix.factorize() && jacMatrix.solve(scaleFactors, y);
		};
	}
}

AdaptiveTrustRegionNewtonSolver::AdaptiveTrustRegionNewtonSolver() : _initDamping(1e-2), _minDamping(1e-4), _maxIter(50) { }
AdaptiveTrustRegionNewtonSolver::~AdaptiveTrustRegionNewtonSolver() { }

bool AdaptiveTrustRegionNewtonSolver::configure(IParameterProvider& paramProvider)
{
	readDampingParameters(paramProvider, _initDamping, _minDamping, _maxIter);
	return true;
}

bool AdaptiveTrustRegionNewtonSolver::solve(std::function<bool(double const* const, double* const)> residual, std::function<bool(double const* const, linalg::detail::DenseMatrixBase& jac)> jacobian,
		double tol, double* const point, double* const workingMemory, linalg::detail::DenseMatrixBase& jacMatrix, unsigned int size) const
{
	double* const scaleFactors = workingMemory + 4 * size;
	return adaptiveTrustRegionNewtonMethod<DebugLogIterateOutputPolicy>(residual, makeJacobianSolver(jacobian, jacMatrix, scaleFactors),
		_maxIter, tol, _initDamping, _minDamping, point, workingMemory, size);
}


RobustAdaptiveTrustRegionNewtonSolver::RobustAdaptiveTrustRegionNewtonSolver() : _initDamping(1e-2), _minDamping(1e-4), _maxIter(50) { }
RobustAdaptiveTrustRegionNewtonSolver::~RobustAdaptiveTrustRegionNewtonSolver() { }

bool RobustAdaptiveTrustRegionNewtonSolver::configure(IParameterProvider& paramProvider)
{
	readDampingParameters(paramProvider, _initDamping, _minDamping, _maxIter);
	return true;
}

bool RobustAdaptiveTrustRegionNewtonSolver::solve(std::function<bool(double const* const, double* const)> residual, std::function<bool(double const* const, linalg::detail::DenseMatrixBase& jac)> jacobian,
		double tol, double* const point, double* const workingMemory, linalg::detail::DenseMatrixBase& jacMatrix, unsigned int size) const
{
	double* const scaleFactors = workingMemory + 4 * size;
	return robustAdaptiveTrustRegionNewtonMethod<DebugLogIterateOutputPolicy>(residual, makeJacobianSolver(jacobian, jacMatrix, scaleFactors),
		[&](double* const y) -> bool {
			return jacMatrix.solve(scaleFactors, y);
		},
		_maxIter, tol, _initDamping, _minDamping, point, workingMemory, size);
}

} // namespace nonlin

} // namespace sequin
