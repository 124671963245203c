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

#include "SolverAdapter.hpp"
#include "sequin/ParameterProvider.hpp"
#include "sequin/Exceptions.hpp"
#include "model/EquationBlock.hpp"
#include "model/Block.hpp"
#include "nonlin/Solver.hpp"
#include "linalg/DenseMatrix.hpp"

#include "Logging.hpp"
#include "LoggingUtils.hpp"

#include <vector>
#include <memory>
#include <cmath>

namespace sequin
{

const char* to_string(SolverStatus status) SEQUIN_NOEXCEPT
{
	switch (status)
	{
		case SolverStatus::Optimal:
			return "optimal";
		case SolverStatus::Infeasible:
			return "infeasible";
		case SolverStatus::Other:
			return "other";
	}
	return "unknown";
}

NonlinearSolverAdapter::NonlinearSolverAdapter() { }
NonlinearSolverAdapter::~NonlinearSolverAdapter() SEQUIN_NOEXCEPT { }

SolverResult NonlinearSolverAdapter::solve(model::EquationBlock& block, IParameterProvider& options)
{
	const unsigned int n = block.numUnknowns();

	SolverResult result;
	result.numUnknowns = n;

	if (!block.isSquare())
	{
		LOG(Warning) << "Equation system of " << block.root().path() << " is not square: " << n << " unknowns, " << block.numEquations() << " equations";
		result.status = SolverStatus::Other;
		result.residualNorm = block.residualNorm();
		return result;
	}

	const double tol = options.exists("TOLERANCE") ? options.getDouble("TOLERANCE") : 1e-6;
	if (!(tol > 0.0))
		throw InvalidParameterException("TOLERANCE has to be positive");

	if (n == 0)
	{
		result.residualNorm = 0.0;
		result.status = SolverStatus::Optimal;
		return result;
	}

	const std::string solverName = options.exists("SOLVER_NAME") ? options.getString("SOLVER_NAME") : std::string();
	std::unique_ptr<nonlin::Solver> solver(nonlin::createSolver(solverName));
	if (!solver)
		throw SolverException("Unknown nonlinear solver " + solverName);

	solver->configure(options);

	std::vector<double> point(n, 0.0);
	std::vector<double> workingMemory(solver->workspaceSize(n), 0.0);
	linalg::DenseMatrix jacMatrix;
	jacMatrix.resize(n, n);

	block.gather(point.data());

	if (!std::isfinite(block.residualNorm()))
	{
		LOG(Warning) << "Residual of " << block.root().path() << " is not finite at the initial point";
		result.status = SolverStatus::Other;
		result.residualNorm = block.residualNorm();
		return result;
	}

	LOG(Debug) << "Solving " << block.root().path() << " with " << n << " unknowns using " << solver->name();
	LOG(Trace) << "Initial point " << log::VectorPtr<double>(point.data(), n);

	const bool success = solver->solve(
		[&block](double const* const x, double* const res) -> bool { return block.residual(x, res); },
		[&block](double const* const x, linalg::detail::DenseMatrixBase& jac) -> bool { return block.jacobian(x, jac); },
		tol, point.data(), workingMemory.data(), jacMatrix, n);

	// Leave the final iterate in the variables
	block.scatter(point.data());
	LOG(Trace) << "Final point " << log::VectorPtr<double>(point.data(), n);
	result.residualNorm = block.residualNorm();

	if (success)
		result.status = SolverStatus::Optimal;
	else if (std::isfinite(result.residualNorm))
		result.status = SolverStatus::Infeasible;
	else
		result.status = SolverStatus::Other;

	LOG(Debug) << "Solve of " << block.root().path() << " terminated with status " << to_string(result.status) << ", residual " << result.residualNorm;
	return result;
}

} // namespace sequin
