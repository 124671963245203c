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

#include "nonlin/CompositeSolver.hpp"
#include "nonlin/AdaptiveTrustRegionNewton.hpp"
#include "sequin/ParameterProvider.hpp"
#include "sequin/Exceptions.hpp"
#include "Logging.hpp"

#include <string>
#include <algorithm>

namespace sequin
{

namespace nonlin
{

CompositeSolver::CompositeSolver()
{
	_solvers.push_back(new RobustAdaptiveTrustRegionNewtonSolver());
	_solvers.push_back(new AdaptiveTrustRegionNewtonSolver());
}

CompositeSolver::~CompositeSolver()
{
	clearSubsolvers();
}

void CompositeSolver::clearSubsolvers()
{
	for (std::vector<Solver*>::iterator it = _solvers.begin(); it != _solvers.end(); ++it)
		delete (*it);
	_solvers.clear();
}

bool CompositeSolver::configure(IParameterProvider& paramProvider)
{
	if (paramProvider.exists("SUBSOLVERS"))
	{
		const std::vector<std::string> subSolvers = paramProvider.getStringArray("SUBSOLVERS");
		std::vector<Solver*> created;
		created.reserve(subSolvers.size());
		for (std::vector<std::string>::const_iterator it = subSolvers.begin(); it != subSolvers.end(); ++it)
		{
			Solver* const s = (it->empty() || (*it == identifier())) ? nullptr : createSolver(*it);
			if (!s)
			{
				for (std::vector<Solver*>::iterator itC = created.begin(); itC != created.end(); ++itC)
					delete (*itC);
				throw SolverException("Unknown subsolver " + *it + " in composite solver");
			}
			created.push_back(s);
		}

		// An empty list keeps the current subsolvers
		if (!created.empty())
		{
			clearSubsolvers();
			_solvers = created;
		}
	}

	// Options are shared by all subsolvers
	bool success = true;
	for (std::vector<Solver*>::iterator it = _solvers.begin(); it != _solvers.end(); ++it)
	{
		success = (*it)->configure(paramProvider) && success;
	}

	return success;
}

bool CompositeSolver::solve(std::function<bool(double const* const, double* const)> residual, std::function<bool(double const* const, linalg::detail::DenseMatrixBase& jac)> jacobian,
		double tol, double* const point, double* const workingMemory, linalg::detail::DenseMatrixBase& jacMatrix, unsigned int size) const
{
	for (std::vector<Solver*>::const_iterator it = _solvers.begin(); it != _solvers.end(); ++it)
	{
		if ((*it)->solve(residual, jacobian, tol, point, workingMemory, jacMatrix, size))
			return true;

		LOG(Debug) << "Subsolver " << (*it)->name() << " failed";
	}

	return false;
}

unsigned int CompositeSolver::workspaceSize(unsigned int problemSize) const
{
	unsigned int ws = 0;
	for (std::vector<Solver*>::const_iterator it = _solvers.begin(); it != _solvers.end(); ++it)
		ws = std::max(ws, (*it)->workspaceSize(problemSize));
	return ws;
}

} // namespace nonlin

} // namespace sequin
