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

#include "nonlin/Solver.hpp"
#include "nonlin/AdaptiveTrustRegionNewton.hpp"
#include "nonlin/CompositeSolver.hpp"

namespace sequin
{

namespace nonlin
{

Solver* createSolver(const std::string& name)
{
	if (name == AdaptiveTrustRegionNewtonSolver::identifier())
		return new AdaptiveTrustRegionNewtonSolver();
	if (name == RobustAdaptiveTrustRegionNewtonSolver::identifier())
		return new RobustAdaptiveTrustRegionNewtonSolver();
	if (name.empty() || (name == CompositeSolver::identifier()))
		return new CompositeSolver();

	return nullptr;
}

} // namespace nonlin

} // namespace sequin
