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
 * Defines the sequential-modular initialization of unit models.
 */

#ifndef LIBSEQUIN_SEQUENTIALINITIALIZER_HPP_
#define LIBSEQUIN_SEQUENTIALINITIALIZER_HPP_

#include "SolverAdapter.hpp"

#include <vector>

namespace sequin
{

class IParameterProvider;

namespace model
{
	class UnitModel;
	class Variable;
	class Constraint;
}

/**
 * @brief Stages of the initialization
 * @details Stages are passed in this order and never re-entered.
 */
enum class InitializationStage : int
{
	Unsolved,
	ConstraintsRelaxed,
	SubUnitsSequenced,
	ConstraintsRestored,
	CoupledSolved,
	SnapshotRestored
};

const char* to_string(InitializationStage stage) SEQUIN_NOEXCEPT;

/**
 * @brief Result of an initialization
 */
struct InitializationResult
{
	SolverResult result; //!< Result of the final coupled solve
	InitializationStage stage; //!< Last stage reached
	unsigned int numSubSolves; //!< Number of solves before the coupled solve (recursively)
	unsigned int numNonOptimalSubSolves; //!< Number of those solves that did not terminate optimally
};

/**
 * @brief Initializes a unit model sequentially
 * @details The initializer brackets all work in a snapshot of the fixed flags, the values of
 *          fixed variables, and the active flags of all constraints of the unit. The snapshot
 *          is restored when the initialization ends, also if it ends with an exception.
 *          
 *          Algorithm:
 *          <ol>
 *              <li>Capture a snapshot</li>
 *              <li>Deactivate the special constraints of the unit</li>
 *              <li>Composite units: Run the schedule. For each step, propagate the seed ports,
 *                  fix the free inlet variables of the step unit, initialize the step unit
 *                  recursively, and unfix what has been fixed.
 *                  Leaf units: Compute the initial guess, fix the free inlet variables, and
 *                  solve the relaxed system if special constraints have been deactivated.</li>
 *              <li>Reactivate the special constraints and unfix the variables they determine</li>
 *              <li>Check that the unit has zero degrees of freedom</li>
 *              <li>Solve the coupled system of the unit</li>
 *              <li>Restore the snapshot</li>
 *          </ol>
 *          
 *          Non-optimal solves are reported and counted, but do not abort the initialization.
 *          Structural errors throw an AssemblyInvariantException.
 */
class SequentialInitializer
{
public:

	SequentialInitializer(ISolverAdapter& solver, IParameterProvider& options);

	/**
	 * @brief Initializes the given unit
	 * @param [in,out] unit Unit model
	 * @return Result of the initialization
	 */
	InitializationResult initialize(model::UnitModel& unit);

	inline InitializationStage stage() const SEQUIN_NOEXCEPT { return _stage; }

protected:

	void relaxConstraints(model::UnitModel& unit);
	void sequenceSubUnits(model::UnitModel& unit);
	void restoreConstraints();
	void checkDegreesOfFreedom(const model::UnitModel& unit) const;
	void solveCoupled(model::UnitModel& unit);

	void countSubSolve(const SolverResult& res);

	ISolverAdapter& _solver;
	IParameterProvider& _options;
	InitializationStage _stage;
	InitializationResult _result;
	std::vector<model::Constraint*> _relaxed; //!< Special constraints deactivated in this initialization
	std::vector<model::Variable*> _heldFixed; //!< Inlet variables of a leaf unit fixed until the snapshot is restored
};

} // namespace sequin

#endif  // LIBSEQUIN_SEQUENTIALINITIALIZER_HPP_
