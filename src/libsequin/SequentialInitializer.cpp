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

#include "SequentialInitializer.hpp"
#include "model/UnitModel.hpp"
#include "model/CompositeUnit.hpp"
#include "model/EquationBlock.hpp"
#include "model/Snapshot.hpp"
#include "model/Variable.hpp"
#include "sequin/Exceptions.hpp"
#include "Logging.hpp"

#include <sstream>

namespace sequin
{

const char* to_string(InitializationStage stage) SEQUIN_NOEXCEPT
{
	switch (stage)
	{
		case InitializationStage::Unsolved:
			return "unsolved";
		case InitializationStage::ConstraintsRelaxed:
			return "constraints relaxed";
		case InitializationStage::SubUnitsSequenced:
			return "sub-units sequenced";
		case InitializationStage::ConstraintsRestored:
			return "constraints restored";
		case InitializationStage::CoupledSolved:
			return "coupled solved";
		case InitializationStage::SnapshotRestored:
			return "snapshot restored";
	}
	return "unknown";
}

SequentialInitializer::SequentialInitializer(ISolverAdapter& solver, IParameterProvider& options) : _solver(solver), _options(options), _stage(InitializationStage::Unsolved)
{
	_result.result.status = SolverStatus::Other;
	_result.result.numUnknowns = 0;
	_result.result.residualNorm = 0.0;
	_result.stage = _stage;
	_result.numSubSolves = 0;
	_result.numNonOptimalSubSolves = 0;
}

InitializationResult SequentialInitializer::initialize(model::UnitModel& unit)
{
	const model::Snapshot snap = model::Snapshot::capture(unit, model::StoreSpec::valueIsFixedIsActive(true));

	try
	{
		relaxConstraints(unit);
		sequenceSubUnits(unit);
		restoreConstraints();
		checkDegreesOfFreedom(unit);
		solveCoupled(unit);
	}
	catch (...)
	{
		snap.restore(unit);
		throw;
	}

	snap.restore(unit);
	_stage = InitializationStage::SnapshotRestored;
	_result.stage = _stage;
	return _result;
}

void SequentialInitializer::relaxConstraints(model::UnitModel& unit)
{
	const std::vector<model::Constraint*> special = unit.specialConstraints();
	for (std::vector<model::Constraint*>::const_iterator it = special.begin(); it != special.end(); ++it)
	{
		if (!(*it)->isActive())
			continue;

		(*it)->deactivate();
		_relaxed.push_back(*it);
	}

	_stage = InitializationStage::ConstraintsRelaxed;
	_result.stage = _stage;
}

void SequentialInitializer::sequenceSubUnits(model::UnitModel& unit)
{
	model::CompositeUnit* const composite = dynamic_cast<model::CompositeUnit*>(&unit);
	if (composite)
	{
		const std::vector<model::ScheduleStep>& schedule = composite->schedule();
		for (std::vector<model::ScheduleStep>::const_iterator it = schedule.begin(); it != schedule.end(); ++it)
		{
			for (std::vector<std::pair<model::Port*, model::Port*>>::const_iterator s = it->seeds.begin(); s != it->seeds.end(); ++s)
				model::propagate(*s->first, *s->second);

			if (!it->unit)
				continue;

			// Variables determined by special constraints of the sub-unit are left to its own initialization
			std::vector<model::Variable*> determined;
			const std::vector<model::Constraint*> special = it->unit->specialConstraints();
			for (std::vector<model::Constraint*>::const_iterator c = special.begin(); c != special.end(); ++c)
			{
				if ((*c)->determinedVariable())
					determined.push_back((*c)->determinedVariable());
			}

			std::vector<model::Variable*> fixed;
			const std::vector<model::Port*> in = it->unit->inlets();
			for (std::vector<model::Port*>::const_iterator p = in.begin(); p != in.end(); ++p)
				(*p)->fixFree(fixed, determined);

			try
			{
				const InitializationResult sub = it->unit->initialize(_solver, _options);
				_result.numSubSolves += sub.numSubSolves + 1;
				_result.numNonOptimalSubSolves += sub.numNonOptimalSubSolves;
				if (sub.result.status != SolverStatus::Optimal)
					++_result.numNonOptimalSubSolves;
			}
			catch (...)
			{
				for (std::vector<model::Variable*>::iterator v = fixed.begin(); v != fixed.end(); ++v)
					(*v)->unfix();
				throw;
			}

			for (std::vector<model::Variable*>::iterator v = fixed.begin(); v != fixed.end(); ++v)
				(*v)->unfix();
		}
	}
	else
	{
		unit.initialGuess();

		// Inlets stay fixed until the snapshot is restored
		const std::vector<model::Port*> in = unit.inlets();
		for (std::vector<model::Port*>::const_iterator p = in.begin(); p != in.end(); ++p)
			(*p)->fixFree(_heldFixed);

		if (!_relaxed.empty())
		{
			model::EquationBlock eb(unit);
			const SolverResult res = _solver.solve(eb, _options);
			countSubSolve(res);

			if (res.status != SolverStatus::Optimal)
				LOG(Warning) << "Relaxed solve of " << unit.path() << " terminated with status " << to_string(res.status) << ", residual " << res.residualNorm;
		}
	}

	_stage = InitializationStage::SubUnitsSequenced;
	_result.stage = _stage;
}

void SequentialInitializer::restoreConstraints()
{
	for (std::vector<model::Constraint*>::const_iterator it = _relaxed.begin(); it != _relaxed.end(); ++it)
	{
		(*it)->activate();
		(*it)->determinedVariable()->unfix();
	}
	_relaxed.clear();

	_stage = InitializationStage::ConstraintsRestored;
	_result.stage = _stage;
}

void SequentialInitializer::checkDegreesOfFreedom(const model::UnitModel& unit) const
{
	const int dof = unit.degreesOfFreedom();
	if (dof != 0)
	{
		std::ostringstream oss;
		oss << "Unit " << unit.path() << " has " << dof << " degrees of freedom, expected 0";
		throw AssemblyInvariantException(oss.str());
	}
}

void SequentialInitializer::solveCoupled(model::UnitModel& unit)
{
	model::EquationBlock eb(unit);
	_result.result = _solver.solve(eb, _options);

	if (_result.result.status == SolverStatus::Optimal)
	{
		LOG(Info) << "Initialization of " << unit.path() << " complete: " << _result.result.numUnknowns << " unknowns, residual "
			<< _result.result.residualNorm << ", " << _result.numSubSolves << " sub-solves";
	}
	else
	{
		LOG(Warning) << "Initialization of " << unit.path() << " terminated with status " << to_string(_result.result.status)
			<< ", residual " << _result.result.residualNorm << ", " << _result.numNonOptimalSubSolves << " of " << _result.numSubSolves << " sub-solves not optimal";
	}

	_stage = InitializationStage::CoupledSolved;
	_result.stage = _stage;
}

void SequentialInitializer::countSubSolve(const SolverResult& res)
{
	++_result.numSubSolves;
	if (res.status != SolverStatus::Optimal)
		++_result.numNonOptimalSubSolves;
}

} // namespace sequin
