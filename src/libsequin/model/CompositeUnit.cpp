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

#include "model/CompositeUnit.hpp"
#include "graph/GraphAlgos.hpp"
#include "sequin/Exceptions.hpp"
#include "Logging.hpp"

#include <algorithm>
#include <unordered_map>

namespace
{
	std::string refName(const sequin::model::PortRef& ref)
	{
		if (ref.unit.empty())
			return ref.port;
		return ref.unit + "." + ref.port;
	}
}

namespace sequin
{

namespace model
{

CompositeUnit::CompositeUnit(const std::string& name, Block* parent) : UnitModel(name, parent) { }

CompositeUnit::~CompositeUnit() SEQUIN_NOEXCEPT
{
	for (std::vector<Arc*>::iterator it = _arcs.begin(); it != _arcs.end(); ++it)
		delete *it;
}

UnitModel* CompositeUnit::section(const std::string& name) const
{
	for (std::vector<UnitModel*>::const_iterator it = _sections.begin(); it != _sections.end(); ++it)
	{
		if ((*it)->name() == name)
			return *it;
	}
	return nullptr;
}

Arc* CompositeUnit::arc(const std::string& name) const
{
	for (std::vector<Arc*>::const_iterator it = _arcs.begin(); it != _arcs.end(); ++it)
	{
		if ((*it)->name() == name)
			return *it;
	}
	return nullptr;
}

UnitModel* CompositeUnit::addSection(UnitModel* unit, const config::Configuration& cfg, const IConfigHelper& helper)
{
	// Block deletes the section from here on, also if building fails
	adoptChild(unit);
	_sections.push_back(unit);

	unit->build(resolvePropertyPackage(cfg, _config, helper), helper);
	return unit;
}

Port* CompositeUnit::resolvePort(const PortRef& ref, const AssemblyRecipe& recipe) const
{
	if (ref.unit.empty())
	{
		Port* const p = port(ref.port);
		if (!p)
			throw AssemblyInvariantException("Unit " + path() + " has no port " + ref.port);
		return p;
	}

	if (std::find(recipe.sections.begin(), recipe.sections.end(), ref.unit) == recipe.sections.end())
		throw AssemblyInvariantException("Port " + refName(ref) + " refers to section " + ref.unit + " which is not present in " + path());

	UnitModel const* const sec = section(ref.unit);
	if (!sec)
		throw AssemblyInvariantException("Section " + ref.unit + " has not been built in " + path());

	Port* const p = sec->port(ref.port);
	if (!p)
		throw AssemblyInvariantException("Section " + sec->path() + " has no port " + ref.port);
	return p;
}

void CompositeUnit::assemble(const AssemblyRecipe& recipe)
{
	for (std::vector<std::string>::const_iterator it = recipe.sections.begin(); it != recipe.sections.end(); ++it)
	{
		if (!section(*it))
			throw AssemblyInvariantException("Section " + *it + " has not been built in " + path());
	}

	if (_sections.size() != recipe.sections.size())
		throw AssemblyInvariantException("Unit " + path() + " contains sections that are not part of its assembly recipe");

	std::unordered_map<Port const*, std::string> wired;
	for (std::vector<ArcSpec>::const_iterator it = recipe.arcs.begin(); it != recipe.arcs.end(); ++it)
	{
		Port* const src = resolvePort(it->source, recipe);
		Port* const dst = resolvePort(it->destination, recipe);

		// Sources are outlets of sections or inlets of the composite, destinations vice versa
		if (src->isInlet() != it->source.unit.empty())
			throw AssemblyInvariantException("Arc " + it->name + " cannot start at port " + src->path());
		if (dst->isInlet() == it->destination.unit.empty())
			throw AssemblyInvariantException("Arc " + it->name + " cannot end at port " + dst->path());

		const std::unordered_map<Port const*, std::string>::const_iterator prev = wired.find(dst);
		if (prev != wired.end())
			throw AssemblyInvariantException("Port " + dst->path() + " is the destination of arcs " + prev->second + " and " + it->name);

		wired[dst] = it->name;
		_arcs.push_back(new Arc(it->name, *src, *dst));
	}

	for (std::vector<UnitModel*>::const_iterator it = _sections.begin(); it != _sections.end(); ++it)
	{
		const std::vector<Port*> in = (*it)->inlets();
		for (std::vector<Port*>::const_iterator p = in.begin(); p != in.end(); ++p)
		{
			if (wired.find(*p) == wired.end())
				throw AssemblyInvariantException("Inlet " + (*p)->path() + " is not connected");
		}
	}

	for (std::vector<Port*>::const_iterator p = _ports.begin(); p != _ports.end(); ++p)
	{
		if (!(*p)->isInlet() && (wired.find(*p) == wired.end()))
			throw AssemblyInvariantException("Outlet " + (*p)->path() + " is not connected");
	}

	checkScheduleOrder(recipe);

	for (std::vector<StepSpec>::const_iterator it = recipe.schedule.begin(); it != recipe.schedule.end(); ++it)
	{
		ScheduleStep step;
		step.unit = nullptr;
		if (!it->unit.empty())
		{
			if (std::find(recipe.sections.begin(), recipe.sections.end(), it->unit) == recipe.sections.end())
				throw AssemblyInvariantException("Schedule of " + path() + " refers to section " + it->unit + " which is not present");
			step.unit = section(it->unit);
		}

		for (std::vector<std::pair<PortRef, PortRef>>::const_iterator s = it->seeds.begin(); s != it->seeds.end(); ++s)
		{
			Port* const src = resolvePort(s->first, recipe);
			Port* const dst = resolvePort(s->second, recipe);
			if (!compatible(*src, *dst))
				throw AssemblyInvariantException("Cannot seed port " + dst->path() + " from incompatible port " + src->path());

			step.seeds.push_back(std::make_pair(src, dst));
		}

		_schedule.push_back(step);
	}

	for (std::vector<Arc*>::const_iterator it = _arcs.begin(); it != _arcs.end(); ++it)
		(*it)->expand(*this);

	LOG(Debug) << "Assembled " << path() << " from " << _sections.size() << " sections with " << _arcs.size() << " arcs and " << _schedule.size() << " schedule steps";
}

void CompositeUnit::checkScheduleOrder(const AssemblyRecipe& recipe) const
{
	const int nNodes = recipe.sections.size();
	std::unordered_map<std::string, int> index;
	for (int i = 0; i < nNodes; ++i)
		index[recipe.sections[i]] = i;

	std::vector<int> conList;
	for (std::vector<ArcSpec>::const_iterator it = recipe.arcs.begin(); it != recipe.arcs.end(); ++it)
	{
		if (!it->primary || it->source.unit.empty() || it->destination.unit.empty())
			continue;

		conList.push_back(index.at(it->source.unit));
		conList.push_back(index.at(it->destination.unit));
	}

	const graph::AdjacencyList adj = graph::adjacencyListFromConnectionList(conList.data(), nNodes, conList.size() / 2);
	std::vector<int> topoOrder;
	if (graph::topologicalSort(adj, topoOrder))
		throw AssemblyInvariantException("Primary arcs of " + path() + " contain a cycle");

	std::vector<int> position(nNodes, -1);
	int pos = 0;
	for (std::vector<StepSpec>::const_iterator it = recipe.schedule.begin(); it != recipe.schedule.end(); ++it, ++pos)
	{
		if (it->unit.empty())
			continue;

		const std::unordered_map<std::string, int>::const_iterator idx = index.find(it->unit);
		if (idx == index.end())
			throw AssemblyInvariantException("Schedule of " + path() + " refers to section " + it->unit + " which is not present");
		if (position[idx->second] >= 0)
			throw AssemblyInvariantException("Schedule of " + path() + " visits section " + it->unit + " twice");

		position[idx->second] = pos;
	}

	for (int i = 0; i < nNodes; ++i)
	{
		if (position[i] < 0)
			throw AssemblyInvariantException("Schedule of " + path() + " does not visit section " + recipe.sections[i]);

		for (std::vector<int>::const_iterator j = adj[i].begin(); j != adj[i].end(); ++j)
		{
			if (position[*j] < position[i])
				throw AssemblyInvariantException("Schedule of " + path() + " visits " + recipe.sections[*j] + " before its upstream section " + recipe.sections[i]);
		}
	}
}

} // namespace model

} // namespace sequin
