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

#include "model/Port.hpp"
#include "model/Block.hpp"
#include "model/Variable.hpp"
#include "sequin/Exceptions.hpp"

#include <algorithm>

namespace sequin
{

namespace model
{

Port::Port(const std::string& name, PortDirection dir, Block* owner) : _name(name), _dir(dir), _owner(owner) { }

std::string Port::path() const
{
	return _owner->path() + "." + _name;
}

void Port::addMember(const std::string& key, Variable* var)
{
	if (member(key))
		throw InvalidParameterException("Port " + path() + " already has member " + key);

	_members.push_back(Member(key, var));
}

Variable* Port::member(const std::string& key) const
{
	for (std::vector<Member>::const_iterator it = _members.begin(); it != _members.end(); ++it)
	{
		if (it->first == key)
			return it->second;
	}
	return nullptr;
}

void Port::fix()
{
	for (std::vector<Member>::iterator it = _members.begin(); it != _members.end(); ++it)
		it->second->fix();
}

void Port::unfix()
{
	for (std::vector<Member>::iterator it = _members.begin(); it != _members.end(); ++it)
		it->second->unfix();
}

void Port::fixFree(std::vector<Variable*>& fixed)
{
	fixFree(fixed, std::vector<Variable*>());
}

void Port::fixFree(std::vector<Variable*>& fixed, const std::vector<Variable*>& keepFree)
{
	for (std::vector<Member>::iterator it = _members.begin(); it != _members.end(); ++it)
	{
		Variable* const v = it->second;
		if (v->isFixed() || (std::find(keepFree.begin(), keepFree.end(), v) != keepFree.end()))
			continue;

		v->fix();
		fixed.push_back(v);
	}
}

bool compatible(const Port& a, const Port& b)
{
	if (a.numMembers() != b.numMembers())
		return false;

	for (unsigned int i = 0; i < a.numMembers(); ++i)
	{
		if (a.members()[i].first != b.members()[i].first)
			return false;
	}
	return true;
}

void propagate(const Port& src, Port& dst)
{
	if (!compatible(src, dst))
		throw AssemblyInvariantException("Cannot propagate from " + src.path() + " to incompatible port " + dst.path());

	for (unsigned int i = 0; i < src.numMembers(); ++i)
	{
		Variable const* const from = src.members()[i].second;
		if (from->hasValue())
			dst.members()[i].second->setValue(from->value());
	}
}


Arc::Arc(const std::string& name, Port& source, Port& destination) : _name(name), _src(source), _dst(destination)
{
	if (!compatible(source, destination))
		throw AssemblyInvariantException("Arc " + name + " connects incompatible ports " + source.path() + " and " + destination.path());
}

void Arc::propagate() const
{
	model::propagate(_src, _dst);
}

double Arc::memberScale(const std::string& key)
{
	if (key == "enth_mol")
		return 1e-3;
	if (key == "pressure")
		return 1e-5;
	return 1.0;
}

void Arc::expand(Block& owner) const
{
	for (unsigned int i = 0; i < _src.numMembers(); ++i)
	{
		const std::string& key = _src.members()[i].first;
		Variable* const from = _src.members()[i].second;
		Variable* const to = _dst.members()[i].second;

		owner.addConstraint(_name + "." + key, std::vector<Variable*>{from, to}, [=]() { return from->value() - to->value(); }, memberScale(key));
	}
}

} // namespace model

} // namespace sequin
