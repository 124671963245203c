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

#include "model/Block.hpp"
#include "sequin/Exceptions.hpp"

#include <unordered_set>

namespace sequin
{

namespace model
{

Block::Block(const std::string& name, Block* parent) : _name(name), _parent(parent)
{
	if (name.empty())
		throw InvalidParameterException("Block name must not be empty");
}

Block::~Block() SEQUIN_NOEXCEPT
{
	for (std::vector<Constraint*>::iterator it = _constraints.begin(); it != _constraints.end(); ++it)
		delete *it;
	for (std::vector<Variable*>::iterator it = _vars.begin(); it != _vars.end(); ++it)
		delete *it;
	for (std::vector<Block*>::iterator it = _children.begin(); it != _children.end(); ++it)
		delete *it;
}

std::string Block::path() const
{
	if (!_parent)
		return _name;
	return _parent->path() + "." + _name;
}

Variable* Block::addVariable(const std::string& name)
{
	if (variable(name))
		throw InvalidParameterException("Variable " + name + " already exists in block " + path());

	Variable* const v = new Variable(name, this);
	_vars.push_back(v);
	return v;
}

Variable* Block::addVariable(const std::string& name, double value)
{
	Variable* const v = addVariable(name);
	v->setValue(value);
	return v;
}

Constraint* Block::addConstraint(const std::string& name, const std::vector<Variable*>& vars, Constraint::Function fn, double scale)
{
	if (constraint(name))
		throw InvalidParameterException("Constraint " + name + " already exists in block " + path());

	Constraint* const c = new Constraint(name, this, vars, fn, scale);
	_constraints.push_back(c);
	return c;
}

Block* Block::adoptChild(Block* child)
{
	if (child->parent() != this)
		throw InvalidParameterException("Block " + child->name() + " is not a child of " + path());
	if (this->child(child->name()))
		throw InvalidParameterException("Child " + child->name() + " already exists in block " + path());

	_children.push_back(child);
	return child;
}

Variable* Block::variable(const std::string& name) const
{
	for (std::vector<Variable*>::const_iterator it = _vars.begin(); it != _vars.end(); ++it)
	{
		if ((*it)->name() == name)
			return *it;
	}
	return nullptr;
}

Constraint* Block::constraint(const std::string& name) const
{
	for (std::vector<Constraint*>::const_iterator it = _constraints.begin(); it != _constraints.end(); ++it)
	{
		if ((*it)->name() == name)
			return *it;
	}
	return nullptr;
}

Block* Block::child(const std::string& name) const
{
	for (std::vector<Block*>::const_iterator it = _children.begin(); it != _children.end(); ++it)
	{
		if ((*it)->name() == name)
			return *it;
	}
	return nullptr;
}

// Element names may contain dots (e.g., port members), so own elements are tried first
Variable* Block::findVariable(const std::string& relPath) const
{
	Variable* const v = variable(relPath);
	if (v)
		return v;

	const std::size_t sep = relPath.find('.');
	if (sep == std::string::npos)
		return nullptr;

	Block* const c = child(relPath.substr(0, sep));
	if (!c)
		return nullptr;

	return c->findVariable(relPath.substr(sep + 1));
}

Constraint* Block::findConstraint(const std::string& relPath) const
{
	Constraint* const con = constraint(relPath);
	if (con)
		return con;

	const std::size_t sep = relPath.find('.');
	if (sep == std::string::npos)
		return nullptr;

	Block* const c = child(relPath.substr(0, sep));
	if (!c)
		return nullptr;

	return c->findConstraint(relPath.substr(sep + 1));
}

Block* Block::findBlock(const std::string& relPath) const
{
	const std::size_t sep = relPath.find('.');
	if (sep == std::string::npos)
		return child(relPath);

	Block* const c = child(relPath.substr(0, sep));
	if (!c)
		return nullptr;

	return c->findBlock(relPath.substr(sep + 1));
}

void Block::collectVariables(std::vector<Variable*>& vars) const
{
	vars.insert(vars.end(), _vars.begin(), _vars.end());
	for (std::vector<Block*>::const_iterator it = _children.begin(); it != _children.end(); ++it)
		(*it)->collectVariables(vars);
}

void Block::collectConstraints(std::vector<Constraint*>& constraints) const
{
	constraints.insert(constraints.end(), _constraints.begin(), _constraints.end());
	for (std::vector<Block*>::const_iterator it = _children.begin(); it != _children.end(); ++it)
		(*it)->collectConstraints(constraints);
}

void Block::activeSystem(std::vector<Constraint*>& constraints, std::vector<Variable*>& unknowns) const
{
	std::vector<Constraint*> allCons;
	collectConstraints(allCons);

	constraints.clear();
	std::unordered_set<Variable const*> referenced;
	for (std::vector<Constraint*>::const_iterator it = allCons.begin(); it != allCons.end(); ++it)
	{
		if (!(*it)->isActive())
			continue;

		constraints.push_back(*it);
		referenced.insert((*it)->variables().begin(), (*it)->variables().end());
	}

	std::vector<Variable*> allVars;
	collectVariables(allVars);

	unknowns.clear();
	for (std::vector<Variable*>::const_iterator it = allVars.begin(); it != allVars.end(); ++it)
	{
		if (!(*it)->isFixed() && (referenced.count(*it) > 0))
			unknowns.push_back(*it);
	}
}

int Block::degreesOfFreedom() const
{
	std::vector<Constraint*> cons;
	std::vector<Variable*> unknowns;
	activeSystem(cons, unknowns);
	return static_cast<int>(unknowns.size()) - static_cast<int>(cons.size());
}

} // namespace model

} // namespace sequin
