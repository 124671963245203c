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

#include "model/Variable.hpp"
#include "model/Block.hpp"
#include "sequin/Exceptions.hpp"

namespace sequin
{

namespace model
{

namespace
{
	inline std::string childPath(const Block* parent, const std::string& name)
	{
		if (!parent)
			return name;
		return parent->path() + "." + name;
	}
}

Variable::Variable(const std::string& name, Block* parent) : _name(name), _parent(parent), _value(0.0), _hasValue(false), _fixed(false),
	_lb(-std::numeric_limits<double>::infinity()), _ub(std::numeric_limits<double>::infinity())
{
}

Variable::Variable(const std::string& name, Block* parent, double value) : _name(name), _parent(parent), _value(value), _hasValue(true), _fixed(false),
	_lb(-std::numeric_limits<double>::infinity()), _ub(std::numeric_limits<double>::infinity())
{
}

std::string Variable::path() const
{
	return childPath(_parent, _name);
}

void Variable::clearValue()
{
	if (_fixed)
		throw InvalidParameterException("Cannot clear value of fixed variable " + path());

	_hasValue = false;
}

void Variable::fix()
{
	if (!_hasValue)
		throw InvalidParameterException("Cannot fix variable " + path() + " without a value");

	_fixed = true;
}

void Variable::setBounds(double lb, double ub)
{
	if (lb > ub)
		throw InvalidParameterException("Lower bound of variable " + path() + " exceeds upper bound");

	_lb = lb;
	_ub = ub;
}


Constraint::Constraint(const std::string& name, Block* parent, const std::vector<Variable*>& vars, Function fn, double scale)
	: _name(name), _parent(parent), _vars(vars), _fn(fn), _scale(scale), _active(true), _determined(nullptr)
{
}

std::string Constraint::path() const
{
	return childPath(_parent, _name);
}

void Constraint::determines(Variable* var)
{
	_determined = var;
}

} // namespace model

} // namespace sequin
