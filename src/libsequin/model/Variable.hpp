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
 * Defines variables and equality constraints of steady-state unit models.
 */

#ifndef LIBSEQUIN_VARIABLE_HPP_
#define LIBSEQUIN_VARIABLE_HPP_

#include "sequin/sequinCompilerInfo.hpp"

#include <string>
#include <vector>
#include <functional>
#include <limits>

namespace sequin
{

namespace model
{

class Block;

/**
 * @brief Scalar variable of an equation system
 * @details A variable carries its current value (which may be unset), a fixed flag, and bounds.
 *          A fixed variable always has a value. Variables are owned by the Block that declares them.
 */
class Variable
{
public:
	Variable(const std::string& name, Block* parent);
	Variable(const std::string& name, Block* parent, double value);

	inline const std::string& name() const SEQUIN_NOEXCEPT { return _name; }
	inline Block* parent() const SEQUIN_NOEXCEPT { return _parent; }

	/**
	 * @brief Returns the dotted path of this variable starting at the root block
	 * @return Path of the variable
	 */
	std::string path() const;

	inline bool hasValue() const SEQUIN_NOEXCEPT { return _hasValue; }

	/**
	 * @brief Returns the current value
	 * @return Current value or @c NaN if the variable has no value
	 */
	inline double value() const SEQUIN_NOEXCEPT { return _hasValue ? _value : std::numeric_limits<double>::quiet_NaN(); }

	inline void setValue(double val) SEQUIN_NOEXCEPT
	{
		_value = val;
		_hasValue = true;
	}

	/**
	 * @brief Removes the value of the variable
	 * @details Throws InvalidParameterException if the variable is fixed.
	 */
	void clearValue();

	inline bool isFixed() const SEQUIN_NOEXCEPT { return _fixed; }

	/**
	 * @brief Fixes the variable at its current value
	 * @details Throws InvalidParameterException if the variable does not have a value.
	 */
	void fix();

	/**
	 * @brief Sets the value and fixes the variable
	 * @param [in] val Value
	 */
	inline void fix(double val) SEQUIN_NOEXCEPT
	{
		setValue(val);
		_fixed = true;
	}

	inline void unfix() SEQUIN_NOEXCEPT { _fixed = false; }

	inline double lowerBound() const SEQUIN_NOEXCEPT { return _lb; }
	inline double upperBound() const SEQUIN_NOEXCEPT { return _ub; }
	void setBounds(double lb, double ub);

protected:
	std::string _name;
	Block* _parent;
	double _value;
	bool _hasValue;
	bool _fixed;
	double _lb;
	double _ub;
};


/**
 * @brief Scaled equality constraint @f$ s \cdot f(x) = 0 @f$
 * @details The constraint knows the variables its residual function depends on. These
 *          determine the unknowns of an equation system. A constraint that determines an otherwise
 *          free variable (e.g., an extraction rate) is called special and is toggled during
 *          sequential initialization.
 */
class Constraint
{
public:
	typedef std::function<double(void)> Function;

	Constraint(const std::string& name, Block* parent, const std::vector<Variable*>& vars, Function fn, double scale);

	inline const std::string& name() const SEQUIN_NOEXCEPT { return _name; }
	inline Block* parent() const SEQUIN_NOEXCEPT { return _parent; }
	std::string path() const;

	inline const std::vector<Variable*>& variables() const SEQUIN_NOEXCEPT { return _vars; }
	inline double scale() const SEQUIN_NOEXCEPT { return _scale; }

	/**
	 * @brief Evaluates the scaled residual at the current variable values
	 * @return Scaled residual
	 */
	inline double residual() const { return _scale * _fn(); }

	inline bool isActive() const SEQUIN_NOEXCEPT { return _active; }
	inline void activate() SEQUIN_NOEXCEPT { _active = true; }
	inline void deactivate() SEQUIN_NOEXCEPT { _active = false; }

	/**
	 * @brief Marks this constraint as determining the given otherwise free variable
	 * @param [in] var Variable determined by this constraint
	 */
	void determines(Variable* var);

	inline bool isSpecial() const SEQUIN_NOEXCEPT { return _determined != nullptr; }
	inline Variable* determinedVariable() const SEQUIN_NOEXCEPT { return _determined; }

protected:
	std::string _name;
	Block* _parent;
	std::vector<Variable*> _vars;
	Function _fn;
	double _scale;
	bool _active;
	Variable* _determined;
};

} // namespace model

} // namespace sequin

#endif  // LIBSEQUIN_VARIABLE_HPP_
