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
 * Defines the hierarchical container of variables and constraints.
 */

#ifndef LIBSEQUIN_BLOCK_HPP_
#define LIBSEQUIN_BLOCK_HPP_

#include "sequin/sequinCompilerInfo.hpp"
#include "model/Variable.hpp"

#include <string>
#include <vector>

namespace sequin
{

namespace model
{

/**
 * @brief Hierarchical container of variables, constraints, and child blocks
 * @details A Block exclusively owns its variables, constraints, and children. Elements are
 *          addressed by dotted paths relative to a block (e.g., @c condense.inlet_1.flow_mol).
 *          Traversals visit the own elements of a block before those of its children, in
 *          declaration order.
 */
class Block
{
public:
	Block(const std::string& name, Block* parent);
	virtual ~Block() SEQUIN_NOEXCEPT;

	Block(const Block&) = delete;
	Block& operator=(const Block&) = delete;

	inline const std::string& name() const SEQUIN_NOEXCEPT { return _name; }
	inline Block* parent() const SEQUIN_NOEXCEPT { return _parent; }

	/**
	 * @brief Returns the dotted path of this block starting at the root block
	 * @return Path of the block
	 */
	std::string path() const;

	Variable* addVariable(const std::string& name);
	Variable* addVariable(const std::string& name, double value);

	/**
	 * @brief Adds an equality constraint to this block
	 * @param [in] name Name of the constraint
	 * @param [in] vars Variables the residual function depends on
	 * @param [in] fn Residual function
	 * @param [in] scale Scaling factor applied to the residual
	 * @return Created constraint owned by this block
	 */
	Constraint* addConstraint(const std::string& name, const std::vector<Variable*>& vars, Constraint::Function fn, double scale = 1.0);

	/**
	 * @brief Transfers ownership of the given block to this block
	 * @details The child must have been constructed with this block as parent.
	 * @param [in] child Child block
	 * @return The child block
	 */
	Block* adoptChild(Block* child);

	inline const std::vector<Variable*>& variables() const SEQUIN_NOEXCEPT { return _vars; }
	inline const std::vector<Constraint*>& constraints() const SEQUIN_NOEXCEPT { return _constraints; }
	inline const std::vector<Block*>& children() const SEQUIN_NOEXCEPT { return _children; }

	Variable* variable(const std::string& name) const;
	Constraint* constraint(const std::string& name) const;
	Block* child(const std::string& name) const;

	/**
	 * @brief Looks up a variable by its path relative to this block
	 * @param [in] relPath Dotted path relative to this block
	 * @return Variable or @c nullptr if it does not exist
	 */
	Variable* findVariable(const std::string& relPath) const;
	Constraint* findConstraint(const std::string& relPath) const;
	Block* findBlock(const std::string& relPath) const;

	void collectVariables(std::vector<Variable*>& vars) const;
	void collectConstraints(std::vector<Constraint*>& constraints) const;

	/**
	 * @brief Collects the active equation system of the subtree rooted at this block
	 * @details Unknowns are the unfixed variables referenced by at least one active
	 *          constraint, ordered by their position in the tree.
	 * @param [out] constraints Active constraints
	 * @param [out] unknowns Unknowns
	 */
	void activeSystem(std::vector<Constraint*>& constraints, std::vector<Variable*>& unknowns) const;

	/**
	 * @brief Computes the degrees of freedom of the subtree
	 * @details Number of unknowns minus number of active constraints, see activeSystem().
	 * @return Degrees of freedom
	 */
	int degreesOfFreedom() const;

protected:
	std::string _name;
	Block* _parent;
	std::vector<Variable*> _vars;
	std::vector<Constraint*> _constraints;
	std::vector<Block*> _children;
};

} // namespace model

} // namespace sequin

#endif  // LIBSEQUIN_BLOCK_HPP_
