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
 * Defines ports and arcs connecting unit models.
 */

#ifndef LIBSEQUIN_PORT_HPP_
#define LIBSEQUIN_PORT_HPP_

#include "sequin/sequinCompilerInfo.hpp"

#include <string>
#include <vector>
#include <utility>

namespace sequin
{

namespace model
{

class Block;
class Variable;

/**
 * @brief Direction of a port
 */
enum class PortDirection : int
{
	Inlet,
	Outlet
};

/**
 * @brief Named flow interface of a unit model
 * @details A port is an ordered mapping from member key (e.g., @c flow_mol) to a variable owned
 *          by the block that declares the port. Ports never own their variables.
 */
class Port
{
public:
	typedef std::pair<std::string, Variable*> Member;

	Port(const std::string& name, PortDirection dir, Block* owner);

	inline const std::string& name() const SEQUIN_NOEXCEPT { return _name; }
	inline PortDirection direction() const SEQUIN_NOEXCEPT { return _dir; }
	inline bool isInlet() const SEQUIN_NOEXCEPT { return _dir == PortDirection::Inlet; }
	inline Block* owner() const SEQUIN_NOEXCEPT { return _owner; }
	std::string path() const;

	void addMember(const std::string& key, Variable* var);

	inline const std::vector<Member>& members() const SEQUIN_NOEXCEPT { return _members; }
	inline unsigned int numMembers() const SEQUIN_NOEXCEPT { return _members.size(); }

	/**
	 * @brief Returns the variable with the given key
	 * @param [in] key Member key
	 * @return Variable or @c nullptr if the key does not exist
	 */
	Variable* member(const std::string& key) const;

	/**
	 * @brief Fixes all members of the port at their current values
	 * @details Throws InvalidParameterException if a member does not have a value.
	 */
	void fix();
	void unfix();

	/**
	 * @brief Fixes all members that are not fixed yet
	 * @param [out] fixed Receives the variables that have been fixed by this call
	 */
	void fixFree(std::vector<Variable*>& fixed);

	/**
	 * @brief Fixes all members that are not fixed yet, except the given ones
	 * @param [out] fixed Receives the variables that have been fixed by this call
	 * @param [in] keepFree Variables that stay free
	 */
	void fixFree(std::vector<Variable*>& fixed, const std::vector<Variable*>& keepFree);

protected:
	std::string _name;
	PortDirection _dir;
	Block* _owner;
	std::vector<Member> _members;
};

/**
 * @brief Copies the values of all members of @p src into the members of @p dst with the same key
 * @details Fixed flags are not copied. Source members without a value are skipped.
 *          Throws AssemblyInvariantException if the ports do not have the same keys.
 * @param [in] src Source port
 * @param [in,out] dst Destination port
 */
void propagate(const Port& src, Port& dst);

/**
 * @brief Checks whether two ports have the same member keys in the same order
 * @param [in] a First port
 * @param [in] b Second port
 * @return @c true if the ports are compatible, otherwise @c false
 */
bool compatible(const Port& a, const Port& b);


/**
 * @brief Directed connection between an upstream and a downstream port
 * @details Source and destination are fixed at construction. During initialization an arc
 *          copies values forward, see propagate(). When the model is completed, an arc is
 *          expanded into explicit equality constraints, see expand().
 */
class Arc
{
public:
	Arc(const std::string& name, Port& source, Port& destination);

	inline const std::string& name() const SEQUIN_NOEXCEPT { return _name; }
	inline const Port& source() const SEQUIN_NOEXCEPT { return _src; }
	inline Port& destination() const SEQUIN_NOEXCEPT { return _dst; }

	/**
	 * @brief Copies the source values into the destination port
	 */
	void propagate() const;

	/**
	 * @brief Adds equality constraints between source and destination members to the given block
	 * @details One constraint named @c <arc>.<key> is created for each member.
	 * @param [in] owner Block receiving the constraints
	 */
	void expand(Block& owner) const;

	/**
	 * @brief Returns the residual scaling factor used for the equality of a member
	 * @param [in] key Member key
	 * @return Scaling factor
	 */
	static double memberScale(const std::string& key);

protected:
	std::string _name;
	Port& _src;
	Port& _dst;
};

} // namespace model

} // namespace sequin

#endif  // LIBSEQUIN_PORT_HPP_
