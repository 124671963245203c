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
 * Defines the base class of units that are assembled from sections.
 */

#ifndef LIBSEQUIN_COMPOSITEUNIT_HPP_
#define LIBSEQUIN_COMPOSITEUNIT_HPP_

#include "model/UnitModel.hpp"

#include <string>
#include <vector>
#include <utility>

namespace sequin
{

namespace model
{

/**
 * @brief Refers to a port of a section or, if @c unit is empty, of the composite itself
 */
struct PortRef
{
	std::string unit;
	std::string port;
};

/**
 * @brief Directed connection between two ports
 */
struct ArcSpec
{
	std::string name;
	PortRef source;
	PortRef destination;
	bool primary; //!< Determines whether the arc belongs to the main path that orders the schedule
};

/**
 * @brief Initialization step
 * @details If @c unit is empty, the step only copies the seed ports.
 */
struct StepSpec
{
	std::string unit;
	std::vector<std::pair<PortRef, PortRef>> seeds; //!< Pairs (source, destination) copied before the step
};

/**
 * @brief Assembly recipe of one structural variant of a composite unit
 */
struct AssemblyRecipe
{
	std::vector<std::string> sections; //!< Names of the present sections
	std::vector<ArcSpec> arcs;
	std::vector<StepSpec> schedule;
};

/**
 * @brief Resolved initialization step
 */
struct ScheduleStep
{
	UnitModel* unit; //!< Unit to initialize or @c nullptr if the step only copies the seeds
	std::vector<std::pair<Port*, Port*>> seeds;
};

/**
 * @brief Base class for units composed of sections connected by arcs
 * @details Derived classes create their sections in buildUnit() using addSection() and then call
 *          assemble() with the recipe of the variant selected by their configuration.
 *          
 *          Assembly checks that every section referenced by the recipe is present, that every
 *          inlet of a section and every outlet of the composite is the destination of exactly
 *          one arc, that the connected ports are compatible, and that the schedule visits the
 *          sections along the primary arcs. Violations throw an AssemblyInvariantException.
 *          Arcs are expanded into equality constraints of the composite.
 */
class CompositeUnit : public UnitModel
{
public:

	CompositeUnit(const std::string& name, Block* parent);
	virtual ~CompositeUnit() SEQUIN_NOEXCEPT;

	inline const std::vector<UnitModel*>& sections() const SEQUIN_NOEXCEPT { return _sections; }
	UnitModel* section(const std::string& name) const;

	inline const std::vector<Arc*>& arcs() const SEQUIN_NOEXCEPT { return _arcs; }
	Arc* arc(const std::string& name) const;

	inline const std::vector<ScheduleStep>& schedule() const SEQUIN_NOEXCEPT { return _schedule; }

protected:

	/**
	 * @brief Builds a section and adds it to the composite
	 * @details Takes ownership of @p unit. The property package of @p cfg is resolved against
	 *          the configuration of the composite before the section is built.
	 * @param [in] unit Section with this composite as parent
	 * @param [in] cfg Validated configuration of the section
	 * @param [in] helper Configuration helper
	 * @return The section
	 */
	UnitModel* addSection(UnitModel* unit, const config::Configuration& cfg, const IConfigHelper& helper);

	/**
	 * @brief Wires arcs and resolves the schedule of the given recipe
	 * @param [in] recipe Assembly recipe
	 */
	void assemble(const AssemblyRecipe& recipe);

	Port* resolvePort(const PortRef& ref, const AssemblyRecipe& recipe) const;
	void checkScheduleOrder(const AssemblyRecipe& recipe) const;

	std::vector<UnitModel*> _sections; //!< Sections, owned as children of the block
	std::vector<Arc*> _arcs;
	std::vector<ScheduleStep> _schedule;
};

} // namespace model

} // namespace sequin

#endif  // LIBSEQUIN_COMPOSITEUNIT_HPP_
