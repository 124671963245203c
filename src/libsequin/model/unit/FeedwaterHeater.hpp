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
 * Defines the feedwater heater composite unit.
 */

#ifndef LIBSEQUIN_FEEDWATERHEATER_HPP_
#define LIBSEQUIN_FEEDWATERHEATER_HPP_

#include "model/CompositeUnit.hpp"

namespace sequin
{

namespace model
{

/**
 * @brief Feedwater heater assembled from optional sections
 * @details Extraction steam enters at @c inlet_1 and leaves as condensate at @c outlet_1. Feedwater
 *          enters at @c inlet_2 and leaves at @c outlet_2. The condensing section @c condense is
 *          always present. Optional sections are the desuperheater @c desuperheat, the drain mixer
 *          @c drain_mix (adds the inlet port @c drain), and the drain cooler @c cooling.
 *          
 *          The steam passes desuperheat, drain_mix, condense, and cooling in this order. The feedwater
 *          passes the sections in reverse order. Absent sections are skipped when wiring.
 *          
 *          The schedule initializes desuperheat, drain_mix, condense, and cooling in this order.
 *          Each step seeds the steam inlet from the previous steam outlet (or @c inlet_1) and the
 *          feedwater inlet from @c inlet_2.
 */
class FeedwaterHeater : public CompositeUnit
{
public:

	FeedwaterHeater(const std::string& name, Block* parent);
	virtual ~FeedwaterHeater() SEQUIN_NOEXCEPT;

	static const char* identifier() { return "FEEDWATER_HEATER"; }
	virtual const char* unitType() const SEQUIN_NOEXCEPT { return FeedwaterHeater::identifier(); }

	virtual config::ConfigSchema schema(const IConfigHelper& helper) const;

	/**
	 * @brief Creates the assembly recipe for the given section flags
	 * @param [in] hasDesuperheat Determines whether the desuperheater is present
	 * @param [in] hasDrainMixer Determines whether the drain mixer is present
	 * @param [in] hasDrainCooling Determines whether the drain cooler is present
	 * @return Assembly recipe
	 */
	static AssemblyRecipe recipe(bool hasDesuperheat, bool hasDrainMixer, bool hasDrainCooling);

protected:

	virtual void buildUnit(const config::Configuration& cfg, const IConfigHelper& helper);
};

} // namespace model

} // namespace sequin

#endif  // LIBSEQUIN_FEEDWATERHEATER_HPP_
