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
 * Defines the drain mixer unit model.
 */

#ifndef LIBSEQUIN_MIXER_HPP_
#define LIBSEQUIN_MIXER_HPP_

#include "model/UnitModel.hpp"

namespace sequin
{

namespace model
{

/**
 * @brief Mixes a steam stream with a drain stream
 * @details Inlets are @c steam and @c drain, the mixed stream leaves through @c outlet.
 *          The outlet pressure equals the steam pressure (@c mixer_pressure_constraint).
 *          With @c MOMENTUM_MIXING set to @c EQUALIZE, the drain pressure is also required to
 *          equal the outlet pressure.
 */
class Mixer : public UnitModel
{
public:

	Mixer(const std::string& name, Block* parent);
	virtual ~Mixer() SEQUIN_NOEXCEPT;

	static const char* identifier() { return "MIXER"; }
	virtual const char* unitType() const SEQUIN_NOEXCEPT { return Mixer::identifier(); }

	virtual config::ConfigSchema schema(const IConfigHelper& helper) const;
	virtual void initialGuess();

	static config::ConfigSchema mixerSchema(const std::string& name, const IConfigHelper& helper);

protected:

	virtual void buildUnit(const config::Configuration& cfg, const IConfigHelper& helper);

	Port* _steam;
	Port* _drain;
	Port* _outlet;
};

} // namespace model

} // namespace sequin

#endif  // LIBSEQUIN_MIXER_HPP_
