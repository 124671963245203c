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
 * Defines the property package interface.
 */

#ifndef LIBSEQUIN_PROPERTYPACKAGE_HPP_
#define LIBSEQUIN_PROPERTYPACKAGE_HPP_

#include "sequin/sequinCompilerInfo.hpp"

namespace sequin
{

namespace config
{
	class Configuration;
}

namespace model
{

class Block;
class Port;

/**
 * @brief Thermodynamic property package of a material stream
 * @details A property package constructs the state variables of a port (molar flow,
 *          molar enthalpy, and pressure) and provides the state relations used by
 *          unit model constraints. All quantities are in SI units (mol/s, J/mol, Pa, K).
 */
class IPropertyPackage
{
public:
	virtual ~IPropertyPackage() SEQUIN_NOEXCEPT { }

	/**
	 * @brief Returns the name of the property package
	 * @return Name used to select the package in configurations
	 */
	virtual const char* name() const SEQUIN_NOEXCEPT = 0;

	/**
	 * @brief Configures the package from its argument block
	 * @details Throws ConfigurationException if an argument is unknown or invalid.
	 * @param [in] args Package arguments
	 */
	virtual void configure(const config::Configuration& args) = 0;

	/**
	 * @brief Creates the state variables of a port in the given unit
	 * @details The variables @c <port>.flow_mol, @c <port>.enth_mol, and @c <port>.pressure
	 *          are added to @p unit and registered as port members.
	 * @param [in,out] unit Block owning the variables
	 * @param [in,out] port Port receiving the members
	 * @param [in] hasPhaseEquilibrium Determines whether the state may be two-phase
	 */
	virtual void buildState(Block& unit, Port& port, bool hasPhaseEquilibrium) const = 0;

	/**
	 * @brief Computes the temperature from molar enthalpy and pressure
	 * @param [in] enthalpy Molar enthalpy
	 * @param [in] pressure Pressure
	 * @return Temperature
	 */
	virtual double temperature(double enthalpy, double pressure) const = 0;

	virtual double saturationTemperature(double pressure) const = 0;
	virtual double enthalpySaturatedLiquid(double pressure) const = 0;
	virtual double enthalpySaturatedVapor(double pressure) const = 0;
};

} // namespace model

} // namespace sequin

#endif  // LIBSEQUIN_PROPERTYPACKAGE_HPP_
