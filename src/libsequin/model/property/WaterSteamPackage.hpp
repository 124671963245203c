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
 * Defines the water and steam property packages.
 */

#ifndef LIBSEQUIN_WATERSTEAMPACKAGE_HPP_
#define LIBSEQUIN_WATERSTEAMPACKAGE_HPP_

#include "model/property/PropertyPackage.hpp"

namespace sequin
{

namespace model
{

/**
 * @brief Smooth molar water/steam model
 * @details The saturation curve follows the Clausius-Clapeyron equation anchored at the normal
 *          boiling point
 *          @f[ T_{\text{sat}}(P) = \left( \frac{1}{T_b} - \frac{R}{\Delta h_{\text{vap},0}} \ln\frac{P}{P_{\text{ref}}} \right)^{-1}. @f]
 *          The latent heat follows the Watson correlation
 *          @f$ \Delta h_{\text{vap}}(T) = \Delta h_{\text{vap},0} \left( (T_c - T) / (T_c - T_b) \right)^{0.38} @f$.
 *          Liquid and vapor have constant heat capacities. The enthalpy reference is the liquid at
 *          the triple point. Inside the two-phase region the temperature stays at the saturation
 *          temperature, the kinks at the phase boundaries are smoothed with parameter @c SMOOTHING.
 */
class WaterSteamPropertyPackage : public IPropertyPackage
{
public:
	WaterSteamPropertyPackage();
	virtual ~WaterSteamPropertyPackage() SEQUIN_NOEXCEPT;

	static const char* identifier() { return "WATER_STEAM"; }
	virtual const char* name() const SEQUIN_NOEXCEPT { return WaterSteamPropertyPackage::identifier(); }

	virtual void configure(const config::Configuration& args);
	virtual void buildState(Block& unit, Port& port, bool hasPhaseEquilibrium) const;

	virtual double temperature(double enthalpy, double pressure) const;
	virtual double saturationTemperature(double pressure) const;
	virtual double enthalpySaturatedLiquid(double pressure) const;
	virtual double enthalpySaturatedVapor(double pressure) const;

	double heatOfVaporization(double temperature) const;

	inline double heatCapacityLiquid() const SEQUIN_NOEXCEPT { return _cpLiq; }
	inline double heatCapacityVapor() const SEQUIN_NOEXCEPT { return _cpVap; }

protected:
	double _cpLiq; //!< Molar heat capacity of the liquid in J/(mol K)
	double _cpVap; //!< Molar heat capacity of the vapor in J/(mol K)
	double _eps; //!< Smoothing parameter in K
};

/**
 * @brief Subcooled liquid water
 * @details Temperature is linear in enthalpy. Phase equilibrium is not supported.
 */
class LiquidWaterPropertyPackage : public WaterSteamPropertyPackage
{
public:
	LiquidWaterPropertyPackage();
	virtual ~LiquidWaterPropertyPackage() SEQUIN_NOEXCEPT;

	static const char* identifier() { return "LIQUID_WATER"; }
	virtual const char* name() const SEQUIN_NOEXCEPT { return LiquidWaterPropertyPackage::identifier(); }

	virtual void configure(const config::Configuration& args);
	virtual void buildState(Block& unit, Port& port, bool hasPhaseEquilibrium) const;

	virtual double temperature(double enthalpy, double pressure) const;
};

} // namespace model

} // namespace sequin

#endif  // LIBSEQUIN_WATERSTEAMPACKAGE_HPP_
