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
 * Defines the heat exchanger and condensing section unit models.
 */

#ifndef LIBSEQUIN_HEATEXCHANGER_HPP_
#define LIBSEQUIN_HEATEXCHANGER_HPP_

#include "model/UnitModel.hpp"

namespace sequin
{

namespace model
{

/**
 * @brief Two-stream heat exchanger with constant overall heat transfer coefficient
 * @details Side 1 (ports @c inlet_1 and @c outlet_1) is the hot side, side 2 (ports @c inlet_2 and
 *          @c outlet_2) is the cold side. The model consists of
 *          @f[ \begin{align}
 *              0 &= F_{1,\text{in}} - F_{1,\text{out}} \\
 *              0 &= F_{2,\text{in}} - F_{2,\text{out}} \\
 *              0 &= P_{i,\text{in}} + \Delta P_i - P_{i,\text{out}} \\
 *              0 &= F_{1,\text{in}} \left( h_{1,\text{in}} - h_{1,\text{out}} \right) - Q \\
 *              0 &= F_{2,\text{in}} \left( h_{2,\text{in}} - h_{2,\text{out}} \right) + Q \\
 *              0 &= Q - U A \Delta T \\
 *              0 &= \Delta T - \left( \frac{\sqrt[3]{\Delta T_a} + \sqrt[3]{\Delta T_b}}{2} \right)^3
 *          \end{align} @f]
 *          where the last equation is a smooth approximation of the log mean temperature difference.
 *          The end temperature differences @f$ \Delta T_a @f$ and @f$ \Delta T_b @f$ depend on the
 *          flow pattern. The pressure changes @f$ \Delta P_i @f$ are only present if @c HAS_PRESSURE_CHANGE
 *          is set for the side and have to be specified.
 */
class HeatExchanger : public UnitModel
{
public:

	HeatExchanger(const std::string& name, Block* parent);
	virtual ~HeatExchanger() SEQUIN_NOEXCEPT;

	static const char* identifier() { return "HEAT_EXCHANGER"; }
	virtual const char* unitType() const SEQUIN_NOEXCEPT { return HeatExchanger::identifier(); }

	virtual config::ConfigSchema schema(const IConfigHelper& helper) const;
	virtual void initialGuess();

	/**
	 * @brief Declares the options of a heat exchanger
	 * @param [in] name Name of the schema
	 * @param [in] helper Provides the available property packages
	 * @return Option table
	 */
	static config::ConfigSchema heatExchangerSchema(const std::string& name, const IConfigHelper& helper);

	inline bool isCountercurrent() const SEQUIN_NOEXCEPT { return _countercurrent; }
	inline IPropertyPackage const* hotSidePackage() const SEQUIN_NOEXCEPT { return _pkgHot; }
	inline IPropertyPackage const* coldSidePackage() const SEQUIN_NOEXCEPT { return _pkgCold; }

	/**
	 * @brief Computes the temperature at the given port from its current values
	 * @param [in] p Port of this unit
	 * @return Temperature in K
	 */
	double temperature(const Port& p) const;

protected:

	virtual void buildUnit(const config::Configuration& cfg, const IConfigHelper& helper);

	double deltaTemperatureResidual() const;

	Port* _inletHot;
	Port* _outletHot;
	Port* _inletCold;
	Port* _outletCold;

	IPropertyPackage* _pkgHot;
	IPropertyPackage* _pkgCold;

	Variable* _heatDuty;
	Variable* _area;
	Variable* _heatTransferCoeff;
	Variable* _deltaT;

	bool _countercurrent;
};

/**
 * @brief Heat exchanger section in which the hot side steam condenses
 * @details Adds the special constraint @c extraction_rate_constraint that requires the side 1 outlet
 *          to be saturated liquid. The constraint determines the flow rate at @c inlet_1.
 */
class CondensingSection : public HeatExchanger
{
public:

	CondensingSection(const std::string& name, Block* parent);
	virtual ~CondensingSection() SEQUIN_NOEXCEPT;

	static const char* identifier() { return "CONDENSING_SECTION"; }
	virtual const char* unitType() const SEQUIN_NOEXCEPT { return CondensingSection::identifier(); }

protected:

	virtual void buildUnit(const config::Configuration& cfg, const IConfigHelper& helper);
};

} // namespace model

} // namespace sequin

#endif  // LIBSEQUIN_HEATEXCHANGER_HPP_
