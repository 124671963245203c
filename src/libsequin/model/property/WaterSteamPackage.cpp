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

#include "model/property/WaterSteamPackage.hpp"
#include "config/Configuration.hpp"
#include "model/Block.hpp"
#include "model/Port.hpp"
#include "sequin/Exceptions.hpp"

#include <cmath>
#include <limits>
#include <vector>
#include <string>

namespace
{
	const double R = 8.314462618; //!< Gas constant in J/(mol K)
	const double HvapRef = 40657.0; //!< Heat of vaporization at the normal boiling point in J/mol
	const double Tboil = 373.124; //!< Normal boiling point in K
	const double Tcrit = 647.096; //!< Critical temperature in K
	const double Pref = 101325.0; //!< Reference pressure in Pa
	const double Ttriple = 273.16; //!< Triple point temperature (enthalpy reference) in K

	inline double smoothMax0(double a, double eps)
	{
		return 0.5 * (a + std::sqrt(a * a + eps * eps));
	}

	inline double smoothMin0(double a, double eps)
	{
		return 0.5 * (a - std::sqrt(a * a + eps * eps));
	}

	void readPositive(const sequin::config::Configuration& args, const char* name, double& target)
	{
		if (!args.has(name))
			return;

		const double val = args.getDouble(name);
		if (!(val > 0.0))
			throw sequin::ConfigurationException(std::string("Property package argument ") + name + " has to be positive");

		target = val;
	}

	void checkArguments(const sequin::config::Configuration& args, const std::vector<std::string>& allowed, const char* package)
	{
		const std::vector<std::string> names = args.optionNames();
		for (std::vector<std::string>::const_iterator it = names.begin(); it != names.end(); ++it)
		{
			bool found = false;
			for (std::vector<std::string>::const_iterator a = allowed.begin(); a != allowed.end(); ++a)
			{
				if (*a == *it)
				{
					found = true;
					break;
				}
			}

			if (!found)
				throw sequin::ConfigurationException("Unknown argument " + *it + " of property package " + package);
		}
	}

	void addStateVariables(sequin::model::Block& unit, sequin::model::Port& port)
	{
		const double inf = std::numeric_limits<double>::infinity();

		sequin::model::Variable* const flow = unit.addVariable(port.name() + ".flow_mol", 1.0);
		flow->setBounds(0.0, inf);
		port.addMember("flow_mol", flow);

		sequin::model::Variable* const enth = unit.addVariable(port.name() + ".enth_mol", 1.0);
		port.addMember("enth_mol", enth);

		sequin::model::Variable* const pressure = unit.addVariable(port.name() + ".pressure", 1.0);
		pressure->setBounds(0.0, inf);
		port.addMember("pressure", pressure);
	}
}

namespace sequin
{

namespace model
{

WaterSteamPropertyPackage::WaterSteamPropertyPackage() : _cpLiq(75.327), _cpVap(36.0), _eps(0.1) { }
WaterSteamPropertyPackage::~WaterSteamPropertyPackage() SEQUIN_NOEXCEPT { }

void WaterSteamPropertyPackage::configure(const config::Configuration& args)
{
	checkArguments(args, std::vector<std::string>{"CP_LIQ", "CP_VAP", "SMOOTHING"}, name());
	readPositive(args, "CP_LIQ", _cpLiq);
	readPositive(args, "CP_VAP", _cpVap);
	readPositive(args, "SMOOTHING", _eps);
}

void WaterSteamPropertyPackage::buildState(Block& unit, Port& port, bool hasPhaseEquilibrium) const
{
	addStateVariables(unit, port);
}

double WaterSteamPropertyPackage::saturationTemperature(double pressure) const
{
	return 1.0 / (1.0 / Tboil - (R / HvapRef) * std::log(pressure / Pref));
}

double WaterSteamPropertyPackage::heatOfVaporization(double temperature) const
{
	return HvapRef * std::pow((Tcrit - temperature) / (Tcrit - Tboil), 0.38);
}

double WaterSteamPropertyPackage::enthalpySaturatedLiquid(double pressure) const
{
	return _cpLiq * (saturationTemperature(pressure) - Ttriple);
}

double WaterSteamPropertyPackage::enthalpySaturatedVapor(double pressure) const
{
	const double tSat = saturationTemperature(pressure);
	return _cpLiq * (tSat - Ttriple) + heatOfVaporization(tSat);
}

double WaterSteamPropertyPackage::temperature(double enthalpy, double pressure) const
{
	const double tSat = saturationTemperature(pressure);
	const double hLiq = _cpLiq * (tSat - Ttriple);
	const double hVap = hLiq + heatOfVaporization(tSat);
	return tSat + smoothMin0((enthalpy - hLiq) / _cpLiq, _eps) + smoothMax0((enthalpy - hVap) / _cpVap, _eps);
}


LiquidWaterPropertyPackage::LiquidWaterPropertyPackage() : WaterSteamPropertyPackage() { }
LiquidWaterPropertyPackage::~LiquidWaterPropertyPackage() SEQUIN_NOEXCEPT { }

void LiquidWaterPropertyPackage::configure(const config::Configuration& args)
{
	checkArguments(args, std::vector<std::string>{"CP_LIQ"}, name());
	readPositive(args, "CP_LIQ", _cpLiq);
}

void LiquidWaterPropertyPackage::buildState(Block& unit, Port& port, bool hasPhaseEquilibrium) const
{
	if (hasPhaseEquilibrium)
		throw ConfigurationException(std::string("Property package ") + name() + " does not support phase equilibrium (port " + port.path() + ")");

	addStateVariables(unit, port);
}

double LiquidWaterPropertyPackage::temperature(double enthalpy, double pressure) const
{
	return Ttriple + enthalpy / _cpLiq;
}

} // namespace model

} // namespace sequin
