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

#include <catch.hpp>
#include "Approx.hpp"

#include "model/property/WaterSteamPackage.hpp"
#include "model/Block.hpp"
#include "model/Port.hpp"
#include "config/Configuration.hpp"
#include "PropertyPackageFactory.hpp"
#include "sequin/Exceptions.hpp"

#include <memory>
#include <string>
#include <vector>

TEST_CASE("Water steam saturation properties", "[PropertyPackage]")
{
	sequin::model::WaterSteamPropertyPackage pkg;
	pkg.configure(sequin::config::Configuration());

	CHECK(std::string(pkg.name()) == "WATER_STEAM");

	// Normal boiling point
	CHECK(pkg.saturationTemperature(101325.0) == RelApprox(373.124));
	CHECK(pkg.enthalpySaturatedLiquid(101325.0) == RelApprox(75.327 * (373.124 - 273.16)));
	CHECK(pkg.enthalpySaturatedVapor(101325.0) == RelApprox(75.327 * (373.124 - 273.16) + 40657.0));

	CHECK(pkg.saturationTemperature(201325.0) == RelApprox(393.7526758936952));
	CHECK(pkg.enthalpySaturatedLiquid(201325.0) == RelApprox(9083.884497044375));
	CHECK(pkg.enthalpySaturatedVapor(201325.0) == RelApprox(48549.29076055364));

	// Saturation temperature increases with pressure
	CHECK(pkg.saturationTemperature(2e5) > pkg.saturationTemperature(1e5));
	CHECK(pkg.saturationTemperature(1e5) > pkg.saturationTemperature(5e4));
}

TEST_CASE("Water steam temperature covers all phase regions", "[PropertyPackage]")
{
	sequin::model::WaterSteamPropertyPackage pkg;
	pkg.configure(sequin::config::Configuration());

	// Subcooled liquid
	CHECK(pkg.temperature(3000.0, 101325.0) == RelApprox(312.9863175035701));

	// Two-phase region stays at saturation temperature
	const double hLiq = pkg.enthalpySaturatedLiquid(101325.0);
	CHECK(pkg.temperature(hLiq + 20000.0, 101325.0) == RelApprox(373.12399494100197));

	// Superheated vapor
	CHECK(pkg.temperature(60000.0, 201325.0) == RelApprox(711.8279367061746));

	// Monotone in enthalpy
	double prev = pkg.temperature(0.0, 101325.0);
	for (int i = 1; i <= 20; ++i)
	{
		const double cur = pkg.temperature(i * 3000.0, 101325.0);
		CHECK(cur >= prev);
		prev = cur;
	}
}

TEST_CASE("Property package arguments", "[PropertyPackage]")
{
	SECTION("Heat capacity is configurable")
	{
		sequin::model::WaterSteamPropertyPackage pkg;
		pkg.configure(sequin::config::Configuration().with("CP_LIQ", 80.0));
		CHECK(pkg.enthalpySaturatedLiquid(101325.0) == RelApprox(80.0 * (373.124 - 273.16)));
	}

	SECTION("Unknown argument")
	{
		sequin::model::WaterSteamPropertyPackage pkg;
		CHECK_THROWS_AS(pkg.configure(sequin::config::Configuration().with("CP_GAS", 80.0)), sequin::ConfigurationException);
	}

	SECTION("Non-positive argument")
	{
		sequin::model::WaterSteamPropertyPackage pkg;
		CHECK_THROWS_AS(pkg.configure(sequin::config::Configuration().with("SMOOTHING", 0.0)), sequin::ConfigurationException);
	}

	SECTION("Liquid water only knows the liquid heat capacity")
	{
		sequin::model::LiquidWaterPropertyPackage pkg;
		CHECK_THROWS_AS(pkg.configure(sequin::config::Configuration().with("CP_VAP", 30.0)), sequin::ConfigurationException);
		pkg.configure(sequin::config::Configuration().with("CP_LIQ", 75.0));
		CHECK(pkg.temperature(7500.0, 101325.0) == RelApprox(373.16));
	}
}

TEST_CASE("Property package builds port state", "[PropertyPackage]")
{
	sequin::model::Block unit("unit", nullptr);
	std::unique_ptr<sequin::model::Port> inlet(new sequin::model::Port("inlet", sequin::model::PortDirection::Inlet, &unit));

	sequin::model::WaterSteamPropertyPackage steam;
	steam.buildState(unit, *inlet, true);

	REQUIRE(inlet->numMembers() == 3);
	CHECK(inlet->member("flow_mol") == unit.variable("inlet.flow_mol"));
	CHECK(inlet->member("enth_mol") == unit.variable("inlet.enth_mol"));
	CHECK(inlet->member("pressure") == unit.variable("inlet.pressure"));
	CHECK(inlet->member("flow_mol")->lowerBound() == 0.0);
	CHECK(inlet->member("pressure")->lowerBound() == 0.0);

	std::unique_ptr<sequin::model::Port> outlet(new sequin::model::Port("outlet", sequin::model::PortDirection::Outlet, &unit));
	sequin::model::LiquidWaterPropertyPackage water;
	CHECK_THROWS_AS(water.buildState(unit, *outlet, true), sequin::ConfigurationException);
	CHECK(unit.variable("outlet.flow_mol") == nullptr);

	water.buildState(unit, *outlet, false);
	CHECK(outlet->numMembers() == 3);
	CHECK(sequin::model::compatible(*inlet, *outlet));
}

TEST_CASE("Property package factory", "[PropertyPackage]")
{
	sequin::PropertyPackageFactory factory;

	const std::vector<std::string> names = factory.names();
	REQUIRE(names.size() == 2);
	CHECK(names[0] == "LIQUID_WATER");
	CHECK(names[1] == "WATER_STEAM");

	CHECK(factory.exists("WATER_STEAM"));
	CHECK_FALSE(factory.exists("IAPWS95"));
	CHECK(factory.create("IAPWS95") == nullptr);

	std::unique_ptr<sequin::model::IPropertyPackage> pkg(factory.create("LIQUID_WATER"));
	REQUIRE(pkg);
	CHECK(std::string(pkg->name()) == "LIQUID_WATER");

	CHECK_THROWS_AS(factory.registerModel("WATER_STEAM", []() { return new sequin::model::WaterSteamPropertyPackage(); }), sequin::InvalidParameterException);
}
