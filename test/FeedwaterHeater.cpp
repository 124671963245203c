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

#include "UnitOperationTests.hpp"

#include "sequin/Model.hpp"
#include "sequin/Exceptions.hpp"
#include "common/JsonParameterProvider.hpp"
#include "ModelBuilderImpl.hpp"
#include "SolverAdapter.hpp"
#include "SequentialInitializer.hpp"
#include "model/unit/FeedwaterHeater.hpp"
#include "model/unit/HeatExchanger.hpp"
#include "model/property/PropertyPackage.hpp"
#include "model/Variable.hpp"

#include <memory>
#include <sstream>
#include <string>

using sequin::test::unitoperation::createAndConfigureUnit;
using sequin::test::unitoperation::fixPort;
using sequin::test::unitoperation::fixHeatTransfer;
using sequin::test::unitoperation::checkHeatExchangerBalances;

namespace
{
	std::string feedwaterHeaterJson(bool hasDesuperheat, bool hasDrainMixer, bool hasDrainCooling)
	{
		std::ostringstream oss;
		oss << std::boolalpha << "{ \"UNIT_TYPE\": \"FEEDWATER_HEATER\", \"NAME\": \"fwh\", \"HAS_DESUPERHEAT\": " << hasDesuperheat
			<< ", \"HAS_DRAIN_MIXER\": " << hasDrainMixer << ", \"HAS_DRAIN_COOLING\": " << hasDrainCooling << " }";
		return oss.str();
	}

	void specifyFeedwaterHeater(sequin::IModel& unit, bool hasDesuperheat, bool hasDrainMixer, bool hasDrainCooling)
	{
		// Extraction steam flow is determined by the condensing section
		REQUIRE(unit.setValue("inlet_1.flow_mol", 100.0));
		REQUIRE(unit.fixVariable("inlet_1.enth_mol", 60000.0));
		REQUIRE(unit.fixVariable("inlet_1.pressure", 201325.0));

		fixPort(unit, "inlet_2", 400.0, 3000.0, 101325.0);
		if (hasDrainMixer)
			fixPort(unit, "drain", 1.0, 20000.0, 201325.0);

		fixHeatTransfer(unit, "condense.", 1000.0, 100.0);
		if (hasDesuperheat)
			fixHeatTransfer(unit, "desuperheat.", 1000.0, 10.0);
		if (hasDrainCooling)
			fixHeatTransfer(unit, "cooling.", 1000.0, 10.0);
	}

	sequin::model::FeedwaterHeater& asFeedwaterHeater(sequin::IModel* unit)
	{
		sequin::model::FeedwaterHeater* const fwh = dynamic_cast<sequin::model::FeedwaterHeater*>(unit);
		REQUIRE(fwh);
		return *fwh;
	}

	sequin::model::HeatExchanger& sectionAsHeatExchanger(const sequin::model::FeedwaterHeater& fwh, const std::string& name)
	{
		sequin::model::HeatExchanger* const hx = dynamic_cast<sequin::model::HeatExchanger*>(fwh.section(name));
		REQUIRE(hx);
		return *hx;
	}

	bool connects(const sequin::model::Arc* arc, const sequin::model::Port* src, const sequin::model::Port* dst)
	{
		return arc && (&arc->source() == src) && (&arc->destination() == dst);
	}
}

TEST_CASE("FeedwaterHeater assembles all section combinations", "[FeedwaterHeater],[UnitOp]")
{
	sequin::ModelBuilder mb;

	for (int i = 0; i < 8; ++i)
	{
		const bool hasDesuperheat = (i & 1) != 0;
		const bool hasDrainMixer = (i & 2) != 0;
		const bool hasDrainCooling = (i & 4) != 0;
		CAPTURE(hasDesuperheat);
		CAPTURE(hasDrainMixer);
		CAPTURE(hasDrainCooling);

		std::unique_ptr<sequin::IModel> unit(createAndConfigureUnit(feedwaterHeaterJson(hasDesuperheat, hasDrainMixer, hasDrainCooling), mb));
		sequin::model::FeedwaterHeater& fwh = asFeedwaterHeater(unit.get());

		const unsigned int nSections = 1 + (hasDesuperheat ? 1 : 0) + (hasDrainMixer ? 1 : 0) + (hasDrainCooling ? 1 : 0);
		CHECK(fwh.sections().size() == nSections);
		CHECK((fwh.section("desuperheat") != nullptr) == hasDesuperheat);
		CHECK((fwh.section("drain_mix") != nullptr) == hasDrainMixer);
		CHECK((fwh.section("cooling") != nullptr) == hasDrainCooling);
		REQUIRE(fwh.section("condense"));
		CHECK(std::string(fwh.section("condense")->unitType()) == "CONDENSING_SECTION");

		// Steam path has one arc more than sections on it, drain adds one, feedwater path skips the mixer
		const unsigned int nArcs = (nSections + 1) + (hasDrainMixer ? 1 : 0) + (nSections - (hasDrainMixer ? 1 : 0) + 1);
		CHECK(fwh.arcs().size() == nArcs);

		CHECK(unit->hasVariable("drain.flow_mol") == hasDrainMixer);
		CHECK(fwh.inlets().size() == (hasDrainMixer ? 3u : 2u));

		// One step per section plus the final copy to the outlets
		REQUIRE(fwh.schedule().size() == nSections + 1);
		for (std::size_t s = 0; s < nSections; ++s)
			CHECK(fwh.schedule()[s].unit == fwh.sections()[s]);
		CHECK(fwh.schedule().back().unit == nullptr);
		CHECK(fwh.schedule().back().seeds.size() == 2);

		specifyFeedwaterHeater(*unit, hasDesuperheat, hasDrainMixer, hasDrainCooling);
		CHECK(unit->degreesOfFreedom() == 0);
	}
}

TEST_CASE("FeedwaterHeater section order and arcs", "[FeedwaterHeater],[UnitOp]")
{
	sequin::ModelBuilder mb;
	std::unique_ptr<sequin::IModel> unit(createAndConfigureUnit(feedwaterHeaterJson(true, true, true), mb));
	sequin::model::FeedwaterHeater& fwh = asFeedwaterHeater(unit.get());

	REQUIRE(fwh.sections().size() == 4);
	CHECK(fwh.sections()[0]->name() == "desuperheat");
	CHECK(fwh.sections()[1]->name() == "drain_mix");
	CHECK(fwh.sections()[2]->name() == "condense");
	CHECK(fwh.sections()[3]->name() == "cooling");
	CHECK(std::string(fwh.section("drain_mix")->unitType()) == "MIXER");
	CHECK(std::string(fwh.section("cooling")->unitType()) == "HEAT_EXCHANGER");

	sequin::model::UnitModel* const ds = fwh.section("desuperheat");
	sequin::model::UnitModel* const mix = fwh.section("drain_mix");
	sequin::model::UnitModel* const cd = fwh.section("condense");
	sequin::model::UnitModel* const co = fwh.section("cooling");

	// Steam path
	CHECK(connects(fwh.arc("inlet_1_to_desuperheat_inlet_1"), fwh.port("inlet_1"), ds->port("inlet_1")));
	CHECK(connects(fwh.arc("desuperheat_outlet_1_to_drain_mix_steam"), ds->port("outlet_1"), mix->port("steam")));
	CHECK(connects(fwh.arc("drain_to_drain_mix_drain"), fwh.port("drain"), mix->port("drain")));
	CHECK(connects(fwh.arc("drain_mix_outlet_to_condense_inlet_1"), mix->port("outlet"), cd->port("inlet_1")));
	CHECK(connects(fwh.arc("condense_outlet_1_to_cooling_inlet_1"), cd->port("outlet_1"), co->port("inlet_1")));
	CHECK(connects(fwh.arc("cooling_outlet_1_to_outlet_1"), co->port("outlet_1"), fwh.port("outlet_1")));

	// Feedwater path runs countercurrent to the steam
	CHECK(connects(fwh.arc("inlet_2_to_cooling_inlet_2"), fwh.port("inlet_2"), co->port("inlet_2")));
	CHECK(connects(fwh.arc("cooling_outlet_2_to_condense_inlet_2"), co->port("outlet_2"), cd->port("inlet_2")));
	CHECK(connects(fwh.arc("condense_outlet_2_to_desuperheat_inlet_2"), cd->port("outlet_2"), ds->port("inlet_2")));
	CHECK(connects(fwh.arc("desuperheat_outlet_2_to_outlet_2"), ds->port("outlet_2"), fwh.port("outlet_2")));

	// Arcs are expanded into one equality per port member
	CHECK(fwh.constraint("inlet_1_to_desuperheat_inlet_1.flow_mol"));
	CHECK(fwh.constraint("inlet_1_to_desuperheat_inlet_1.enth_mol"));
	CHECK(fwh.constraint("inlet_1_to_desuperheat_inlet_1.pressure"));

	// Sections get a default area
	CHECK(unit->getValue("desuperheat.area") == 10.0);
	CHECK(unit->getValue("cooling.area") == 10.0);
}

TEST_CASE("FeedwaterHeater connects the boundary to the first present section", "[FeedwaterHeater],[UnitOp]")
{
	sequin::ModelBuilder mb;

	SECTION("No desuperheat and no mixer")
	{
		std::unique_ptr<sequin::IModel> unit(createAndConfigureUnit(feedwaterHeaterJson(false, false, true), mb));
		sequin::model::FeedwaterHeater& fwh = asFeedwaterHeater(unit.get());

		CHECK(connects(fwh.arc("inlet_1_to_condense_inlet_1"), fwh.port("inlet_1"), fwh.section("condense")->port("inlet_1")));
		CHECK(connects(fwh.arc("condense_outlet_2_to_outlet_2"), fwh.section("condense")->port("outlet_2"), fwh.port("outlet_2")));
		CHECK(fwh.arc("inlet_1_to_desuperheat_inlet_1") == nullptr);
	}

	SECTION("No drain cooling")
	{
		std::unique_ptr<sequin::IModel> unit(createAndConfigureUnit(feedwaterHeaterJson(true, false, false), mb));
		sequin::model::FeedwaterHeater& fwh = asFeedwaterHeater(unit.get());

		CHECK(connects(fwh.arc("condense_outlet_1_to_outlet_1"), fwh.section("condense")->port("outlet_1"), fwh.port("outlet_1")));
		CHECK(connects(fwh.arc("inlet_2_to_condense_inlet_2"), fwh.port("inlet_2"), fwh.section("condense")->port("inlet_2")));
		CHECK(connects(fwh.arc("desuperheat_outlet_1_to_condense_inlet_1"), fwh.section("desuperheat")->port("outlet_1"), fwh.section("condense")->port("inlet_1")));
	}

	SECTION("Condensing section only")
	{
		std::unique_ptr<sequin::IModel> unit(createAndConfigureUnit(feedwaterHeaterJson(false, false, false), mb));
		sequin::model::FeedwaterHeater& fwh = asFeedwaterHeater(unit.get());

		CHECK(fwh.arcs().size() == 4);
		CHECK(connects(fwh.arc("inlet_1_to_condense_inlet_1"), fwh.port("inlet_1"), fwh.section("condense")->port("inlet_1")));
		CHECK(connects(fwh.arc("condense_outlet_1_to_outlet_1"), fwh.section("condense")->port("outlet_1"), fwh.port("outlet_1")));
		CHECK(connects(fwh.arc("inlet_2_to_condense_inlet_2"), fwh.port("inlet_2"), fwh.section("condense")->port("inlet_2")));
		CHECK(connects(fwh.arc("condense_outlet_2_to_outlet_2"), fwh.section("condense")->port("outlet_2"), fwh.port("outlet_2")));
	}
}

TEST_CASE("FeedwaterHeater recipe orders the schedule along the steam path", "[FeedwaterHeater]")
{
	const sequin::model::AssemblyRecipe r = sequin::model::FeedwaterHeater::recipe(true, true, true);

	REQUIRE(r.sections.size() == 4);
	REQUIRE(r.schedule.size() == 5);
	CHECK(r.schedule[0].unit == "desuperheat");
	CHECK(r.schedule[1].unit == "drain_mix");
	CHECK(r.schedule[2].unit == "condense");
	CHECK(r.schedule[3].unit == "cooling");
	CHECK(r.schedule[4].unit.empty());

	// Mixer is seeded by the desuperheat outlet and the external drain
	REQUIRE(r.schedule[1].seeds.size() == 2);
	CHECK(r.schedule[1].seeds[0].first.unit == "desuperheat");
	CHECK(r.schedule[1].seeds[0].first.port == "outlet_1");
	CHECK(r.schedule[1].seeds[1].first.unit.empty());
	CHECK(r.schedule[1].seeds[1].first.port == "drain");

	// Only arcs on the steam path order the schedule
	for (const sequin::model::ArcSpec& arc : r.arcs)
	{
		const bool onWaterPath = (arc.source.port == "inlet_2") || (arc.source.port == "outlet_2");
		CHECK(arc.primary != onWaterPath);
	}
}

TEST_CASE("FeedwaterHeater property package inheritance", "[FeedwaterHeater],[UnitOp],[PropertyPackage]")
{
	sequin::ModelBuilder mb;

	SECTION("Unit package is inherited by all sections")
	{
		std::unique_ptr<sequin::IModel> unit(createAndConfigureUnit(R"json({
			"UNIT_TYPE": "FEEDWATER_HEATER",
			"property_package_args": { "CP_LIQ": 80.0 }
		})json", mb));
		sequin::model::FeedwaterHeater& fwh = asFeedwaterHeater(unit.get());

		CHECK(fwh.configuration().getString("PROPERTY_PACKAGE") == "WATER_STEAM");
		const double hLiq = 80.0 * (373.124 - 273.16);
		for (const char* name : {"desuperheat", "condense", "cooling"})
		{
			sequin::model::HeatExchanger& hx = sectionAsHeatExchanger(fwh, name);
			CHECK(std::string(hx.hotSidePackage()->name()) == "WATER_STEAM");
			CHECK(hx.hotSidePackage()->enthalpySaturatedLiquid(101325.0) == RelApprox(hLiq));
			CHECK(hx.coldSidePackage()->enthalpySaturatedLiquid(101325.0) == RelApprox(hLiq));
		}
		CHECK(fwh.section("drain_mix")->configuration().getString("PROPERTY_PACKAGE") == "WATER_STEAM");
	}

	SECTION("Section package overrides the unit package")
	{
		std::unique_ptr<sequin::IModel> unit(createAndConfigureUnit(R"json({
			"UNIT_TYPE": "FEEDWATER_HEATER",
			"PROPERTY_PACKAGE": "LIQUID_WATER",
			"desuperheat": { "PROPERTY_PACKAGE": "WATER_STEAM" },
			"condense": { "side_1": { "PROPERTY_PACKAGE": "WATER_STEAM" } }
		})json", mb));
		sequin::model::FeedwaterHeater& fwh = asFeedwaterHeater(unit.get());

		CHECK(std::string(sectionAsHeatExchanger(fwh, "desuperheat").hotSidePackage()->name()) == "WATER_STEAM");
		CHECK(std::string(sectionAsHeatExchanger(fwh, "desuperheat").coldSidePackage()->name()) == "WATER_STEAM");
		CHECK(std::string(sectionAsHeatExchanger(fwh, "condense").hotSidePackage()->name()) == "WATER_STEAM");
		CHECK(std::string(sectionAsHeatExchanger(fwh, "condense").coldSidePackage()->name()) == "LIQUID_WATER");
		CHECK(std::string(sectionAsHeatExchanger(fwh, "cooling").hotSidePackage()->name()) == "LIQUID_WATER");

		// Mixer follows the steam side of the condensing section
		CHECK(fwh.section("drain_mix")->configuration().getString("PROPERTY_PACKAGE") == "WATER_STEAM");
	}
}

TEST_CASE("FeedwaterHeater configuration errors", "[FeedwaterHeater],[UnitOp]")
{
	sequin::ModelBuilder mb;

	SECTION("Holdup")
	{
		sequin::JsonParameterProvider jpp(R"json({ "UNIT_TYPE": "FEEDWATER_HEATER", "HAS_HOLDUP": true })json");
		CHECK_THROWS_AS(mb.createUnit(jpp), sequin::ConfigurationException);
	}

	SECTION("Unknown option")
	{
		sequin::JsonParameterProvider jpp(R"json({ "UNIT_TYPE": "FEEDWATER_HEATER", "HAS_REHEAT": true })json");
		CHECK_THROWS_AS(mb.createUnit(jpp), sequin::ConfigurationException);
	}

	SECTION("Invalid section option")
	{
		sequin::JsonParameterProvider jpp(R"json({ "UNIT_TYPE": "FEEDWATER_HEATER", "condense": { "FLOW_PATTERN": "CROSSFLOW" } })json");
		CHECK_THROWS_AS(mb.createUnit(jpp), sequin::ConfigurationException);
	}

	SECTION("Unknown unit type")
	{
		sequin::JsonParameterProvider jpp(R"json({ "UNIT_TYPE": "CLOSED_FEEDWATER_HEATER" })json");
		CHECK(mb.createUnit(jpp) == nullptr);
	}
}

TEST_CASE("FeedwaterHeater initialization without drain mixer", "[FeedwaterHeater],[UnitOp],[Initialization]")
{
	sequin::ModelBuilder mb;
	std::unique_ptr<sequin::IModel> unit(createAndConfigureUnit(feedwaterHeaterJson(true, false, true), mb));
	specifyFeedwaterHeater(*unit, true, false, true);
	REQUIRE(unit->degreesOfFreedom() == 0);

	sequin::model::FeedwaterHeater& fwh = asFeedwaterHeater(unit.get());
	sequin::NonlinearSolverAdapter solver;
	sequin::JsonParameterProvider options("{}");
	const sequin::InitializationResult res = fwh.initialize(solver, options);

	REQUIRE(res.result.status == sequin::SolverStatus::Optimal);
	CHECK(res.stage == sequin::InitializationStage::SnapshotRestored);
	CHECK(res.numSubSolves == 4);
	CHECK(res.numNonOptimalSubSolves == 0);

	// Extraction flow such that the condensate leaves as saturated liquid
	// Reference value of the smooth WATER_STEAM package, an IAPWS-95 water model yields about 98.3 mol/s
	CHECK(unit->getValue("inlet_1.flow_mol") == RelApprox(99.63877515357686).margin(0.05));
	const double pCond = unit->getValue("condense.outlet_1.pressure");
	CHECK(unit->getValue("condense.outlet_1.enth_mol") == RelApprox(sectionAsHeatExchanger(fwh, "condense").hotSidePackage()->enthalpySaturatedLiquid(pCond)).epsilon(1e-4));

	CHECK(unit->getValue("desuperheat.heat_duty") == RelApprox(1145542.4145752948).epsilon(1e-3));
	CHECK(unit->getValue("condense.heat_duty") == RelApprox(3927676.969717249).epsilon(1e-3));
	CHECK(unit->getValue("cooling.heat_duty") == RelApprox(421880.058433478).epsilon(1e-3));
	CHECK(unit->getValue("outlet_2.enth_mol") == RelApprox(16737.74860681505).epsilon(1e-3));

	checkHeatExchangerBalances(*unit, "desuperheat.", 1e-5);
	checkHeatExchangerBalances(*unit, "condense.", 1e-5);
	checkHeatExchangerBalances(*unit, "cooling.", 1e-5);

	// Outlets agree with the last sections
	CHECK(unit->getValue("outlet_1.enth_mol") == RelApprox(unit->getValue("cooling.outlet_1.enth_mol")).epsilon(1e-6));
	CHECK(unit->getValue("outlet_2.flow_mol") == RelApprox(400.0).epsilon(1e-6));

	// Specification and constraint states are restored
	CHECK_FALSE(unit->isFixed("inlet_1.flow_mol"));
	CHECK(unit->isFixed("inlet_1.enth_mol"));
	CHECK_FALSE(unit->isFixed("condense.inlet_1.flow_mol"));
	CHECK_FALSE(unit->isFixed("condense.inlet_2.enth_mol"));
	CHECK(fwh.section("condense")->constraint("extraction_rate_constraint")->isActive());
	CHECK(unit->degreesOfFreedom() == 0);
}

TEST_CASE("FeedwaterHeater initialization with all sections", "[FeedwaterHeater],[UnitOp],[Initialization]")
{
	sequin::ModelBuilder mb;
	std::unique_ptr<sequin::IModel> unit(createAndConfigureUnit(feedwaterHeaterJson(true, true, true), mb));
	specifyFeedwaterHeater(*unit, true, true, true);

	sequin::model::FeedwaterHeater& fwh = asFeedwaterHeater(unit.get());
	sequin::NonlinearSolverAdapter solver;
	sequin::JsonParameterProvider options("{}");
	const sequin::InitializationResult res = fwh.initialize(solver, options);

	REQUIRE(res.result.status == sequin::SolverStatus::Optimal);
	CHECK(res.numSubSolves == 5);

	CHECK(unit->getValue("inlet_1.flow_mol") == RelApprox(99.38835346589806).margin(0.05));
	CHECK(unit->getValue("condense.heat_duty") == RelApprox(3925854.2729882626).epsilon(1e-3));

	// Mixer adds the drain to the steam
	CHECK(unit->getValue("drain_mix.outlet.flow_mol") == RelApprox(unit->getValue("inlet_1.flow_mol") + 1.0).epsilon(1e-6));
	CHECK(unit->getValue("outlet_1.flow_mol") == RelApprox(unit->getValue("inlet_1.flow_mol") + 1.0).epsilon(1e-6));
	CHECK(unit->isFixed("drain.enth_mol"));
	CHECK_FALSE(unit->isFixed("drain_mix.drain.enth_mol"));
}

TEST_CASE("FeedwaterHeater initialization through the model interface", "[FeedwaterHeater],[UnitOp],[Initialization]")
{
	sequin::ModelBuilder mb;
	std::unique_ptr<sequin::IModel> unit(createAndConfigureUnit(feedwaterHeaterJson(false, false, false), mb));
	specifyFeedwaterHeater(*unit, false, false, false);
	fixHeatTransfer(*unit, "condense.", 100.0, 100.0);

	sequin::JsonParameterProvider options(R"json({ "TOLERANCE": 1e-8 })json");
	REQUIRE(unit->initialize(options) == sequin::SolverStatus::Optimal);

	const double pCond = unit->getValue("condense.outlet_1.pressure");
	sequin::model::FeedwaterHeater& fwh = asFeedwaterHeater(unit.get());
	CHECK(unit->getValue("outlet_1.enth_mol") == RelApprox(sectionAsHeatExchanger(fwh, "condense").hotSidePackage()->enthalpySaturatedLiquid(pCond)).epsilon(1e-4));
	CHECK(unit->getValue("inlet_1.flow_mol") == RelApprox(35.37504650843187).epsilon(1e-3));
	checkHeatExchangerBalances(*unit, "condense.", 1e-5);

	// Initialized model is a solution of the full system
	REQUIRE(unit->solve(options) == sequin::SolverStatus::Optimal);
}

TEST_CASE("Mixer combines steam and drain", "[Mixer],[UnitOp]")
{
	sequin::ModelBuilder mb;

	SECTION("Pressure of the steam inlet")
	{
		std::unique_ptr<sequin::IModel> unit(createAndConfigureUnit(R"json({ "UNIT_TYPE": "MIXER" })json", mb));
		CHECK(std::string(unit->unitName()) == "mixer");
		fixPort(*unit, "steam", 100.0, 48000.0, 201325.0);
		fixPort(*unit, "drain", 1.0, 20000.0, 201325.0);
		REQUIRE(unit->degreesOfFreedom() == 0);

		sequin::JsonParameterProvider options("{}");
		REQUIRE(unit->initialize(options) == sequin::SolverStatus::Optimal);
		CHECK(unit->getValue("outlet.flow_mol") == RelApprox(101.0).epsilon(1e-6));
		CHECK(unit->getValue("outlet.enth_mol") == RelApprox((100.0 * 48000.0 + 20000.0) / 101.0).epsilon(1e-6));
		CHECK(unit->getValue("outlet.pressure") == RelApprox(201325.0).epsilon(1e-6));
	}

	SECTION("Equalized pressures")
	{
		std::unique_ptr<sequin::IModel> unit(createAndConfigureUnit(R"json({ "UNIT_TYPE": "MIXER", "MOMENTUM_MIXING": "EQUALIZE" })json", mb));
		fixPort(*unit, "steam", 100.0, 48000.0, 201325.0);
		fixPort(*unit, "drain", 1.0, 20000.0, 201325.0);
		CHECK(unit->degreesOfFreedom() == -1);
		REQUIRE(unit->unfixVariable("drain.pressure"));
		CHECK(unit->degreesOfFreedom() == 0);
	}

	SECTION("Unknown momentum mixing")
	{
		sequin::JsonParameterProvider jpp(R"json({ "UNIT_TYPE": "MIXER", "MOMENTUM_MIXING": "MINIMIZE" })json");
		CHECK_THROWS_AS(mb.createUnit(jpp), sequin::ConfigurationException);
	}
}
