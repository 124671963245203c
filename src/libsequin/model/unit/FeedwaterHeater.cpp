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

#include "model/unit/FeedwaterHeater.hpp"
#include "model/unit/HeatExchanger.hpp"
#include "model/unit/Mixer.hpp"
#include "model/property/PropertyPackage.hpp"
#include "ConfigurationHelper.hpp"

namespace
{
	sequin::model::PortRef ref(const std::string& unit, const std::string& port)
	{
		sequin::model::PortRef r;
		r.unit = unit;
		r.port = port;
		return r;
	}

	std::string label(const sequin::model::PortRef& r)
	{
		if (r.unit.empty())
			return r.port;
		return r.unit + "_" + r.port;
	}

	void connect(sequin::model::AssemblyRecipe& recipe, const sequin::model::PortRef& src, const sequin::model::PortRef& dst, bool primary)
	{
		sequin::model::ArcSpec arc;
		arc.name = label(src) + "_to_" + label(dst);
		arc.source = src;
		arc.destination = dst;
		arc.primary = primary;
		recipe.arcs.push_back(arc);
	}

	void addStep(sequin::model::AssemblyRecipe& recipe, const std::string& unit, const std::vector<std::pair<sequin::model::PortRef, sequin::model::PortRef>>& seeds)
	{
		sequin::model::StepSpec step;
		step.unit = unit;
		step.seeds = seeds;
		recipe.schedule.push_back(step);
	}
}

namespace sequin
{

namespace model
{

FeedwaterHeater::FeedwaterHeater(const std::string& name, Block* parent) : CompositeUnit(name, parent) { }

FeedwaterHeater::~FeedwaterHeater() SEQUIN_NOEXCEPT { }

config::ConfigSchema FeedwaterHeater::schema(const IConfigHelper& helper) const
{
	config::ConfigSchema schema = UnitModel::commonSchema(_name, helper);
	schema.declareBool("HAS_DESUPERHEAT", true, "Add a desuperheat section")
		.declareBool("HAS_DRAIN_COOLING", true, "Add a drain cooling section")
		.declareBool("HAS_DRAIN_MIXER", true, "Add a mixer to the inlet of the condensing section")
		.declareBlock("condense", HeatExchanger::heatExchangerSchema("condense", helper), "Options of the condensing section")
		.declareBlock("desuperheat", HeatExchanger::heatExchangerSchema("desuperheat", helper), "Options of the desuperheat section")
		.declareBlock("cooling", HeatExchanger::heatExchangerSchema("cooling", helper), "Options of the drain cooling section");
	return schema;
}

AssemblyRecipe FeedwaterHeater::recipe(bool hasDesuperheat, bool hasDrainMixer, bool hasDrainCooling)
{
	AssemblyRecipe r;
	if (hasDesuperheat)
		r.sections.push_back("desuperheat");
	if (hasDrainMixer)
		r.sections.push_back("drain_mix");
	r.sections.push_back("condense");
	if (hasDrainCooling)
		r.sections.push_back("cooling");

	// Steam path
	PortRef steam = ref("", "inlet_1");
	if (hasDesuperheat)
	{
		connect(r, steam, ref("desuperheat", "inlet_1"), true);
		steam = ref("desuperheat", "outlet_1");
	}
	if (hasDrainMixer)
	{
		connect(r, steam, ref("drain_mix", "steam"), true);
		connect(r, ref("", "drain"), ref("drain_mix", "drain"), true);
		steam = ref("drain_mix", "outlet");
	}
	connect(r, steam, ref("condense", "inlet_1"), true);
	steam = ref("condense", "outlet_1");
	if (hasDrainCooling)
	{
		connect(r, steam, ref("cooling", "inlet_1"), true);
		steam = ref("cooling", "outlet_1");
	}
	connect(r, steam, ref("", "outlet_1"), true);

	// Feedwater path
	PortRef water = ref("", "inlet_2");
	if (hasDrainCooling)
	{
		connect(r, water, ref("cooling", "inlet_2"), false);
		water = ref("cooling", "outlet_2");
	}
	connect(r, water, ref("condense", "inlet_2"), false);
	water = ref("condense", "outlet_2");
	if (hasDesuperheat)
	{
		connect(r, water, ref("desuperheat", "inlet_2"), false);
		water = ref("desuperheat", "outlet_2");
	}
	connect(r, water, ref("", "outlet_2"), false);

	// Schedule
	typedef std::vector<std::pair<PortRef, PortRef>> SeedList;
	const PortRef feed = ref("", "inlet_2");

	steam = ref("", "inlet_1");
	if (hasDesuperheat)
	{
		addStep(r, "desuperheat", SeedList{std::make_pair(steam, ref("desuperheat", "inlet_1")), std::make_pair(feed, ref("desuperheat", "inlet_2"))});
		steam = ref("desuperheat", "outlet_1");
	}
	if (hasDrainMixer)
	{
		addStep(r, "drain_mix", SeedList{std::make_pair(steam, ref("drain_mix", "steam")), std::make_pair(ref("", "drain"), ref("drain_mix", "drain"))});
		steam = ref("drain_mix", "outlet");
	}
	addStep(r, "condense", SeedList{std::make_pair(steam, ref("condense", "inlet_1")), std::make_pair(feed, ref("condense", "inlet_2"))});
	steam = ref("condense", "outlet_1");
	if (hasDrainCooling)
	{
		addStep(r, "cooling", SeedList{std::make_pair(steam, ref("cooling", "inlet_1")), std::make_pair(feed, ref("cooling", "inlet_2"))});
		steam = ref("cooling", "outlet_1");
	}

	// Copy the results to the outlets of the feedwater heater
	addStep(r, "", SeedList{std::make_pair(steam, ref("", "outlet_1")), std::make_pair(water, ref("", "outlet_2"))});

	return r;
}

void FeedwaterHeater::buildUnit(const config::Configuration& cfg, const IConfigHelper& helper)
{
	const bool hasDesuperheat = cfg.getBool("HAS_DESUPERHEAT");
	const bool hasDrainMixer = cfg.getBool("HAS_DRAIN_MIXER");
	const bool hasDrainCooling = cfg.getBool("HAS_DRAIN_COOLING");

	// Top level ports use the packages of the condensing section
	const config::Configuration condenseCfg = resolvePropertyPackage(cfg.scope("condense"), cfg, helper);
	const config::Configuration steamCfg = resolvePropertyPackage(condenseCfg.scope("side_1"), condenseCfg, helper);
	const config::Configuration waterCfg = resolvePropertyPackage(condenseCfg.scope("side_2"), condenseCfg, helper);
	IPropertyPackage* const steamPkg = createPropertyPackage(steamCfg, helper);
	IPropertyPackage* const waterPkg = createPropertyPackage(waterCfg, helper);

	steamPkg->buildState(*this, *addPort("inlet_1", PortDirection::Inlet), false);
	waterPkg->buildState(*this, *addPort("inlet_2", PortDirection::Inlet), false);
	if (hasDrainMixer)
		steamPkg->buildState(*this, *addPort("drain", PortDirection::Inlet), false);
	steamPkg->buildState(*this, *addPort("outlet_1", PortDirection::Outlet), false);
	waterPkg->buildState(*this, *addPort("outlet_2", PortDirection::Outlet), false);

	if (hasDesuperheat)
	{
		UnitModel* const ds = addSection(new HeatExchanger("desuperheat", this), cfg.scope("desuperheat"), helper);
		ds->setValue("area", 10.0);
	}

	if (hasDrainMixer)
	{
		const config::Configuration mixerCfg = Mixer::mixerSchema("drain_mix", helper).defaults()
			.with("PROPERTY_PACKAGE", steamCfg.getString("PROPERTY_PACKAGE"))
			.with("property_package_args", steamCfg.scope("property_package_args"));
		addSection(new Mixer("drain_mix", this), mixerCfg, helper);
	}

	addSection(new CondensingSection("condense", this), cfg.scope("condense"), helper);

	if (hasDrainCooling)
	{
		UnitModel* const co = addSection(new HeatExchanger("cooling", this), cfg.scope("cooling"), helper);
		co->setValue("area", 10.0);
	}

	assemble(recipe(hasDesuperheat, hasDrainMixer, hasDrainCooling));
}

} // namespace model

} // namespace sequin
