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

#include "model/unit/Mixer.hpp"
#include "model/Variable.hpp"
#include "model/property/PropertyPackage.hpp"

namespace sequin
{

namespace model
{

Mixer::Mixer(const std::string& name, Block* parent) : UnitModel(name, parent), _steam(nullptr), _drain(nullptr), _outlet(nullptr) { }

Mixer::~Mixer() SEQUIN_NOEXCEPT { }

config::ConfigSchema Mixer::mixerSchema(const std::string& name, const IConfigHelper& helper)
{
	config::ConfigSchema schema = UnitModel::commonSchema(name, helper);
	schema.declareString("MOMENTUM_MIXING", "NONE", std::vector<std::string>{"NONE", "EQUALIZE"}, "Method to use when mixing momentum");
	return schema;
}

config::ConfigSchema Mixer::schema(const IConfigHelper& helper) const
{
	return mixerSchema(_name, helper);
}

void Mixer::buildUnit(const config::Configuration& cfg, const IConfigHelper& helper)
{
	IPropertyPackage* const pkg = createPropertyPackage(cfg, helper);

	_steam = addPort("steam", PortDirection::Inlet);
	pkg->buildState(*this, *_steam, false);
	_drain = addPort("drain", PortDirection::Inlet);
	pkg->buildState(*this, *_drain, false);
	_outlet = addPort("outlet", PortDirection::Outlet);
	pkg->buildState(*this, *_outlet, false);

	Variable* const fs = _steam->member("flow_mol");
	Variable* const fd = _drain->member("flow_mol");
	Variable* const fo = _outlet->member("flow_mol");
	Variable* const hs = _steam->member("enth_mol");
	Variable* const hd = _drain->member("enth_mol");
	Variable* const ho = _outlet->member("enth_mol");
	Variable* const ps = _steam->member("pressure");
	Variable* const pd = _drain->member("pressure");
	Variable* const po = _outlet->member("pressure");

	addConstraint("material_mixing_equations", std::vector<Variable*>{fs, fd, fo}, [=]() { return fo->value() - fs->value() - fd->value(); });
	addConstraint("enthalpy_mixing_equations", std::vector<Variable*>{fs, fd, fo, hs, hd, ho},
		[=]() { return fo->value() * ho->value() - fs->value() * hs->value() - fd->value() * hd->value(); }, 1e-6);
	addConstraint("mixer_pressure_constraint", std::vector<Variable*>{ps, po}, [=]() { return po->value() - ps->value(); }, 1e-5);

	if (cfg.getString("MOMENTUM_MIXING") == "EQUALIZE")
		addConstraint("pressure_equality_constraint", std::vector<Variable*>{pd, po}, [=]() { return po->value() - pd->value(); }, 1e-5);
}

void Mixer::initialGuess()
{
	const double fs = _steam->member("flow_mol")->value();
	const double fd = _drain->member("flow_mol")->value();
	const double flow = fs + fd;

	Variable* const fo = _outlet->member("flow_mol");
	Variable* const ho = _outlet->member("enth_mol");
	Variable* const po = _outlet->member("pressure");

	if (!fo->isFixed())
		fo->setValue(flow);

	if (!ho->isFixed())
	{
		if (flow > 0.0)
			ho->setValue((fs * _steam->member("enth_mol")->value() + fd * _drain->member("enth_mol")->value()) / flow);
		else
			ho->setValue(_steam->member("enth_mol")->value());
	}

	if (!po->isFixed())
		po->setValue(_steam->member("pressure")->value());
}

} // namespace model

} // namespace sequin
