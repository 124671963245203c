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

#include "model/unit/HeatExchanger.hpp"
#include "model/Variable.hpp"
#include "model/property/PropertyPackage.hpp"
#include "ConfigurationHelper.hpp"
#include "sequin/Exceptions.hpp"

#include <cmath>
#include <limits>

namespace
{
	/**
	 * @brief Copies the values of @p src to the unfixed members of @p dst
	 */
	void guessFrom(const sequin::model::Port& src, sequin::model::Port& dst)
	{
		for (unsigned int i = 0; i < src.numMembers(); ++i)
		{
			sequin::model::Variable const* const from = src.members()[i].second;
			sequin::model::Variable* const to = dst.members()[i].second;
			if (from->hasValue() && !to->isFixed())
				to->setValue(from->value());
		}
	}

	void guessValue(sequin::model::Variable* var, double val)
	{
		if (!var->isFixed())
			var->setValue(val);
	}

	sequin::config::ConfigSchema sideSchema(const std::string& name, const sequin::IConfigHelper& helper)
	{
		std::vector<std::string> packages = helper.propertyPackageNames();
		packages.push_back(sequin::model::UnitModel::useDefaultPackage());

		sequin::config::ConfigSchema schema(name);
		schema.declareString("PROPERTY_PACKAGE", sequin::model::UnitModel::useDefaultPackage(), packages, "Property package of this side, inherited from the unit if not set")
			.declareImplicitBlock("property_package_args", "Arguments to use for constructing the property package of this side")
			.declareBool("HAS_PRESSURE_CHANGE", false, "Pressure change term construction flag")
			.declareBool("HAS_PHASE_EQUILIBRIUM", false, "Phase equilibrium construction flag");
		return schema;
	}
}

namespace sequin
{

namespace model
{

HeatExchanger::HeatExchanger(const std::string& name, Block* parent) : UnitModel(name, parent),
	_inletHot(nullptr), _outletHot(nullptr), _inletCold(nullptr), _outletCold(nullptr), _pkgHot(nullptr), _pkgCold(nullptr),
	_heatDuty(nullptr), _area(nullptr), _heatTransferCoeff(nullptr), _deltaT(nullptr), _countercurrent(true)
{
}

HeatExchanger::~HeatExchanger() SEQUIN_NOEXCEPT { }

config::ConfigSchema HeatExchanger::heatExchangerSchema(const std::string& name, const IConfigHelper& helper)
{
	config::ConfigSchema schema = UnitModel::commonSchema(name, helper);
	schema.declareString("FLOW_PATTERN", "COUNTERCURRENT", std::vector<std::string>{"COUNTERCURRENT", "COCURRENT"}, "Flow configuration of the heat exchanger")
		.declareBlock("side_1", sideSchema("side_1", helper), "Options of the hot side")
		.declareBlock("side_2", sideSchema("side_2", helper), "Options of the cold side");
	return schema;
}

config::ConfigSchema HeatExchanger::schema(const IConfigHelper& helper) const
{
	return heatExchangerSchema(_name, helper);
}

void HeatExchanger::buildUnit(const config::Configuration& cfg, const IConfigHelper& helper)
{
	_countercurrent = (cfg.getString("FLOW_PATTERN") == "COUNTERCURRENT");

	const config::Configuration hotCfg = resolvePropertyPackage(cfg.scope("side_1"), cfg, helper);
	const config::Configuration coldCfg = resolvePropertyPackage(cfg.scope("side_2"), cfg, helper);
	_pkgHot = createPropertyPackage(hotCfg, helper);
	_pkgCold = createPropertyPackage(coldCfg, helper);

	_inletHot = addPort("inlet_1", PortDirection::Inlet);
	_pkgHot->buildState(*this, *_inletHot, hotCfg.getBool("HAS_PHASE_EQUILIBRIUM"));
	_outletHot = addPort("outlet_1", PortDirection::Outlet);
	_pkgHot->buildState(*this, *_outletHot, hotCfg.getBool("HAS_PHASE_EQUILIBRIUM"));

	_inletCold = addPort("inlet_2", PortDirection::Inlet);
	_pkgCold->buildState(*this, *_inletCold, coldCfg.getBool("HAS_PHASE_EQUILIBRIUM"));
	_outletCold = addPort("outlet_2", PortDirection::Outlet);
	_pkgCold->buildState(*this, *_outletCold, coldCfg.getBool("HAS_PHASE_EQUILIBRIUM"));

	_heatDuty = addVariable("heat_duty", 0.0);
	_area = addVariable("area", 1.0);
	_area->setBounds(0.0, std::numeric_limits<double>::infinity());
	_heatTransferCoeff = addVariable("overall_heat_transfer_coefficient", 100.0);
	_heatTransferCoeff->setBounds(0.0, std::numeric_limits<double>::infinity());
	_deltaT = addVariable("delta_temperature", 10.0);

	Variable* const f1i = _inletHot->member("flow_mol");
	Variable* const f1o = _outletHot->member("flow_mol");
	Variable* const h1i = _inletHot->member("enth_mol");
	Variable* const h1o = _outletHot->member("enth_mol");
	Variable* const p1i = _inletHot->member("pressure");
	Variable* const p1o = _outletHot->member("pressure");
	Variable* const f2i = _inletCold->member("flow_mol");
	Variable* const f2o = _outletCold->member("flow_mol");
	Variable* const h2i = _inletCold->member("enth_mol");
	Variable* const h2o = _outletCold->member("enth_mol");
	Variable* const p2i = _inletCold->member("pressure");
	Variable* const p2o = _outletCold->member("pressure");
	Variable* const q = _heatDuty;

	addConstraint("material_balance_1", std::vector<Variable*>{f1i, f1o}, [=]() { return f1i->value() - f1o->value(); });
	addConstraint("material_balance_2", std::vector<Variable*>{f2i, f2o}, [=]() { return f2i->value() - f2o->value(); });

	if (hotCfg.getBool("HAS_PRESSURE_CHANGE"))
	{
		Variable* const dp = addVariable("deltaP_1", 0.0);
		addConstraint("pressure_balance_1", std::vector<Variable*>{p1i, p1o, dp}, [=]() { return p1i->value() + dp->value() - p1o->value(); }, 1e-5);
	}
	else
		addConstraint("pressure_balance_1", std::vector<Variable*>{p1i, p1o}, [=]() { return p1i->value() - p1o->value(); }, 1e-5);

	if (coldCfg.getBool("HAS_PRESSURE_CHANGE"))
	{
		Variable* const dp = addVariable("deltaP_2", 0.0);
		addConstraint("pressure_balance_2", std::vector<Variable*>{p2i, p2o, dp}, [=]() { return p2i->value() + dp->value() - p2o->value(); }, 1e-5);
	}
	else
		addConstraint("pressure_balance_2", std::vector<Variable*>{p2i, p2o}, [=]() { return p2i->value() - p2o->value(); }, 1e-5);

	addConstraint("energy_balance_1", std::vector<Variable*>{f1i, h1i, h1o, q}, [=]() { return f1i->value() * (h1i->value() - h1o->value()) - q->value(); }, 1e-6);
	addConstraint("energy_balance_2", std::vector<Variable*>{f2i, h2i, h2o, q}, [=]() { return f2i->value() * (h2i->value() - h2o->value()) + q->value(); }, 1e-6);

	Variable* const u = _heatTransferCoeff;
	Variable* const a = _area;
	Variable* const dT = _deltaT;
	addConstraint("heat_transfer_equation", std::vector<Variable*>{q, u, a, dT}, [=]() { return q->value() - u->value() * a->value() * dT->value(); }, 1e-6);

	addConstraint("delta_temperature_constraint", std::vector<Variable*>{dT, h1i, p1i, h1o, p1o, h2i, p2i, h2o, p2o}, [this]() { return deltaTemperatureResidual(); });
}

double HeatExchanger::temperature(const Port& p) const
{
	IPropertyPackage const* const pkg = ((&p == _inletHot) || (&p == _outletHot)) ? _pkgHot : _pkgCold;
	return pkg->temperature(p.member("enth_mol")->value(), p.member("pressure")->value());
}

double HeatExchanger::deltaTemperatureResidual() const
{
	const double t1i = temperature(*_inletHot);
	const double t1o = temperature(*_outletHot);
	const double t2i = temperature(*_inletCold);
	const double t2o = temperature(*_outletCold);

	double dTa = 0.0;
	double dTb = 0.0;
	if (_countercurrent)
	{
		dTa = t1i - t2o;
		dTb = t1o - t2i;
	}
	else
	{
		dTa = t1i - t2i;
		dTb = t1o - t2o;
	}

	const double mean = 0.5 * (std::cbrt(dTa) + std::cbrt(dTb));
	return _deltaT->value() - mean * mean * mean;
}

void HeatExchanger::initialGuess()
{
	guessFrom(*_inletHot, *_outletHot);
	guessFrom(*_inletCold, *_outletCold);

	const double dT = temperature(*_inletHot) - temperature(*_inletCold);
	if (std::isfinite(dT))
		guessValue(_deltaT, dT);

	guessValue(_heatDuty, 0.0);
}


CondensingSection::CondensingSection(const std::string& name, Block* parent) : HeatExchanger(name, parent) { }

CondensingSection::~CondensingSection() SEQUIN_NOEXCEPT { }

void CondensingSection::buildUnit(const config::Configuration& cfg, const IConfigHelper& helper)
{
	HeatExchanger::buildUnit(cfg, helper);

	Variable* const h1o = _outletHot->member("enth_mol");
	Variable* const p1o = _outletHot->member("pressure");
	IPropertyPackage const* const pkg = _pkgHot;

	Constraint* const c = addConstraint("extraction_rate_constraint", std::vector<Variable*>{h1o, p1o},
		[=]() { return h1o->value() - pkg->enthalpySaturatedLiquid(p1o->value()); }, 1e-3);
	c->determines(_inletHot->member("flow_mol"));
}

} // namespace model

} // namespace sequin
