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

#include "model/UnitModel.hpp"
#include "model/Variable.hpp"
#include "model/EquationBlock.hpp"
#include "model/property/PropertyPackage.hpp"
#include "ConfigurationHelper.hpp"
#include "SolverAdapter.hpp"
#include "SequentialInitializer.hpp"
#include "sequin/Exceptions.hpp"
#include "sequin/ParameterProvider.hpp"
#include "Logging.hpp"

#include <algorithm>
#include <limits>

namespace sequin
{

namespace model
{

UnitModel::UnitModel(const std::string& name, Block* parent) : Block(name, parent), _built(false) { }

UnitModel::~UnitModel() SEQUIN_NOEXCEPT
{
	for (std::vector<Port*>::iterator it = _ports.begin(); it != _ports.end(); ++it)
		delete *it;

	for (std::vector<IPropertyPackage*>::iterator it = _packages.begin(); it != _packages.end(); ++it)
		delete *it;
}

config::ConfigSchema UnitModel::commonSchema(const std::string& name, const IConfigHelper& helper)
{
	std::vector<std::string> packages = helper.propertyPackageNames();
	packages.push_back(useDefaultPackage());

	config::ConfigSchema schema(name);
	schema.declareString("UNIT_TYPE", "", std::vector<std::string>(), "Type of the unit")
		.declareString("NAME", "", std::vector<std::string>(), "Name of the unit")
		.declareBool("DYNAMIC", false, std::vector<bool>{false}, "Dynamic model flag, only steady-state models are supported")
		.declareBool("HAS_HOLDUP", false, std::vector<bool>{false}, "Holdup construction flag, requires DYNAMIC")
		.declareString("PROPERTY_PACKAGE", useDefaultPackage(), packages, "Property package to use for control volume")
		.declareImplicitBlock("property_package_args", "Arguments to use for constructing property packages")
		.addCheck([](const config::Configuration& cfg)
			{
				if (!cfg.getBool("DYNAMIC") && cfg.getBool("HAS_HOLDUP"))
					throw ConfigurationException("HAS_HOLDUP has to be false if DYNAMIC is false");
			});
	return schema;
}

config::Configuration UnitModel::resolvePropertyPackage(const config::Configuration& cfg, const config::Configuration& inherited, const IConfigHelper& helper)
{
	const std::string selected = cfg.has("PROPERTY_PACKAGE") ? cfg.getString("PROPERTY_PACKAGE") : std::string(useDefaultPackage());
	if (selected != useDefaultPackage())
		return cfg;

	if (inherited.has("PROPERTY_PACKAGE"))
	{
		const std::string parentPkg = inherited.getString("PROPERTY_PACKAGE");
		if (parentPkg != useDefaultPackage())
		{
			const config::Configuration args = inherited.isScope("property_package_args") ? inherited.scope("property_package_args") : config::Configuration();
			return cfg.with("PROPERTY_PACKAGE", parentPkg).with("property_package_args", args);
		}
	}

	const config::Configuration args = cfg.isScope("property_package_args") ? cfg.scope("property_package_args") : config::Configuration();
	return cfg.with("PROPERTY_PACKAGE", helper.defaultPropertyPackage()).with("property_package_args", args);
}

void UnitModel::configure(IParameterProvider& paramProvider, const IConfigHelper& helper)
{
	const config::ConfigSchema s = schema(helper);
	build(s.validate(paramProvider), helper);
}

void UnitModel::build(const config::Configuration& cfg, const IConfigHelper& helper)
{
	if (_built)
		throw InvalidParameterException("Unit " + path() + " has already been built");

	_config = resolvePropertyPackage(cfg, config::Configuration(), helper);
	buildUnit(_config, helper);
	_built = true;

	LOG(Debug) << "Built unit " << path() << " (" << unitType() << ") with " << _vars.size() << " variables and " << _constraints.size() << " constraints";
}

IPropertyPackage* UnitModel::createPropertyPackage(const config::Configuration& cfg, const IConfigHelper& helper)
{
	const std::string pkgName = cfg.getString("PROPERTY_PACKAGE");
	IPropertyPackage* const pkg = helper.createPropertyPackage(pkgName);
	if (!pkg)
		throw ConfigurationException("Unknown property package " + pkgName + " in unit " + path());

	_packages.push_back(pkg);
	pkg->configure(cfg.isScope("property_package_args") ? cfg.scope("property_package_args") : config::Configuration());
	return pkg;
}

Port* UnitModel::addPort(const std::string& name, PortDirection dir)
{
	if (port(name))
		throw InvalidParameterException("Port " + name + " already exists in unit " + path());

	Port* const p = new Port(name, dir, this);
	_ports.push_back(p);
	return p;
}

Port* UnitModel::port(const std::string& name) const
{
	for (std::vector<Port*>::const_iterator it = _ports.begin(); it != _ports.end(); ++it)
	{
		if ((*it)->name() == name)
			return *it;
	}
	return nullptr;
}

std::vector<Port*> UnitModel::inlets() const
{
	std::vector<Port*> in;
	for (std::vector<Port*>::const_iterator it = _ports.begin(); it != _ports.end(); ++it)
	{
		if ((*it)->isInlet())
			in.push_back(*it);
	}
	return in;
}

std::vector<Constraint*> UnitModel::specialConstraints() const
{
	std::vector<Constraint*> special;
	for (std::vector<Constraint*>::const_iterator it = _constraints.begin(); it != _constraints.end(); ++it)
	{
		if ((*it)->isSpecial())
			special.push_back(*it);
	}
	return special;
}

bool UnitModel::hasVariable(const std::string& path) const
{
	return findVariable(path) != nullptr;
}

double UnitModel::getValue(const std::string& path) const
{
	Variable const* const var = findVariable(path);
	if (!var)
		return std::numeric_limits<double>::quiet_NaN();
	return var->value();
}

bool UnitModel::setValue(const std::string& path, double value)
{
	Variable* const var = findVariable(path);
	if (!var)
		return false;

	var->setValue(value);
	return true;
}

bool UnitModel::fixVariable(const std::string& path, double value)
{
	Variable* const var = findVariable(path);
	if (!var)
		return false;

	var->fix(value);
	return true;
}

bool UnitModel::unfixVariable(const std::string& path)
{
	Variable* const var = findVariable(path);
	if (!var)
		return false;

	var->unfix();
	return true;
}

bool UnitModel::isFixed(const std::string& path) const
{
	Variable const* const var = findVariable(path);
	return var && var->isFixed();
}

InitializationResult UnitModel::initialize(ISolverAdapter& solver, IParameterProvider& options)
{
	SequentialInitializer init(solver, options);
	return init.initialize(*this);
}

SolverStatus UnitModel::initialize(IParameterProvider& solverOptions)
{
	NonlinearSolverAdapter solver;
	return initialize(solver, solverOptions).result.status;
}

SolverStatus UnitModel::solve(IParameterProvider& solverOptions)
{
	NonlinearSolverAdapter solver;
	EquationBlock eb(*this);
	const SolverResult res = solver.solve(eb, solverOptions);

	if (res.status != SolverStatus::Optimal)
		LOG(Warning) << "Solve of " << path() << " terminated with status " << to_string(res.status) << ", residual " << res.residualNorm;

	return res.status;
}

} // namespace model

} // namespace sequin
