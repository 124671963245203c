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

#include "ModelBuilderImpl.hpp"
#include "sequin/ParameterProvider.hpp"
#include "sequin/Exceptions.hpp"
#include "model/UnitModel.hpp"
#include "model/unit/HeatExchanger.hpp"
#include "model/unit/Mixer.hpp"
#include "model/unit/FeedwaterHeater.hpp"
#include "model/property/WaterSteamPackage.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <cctype>
#include <memory>

namespace sequin
{

	ModelBuilder::ModelBuilder() : _defaultPackage(model::WaterSteamPropertyPackage::identifier())
	{
		// Register all available units
		registerModel<model::HeatExchanger>();
		registerModel<model::CondensingSection>();
		registerModel<model::Mixer>();
		registerModel<model::FeedwaterHeater>();
	}

	ModelBuilder::~ModelBuilder() SEQUIN_NOEXCEPT { }

	template <class Unit_t>
	void ModelBuilder::registerModel(const std::string& name)
	{
		_unitCreators[name] = [](const std::string& unitName) { return new Unit_t(unitName, nullptr); };
	}

	template <class Unit_t>
	void ModelBuilder::registerModel()
	{
		registerModel<Unit_t>(Unit_t::identifier());
	}

	IModel* ModelBuilder::createUnit(IParameterProvider& paramProvider)
	{
		if (!paramProvider.exists("UNIT_TYPE"))
		{
			LOG(Error) << "Field UNIT_TYPE is missing";
			return nullptr;
		}

		const std::string unitType = paramProvider.getString("UNIT_TYPE");
		const UnitFactoryContainer_t::const_iterator it = _unitCreators.find(unitType);
		if (it == _unitCreators.end())
		{
			// Unit type was not found
			LOG(Error) << "Unknown unit type " << unitType;
			return nullptr;
		}

		std::string name;
		if (paramProvider.exists("NAME"))
			name = paramProvider.getString("NAME");
		if (name.empty())
		{
			name = unitType;
			std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
		}

		std::unique_ptr<model::UnitModel> unit(it->second(name));
		unit->configure(paramProvider, *this);

		LOG(Debug) << "Created unit " << name << " of type " << unitType << " with " << unit->degreesOfFreedom() << " degrees of freedom";
		return unit.release();
	}

	void ModelBuilder::destroyUnit(IModel* unit)
	{
		delete unit;
	}

	void ModelBuilder::setDefaultPropertyPackage(const std::string& name)
	{
		if (!_propertyPackages.exists(name))
			throw InvalidParameterException("Unknown property package " + name);

		_defaultPackage = name;
	}

	void ModelBuilder::registerPropertyPackage(const std::string& name, std::function<model::IPropertyPackage*()> factory)
	{
		_propertyPackages.registerModel(name, factory);
	}

	model::IPropertyPackage* ModelBuilder::createPropertyPackage(const std::string& name) const
	{
		return _propertyPackages.create(name);
	}

	bool ModelBuilder::isValidPropertyPackage(const std::string& name) const
	{
		return _propertyPackages.exists(name);
	}

	std::vector<std::string> ModelBuilder::propertyPackageNames() const
	{
		return _propertyPackages.names();
	}

} // namespace sequin
