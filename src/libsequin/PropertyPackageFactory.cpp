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

#include "PropertyPackageFactory.hpp"
#include "sequin/Exceptions.hpp"

#include "model/property/WaterSteamPackage.hpp"

#include <algorithm>

namespace sequin
{
	PropertyPackageFactory::PropertyPackageFactory()
	{
		// Register all property packages here
		registerModel<model::WaterSteamPropertyPackage>();
		registerModel<model::LiquidWaterPropertyPackage>();
	}

	PropertyPackageFactory::~PropertyPackageFactory() { }

	template <class Package_t>
	void PropertyPackageFactory::registerModel(const std::string& name)
	{
		_packages[name] = []() { return new Package_t(); };
	}

	template <class Package_t>
	void PropertyPackageFactory::registerModel()
	{
		registerModel<Package_t>(Package_t::identifier());
	}

	model::IPropertyPackage* PropertyPackageFactory::create(const std::string& name) const
	{
		const auto it = _packages.find(name);
		if (it == _packages.end())
		{
			// Property package was not found
			return nullptr;
		}

		return it->second();
	}

	void PropertyPackageFactory::registerModel(const std::string& name, std::function<model::IPropertyPackage*()> factory)
	{
		if (_packages.find(name) == _packages.end())
			_packages[name] = factory;
		else
			throw InvalidParameterException("IPropertyPackage implementation with the name " + name + " is already registered and cannot be overwritten");
	}

	bool PropertyPackageFactory::exists(const std::string& name) const
	{
		return _packages.find(name) != _packages.end();
	}

	std::vector<std::string> PropertyPackageFactory::names() const
	{
		std::vector<std::string> n;
		n.reserve(_packages.size());
		for (const auto& kv : _packages)
			n.push_back(kv.first);

		std::sort(n.begin(), n.end());
		return n;
	}

} // namespace sequin
