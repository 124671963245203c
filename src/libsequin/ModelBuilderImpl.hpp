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
 * Defines the ModelBuilder implementation.
 */

#ifndef LIBSEQUIN_MODELBUILDER_IMPL_HPP_
#define LIBSEQUIN_MODELBUILDER_IMPL_HPP_

#include "sequin/ModelBuilder.hpp"
#include "ConfigurationHelper.hpp"
#include "PropertyPackageFactory.hpp"

#include <string>
#include <vector>
#include <unordered_map>
#include <functional>

namespace sequin
{

namespace model
{
	class UnitModel;
}

/**
 * @brief Provides functionality to build unit models
 */
class ModelBuilder : public IModelBuilder, public IConfigHelper
{
public:

	ModelBuilder();

	virtual ~ModelBuilder() SEQUIN_NOEXCEPT;

	virtual IModel* createUnit(IParameterProvider& paramProvider);
	virtual void destroyUnit(IModel* unit);

	virtual void setDefaultPropertyPackage(const std::string& name);
	virtual const char* defaultPropertyPackageName() const SEQUIN_NOEXCEPT { return _defaultPackage.c_str(); }

	virtual model::IPropertyPackage* createPropertyPackage(const std::string& name) const;
	virtual bool isValidPropertyPackage(const std::string& name) const;
	virtual std::vector<std::string> propertyPackageNames() const;
	virtual const std::string& defaultPropertyPackage() const { return _defaultPackage; }

	/**
	 * @brief Registers a property package
	 * @param [in] name Name of the property package
	 * @param [in] factory Factory function creating the property package
	 */
	void registerPropertyPackage(const std::string& name, std::function<model::IPropertyPackage*()> factory);

protected:

	/**
	 * @brief Registers a UnitModel
	 * @param [in] name Name of the unit type
	 * @tparam Unit_t Type of the unit
	 */
	template <class Unit_t>
	void registerModel(const std::string& name);

	/**
	 * @brief Registers a UnitModel
	 * @details The name of the unit type is inferred from the static function Unit_t::identifier().
	 * @tparam Unit_t Type of the unit
	 */
	template <class Unit_t>
	void registerModel();

	PropertyPackageFactory _propertyPackages; //!< Factory for IPropertyPackage implementations

	typedef std::unordered_map<std::string, std::function<model::UnitModel*(const std::string&)>> UnitFactoryContainer_t;

	UnitFactoryContainer_t _unitCreators; //!< Map with factory functions for units
	std::string _defaultPackage; //!< Name of the default property package
};

} // namespace sequin

#endif  // LIBSEQUIN_MODELBUILDER_IMPL_HPP_
