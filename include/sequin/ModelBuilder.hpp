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
 * Defines the ModelBuilder interface.
 */

#ifndef LIBSEQUIN_MODELBUILDER_HPP_
#define LIBSEQUIN_MODELBUILDER_HPP_

#include <string>

#include "sequin/LibExportImport.hpp"
#include "sequin/sequinCompilerInfo.hpp"

namespace sequin
{

class IParameterProvider;
class IModel;

/**
 * @brief Provides functionality to build unit models
 * @details Creates unit models from given parameters. The IModelBuilder does not own the
 *          created IModel objects, they have to be destroyed by calling destroyUnit().
 *          
 *          The builder provides the default property package used for units that request
 *          @c USE_DEFAULT and do not inherit a package from an enclosing unit.
 */
class SEQUIN_API IModelBuilder
{
public:

	virtual ~IModelBuilder() SEQUIN_NOEXCEPT { }

	/**
	 * @brief Automatically constructs a unit model from provided parameters
	 * @details The type of the unit model is given by the @c UNIT_TYPE field in the current scope
	 *          of @p paramProvider. If the unit type is unknown, @c nullptr is returned.
	 *          Invalid configurations raise a ConfigurationException, inconsistent assemblies
	 *          an AssemblyInvariantException.
	 * 
	 * @param [in] paramProvider ParameterProvider from which all necessary information is read
	 * @return A fully assembled unit model or @c nullptr if the unit type is unknown
	 */
	virtual IModel* createUnit(IParameterProvider& paramProvider) = 0;

	/**
	 * @brief Destroys the given IModel
	 * @param [in] unit IModel object to be deleted
	 */
	virtual void destroyUnit(IModel* unit) = 0;

	/**
	 * @brief Sets the default property package
	 * @details Throws InvalidParameterException if no property package with this name is registered.
	 * @param [in] name Name of the property package
	 */
	virtual void setDefaultPropertyPackage(const std::string& name) = 0;

	/**
	 * @brief Returns the name of the default property package
	 * @return Name of the default property package
	 */
	virtual const char* defaultPropertyPackageName() const SEQUIN_NOEXCEPT = 0;
};

} // namespace sequin

#endif  // LIBSEQUIN_MODELBUILDER_HPP_
