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
 * Provides an interface to create subentities (e.g., property packages) and provide
 * some aids for configuring models.
 */

#ifndef LIBSEQUIN_CONFIGURATIONHELPER_HPP_
#define LIBSEQUIN_CONFIGURATIONHELPER_HPP_

#include <string>
#include <vector>

namespace sequin
{

	namespace model
	{
		class IPropertyPackage;
	}

/**
 * @brief Provides means to create subentities (e.g., IPropertyPackage)
 */
class IConfigHelper
{
public:

	/**
	 * @brief Creates an IPropertyPackage object of the given @p name
	 * @details The caller owns the returned IPropertyPackage object.
	 * @param [in] name Name of the IPropertyPackage object
	 * @return Object of the given IPropertyPackage @p name or @c nullptr if that name does not exist
	 */
	virtual model::IPropertyPackage* createPropertyPackage(const std::string& name) const = 0;

	/**
	 * @brief Checks if there is an IPropertyPackage of the given @p name
	 * @param [in] name Name of the IPropertyPackage object
	 * @return @c true if a property package of this name exists, otherwise @c false
	 */
	virtual bool isValidPropertyPackage(const std::string& name) const = 0;

	/**
	 * @brief Returns the names of all available property packages
	 * @return Names of the property packages
	 */
	virtual std::vector<std::string> propertyPackageNames() const = 0;

	/**
	 * @brief Returns the property package used if no unit in the hierarchy selects one
	 * @return Name of the default property package
	 */
	virtual const std::string& defaultPropertyPackage() const = 0;
};

} // namespace sequin

#endif  // LIBSEQUIN_CONFIGURATIONHELPER_HPP_
