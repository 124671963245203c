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
 * Defines the PropertyPackageFactory
 */

#ifndef LIBSEQUIN_PROPERTYPACKAGEFACTORY_HPP_
#define LIBSEQUIN_PROPERTYPACKAGEFACTORY_HPP_

#include <string>
#include <vector>
#include <unordered_map>
#include <functional>

namespace sequin
{

	namespace model
	{
		class IPropertyPackage;
	}

	/**
	 * @brief Creates property packages
	 */
	class PropertyPackageFactory
	{
	public:
		/**
		 * @brief Construct the PropertyPackageFactory
		 * @details All internal property packages are registered here.
		 */
		PropertyPackageFactory();

		~PropertyPackageFactory();

		/**
		 * @brief Creates property packages with the given @p name
		 * @details The caller owns the returned object.
		 * @param [in] name Name of the property package
		 * @return The property package or @c nullptr if a property package with this name does not exist
		 */
		model::IPropertyPackage* create(const std::string& name) const;

		/**
		 * @brief Registers the given property package implementation
		 * @param [in] name Name of the IPropertyPackage implementation
		 * @param [in] factory Function that creates an object of the IPropertyPackage class
		 */
		void registerModel(const std::string& name, std::function<model::IPropertyPackage*()> factory);

		/**
		 * @brief Returns whether a property package of the given name @p name exists
		 * @param [in] name Name of the property package
		 * @return @c true if a property package of this name exists, otherwise @c false
		 */
		bool exists(const std::string& name) const;

		/**
		 * @brief Returns the names of all registered property packages
		 * @return Sorted list of names
		 */
		std::vector<std::string> names() const;

	protected:

		/**
		 * @brief Registers an IPropertyPackage
		 * @param [in] name Name of the property package
		 * @tparam Package_t Type of the property package
		 */
		template <class Package_t>
		void registerModel(const std::string& name);

		/**
		 * @brief Registers an IPropertyPackage
		 * @details The name of the property package is inferred from the static function identifier().
		 * @tparam Package_t Type of the property package
		 */
		template <class Package_t>
		void registerModel();

		std::unordered_map<std::string, std::function<model::IPropertyPackage*()>> _packages; //!< Map with factory functions
	};

} // namespace sequin

#endif  // LIBSEQUIN_PROPERTYPACKAGEFACTORY_HPP_
