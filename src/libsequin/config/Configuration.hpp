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
 * Defines immutable validated configurations.
 */

#ifndef LIBSEQUIN_CONFIGURATION_HPP_
#define LIBSEQUIN_CONFIGURATION_HPP_

#include "sequin/sequinCompilerInfo.hpp"

#include <string>
#include <vector>
#include <memory>

#include <nlohmann/json_fwd.hpp>

namespace sequin
{

namespace config
{

/**
 * @brief Immutable mapping from option name to value
 * @details A Configuration is created by ConfigSchema::validate() and never changes afterwards.
 *          Nested configurations of sub-units are stored as scopes. Derived configurations are
 *          created by with(), which leaves the original untouched.
 *          
 *          Getters throw ConfigurationException if an option is missing or has a different type.
 */
class Configuration
{
public:
	Configuration();
	explicit Configuration(const nlohmann::json& data);

	bool has(const std::string& name) const;
	bool isScope(const std::string& name) const;
	std::vector<std::string> optionNames() const;

	bool getBool(const std::string& name) const;
	int getInt(const std::string& name) const;
	double getDouble(const std::string& name) const;
	std::string getString(const std::string& name) const;

	/**
	 * @brief Returns the nested configuration with the given name
	 * @param [in] name Name of the scope
	 * @return Nested configuration
	 */
	Configuration scope(const std::string& name) const;

	/**
	 * @brief Derives a configuration in which the given option is replaced
	 * @param [in] name Name of the option
	 * @param [in] value New value
	 * @return Derived configuration
	 */
	Configuration with(const std::string& name, bool value) const;
	Configuration with(const std::string& name, int value) const;
	Configuration with(const std::string& name, double value) const;
	Configuration with(const std::string& name, const char* value) const;
	Configuration with(const std::string& name, const std::string& value) const;
	Configuration with(const std::string& name, const Configuration& value) const;

	inline const nlohmann::json& data() const SEQUIN_NOEXCEPT { return *_data; }

	/**
	 * @brief Returns a JSON string representation
	 * @return JSON string
	 */
	std::string dump() const;

protected:
	std::shared_ptr<const nlohmann::json> _data;
};

} // namespace config

} // namespace sequin

#endif  // LIBSEQUIN_CONFIGURATION_HPP_
