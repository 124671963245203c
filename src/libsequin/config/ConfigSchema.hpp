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
 * Defines declarative option tables used to validate configurations.
 */

#ifndef LIBSEQUIN_CONFIGSCHEMA_HPP_
#define LIBSEQUIN_CONFIGSCHEMA_HPP_

#include "config/Configuration.hpp"

#include <string>
#include <vector>
#include <memory>
#include <functional>

namespace sequin
{

class IParameterProvider;

namespace config
{

/**
 * @brief Kind of a configuration option
 */
enum class OptionKind : int
{
	Bool,
	Int,
	Double,
	String,
	Block, //!< Nested configuration validated by its own schema
	ImplicitBlock //!< Free-form nested configuration (e.g., property package arguments)
};

const char* to_string(OptionKind kind) SEQUIN_NOEXCEPT;

class ConfigSchema;

/**
 * @brief Declaration of a single option
 */
struct OptionSpec
{
	std::string name;
	OptionKind kind;
	std::string description;
	bool required; //!< Determines whether the option has to be given (no default)
	std::vector<bool> boolDomain; //!< Allowed boolean values, empty if unrestricted
	std::vector<std::string> stringDomain; //!< Allowed string values, empty if unrestricted
	double minValue; //!< Lower bound of numeric options
	double maxValue; //!< Upper bound of numeric options
	std::shared_ptr<const ConfigSchema> schema; //!< Schema of Block options
};

/**
 * @brief Declarative option table
 * @details Each option has a name, a kind, a default (unless it is required), an allowed domain,
 *          and a description. Rules that relate several options are attached as checks that run
 *          on the validated configuration.
 *          
 *          Validation fails closed: unknown option names, wrong types, out-of-domain values, and
 *          missing required options raise a ConfigurationException.
 */
class ConfigSchema
{
public:
	typedef std::function<void(const Configuration&)> Check;

	ConfigSchema();
	explicit ConfigSchema(const std::string& name);

	inline const std::string& name() const SEQUIN_NOEXCEPT { return _name; }

	ConfigSchema& declareBool(const std::string& name, bool defaultValue, const std::string& description);
	ConfigSchema& declareBool(const std::string& name, bool defaultValue, const std::vector<bool>& domain, const std::string& description);
	ConfigSchema& declareInt(const std::string& name, int defaultValue, int minValue, int maxValue, const std::string& description);
	ConfigSchema& declareDouble(const std::string& name, double defaultValue, const std::string& description);
	ConfigSchema& declareDouble(const std::string& name, double defaultValue, double minValue, double maxValue, const std::string& description);
	ConfigSchema& declareString(const std::string& name, const std::string& defaultValue, const std::vector<std::string>& domain, const std::string& description);
	ConfigSchema& declareRequiredString(const std::string& name, const std::vector<std::string>& domain, const std::string& description);
	ConfigSchema& declareBlock(const std::string& name, const ConfigSchema& schema, const std::string& description);
	ConfigSchema& declareImplicitBlock(const std::string& name, const std::string& description);

	/**
	 * @brief Attaches a rule that is checked after all options have been validated
	 * @details The check signals a violation by throwing ConfigurationException.
	 * @param [in] check Check
	 * @return This schema
	 */
	ConfigSchema& addCheck(Check check);

	/**
	 * @brief Validates the options in the current scope of @p paramProvider
	 * @details Options that are not given are set to their defaults. The scope of the
	 *          parameter provider is left unchanged on return.
	 * @param [in] paramProvider Parameter provider
	 * @return Validated configuration
	 */
	Configuration validate(IParameterProvider& paramProvider) const;

	/**
	 * @brief Validates a configuration given as JSON object
	 * @param [in] data Configuration data
	 * @return Validated configuration
	 */
	Configuration validate(const Configuration& data) const;

	/**
	 * @brief Returns the configuration with all defaults
	 * @details Throws ConfigurationException if the schema has required options.
	 * @return Default configuration
	 */
	Configuration defaults() const;

	const OptionSpec* option(const std::string& name) const;
	inline const std::vector<OptionSpec>& options() const SEQUIN_NOEXCEPT { return _options; }

protected:
	OptionSpec& declare(const std::string& name, OptionKind kind, const std::string& description);
	void runChecks(const Configuration& cfg) const;

	std::string _name;
	std::vector<OptionSpec> _options;
	Configuration _defaults;
	std::vector<Check> _checks;
};

} // namespace config

} // namespace sequin

#endif  // LIBSEQUIN_CONFIGSCHEMA_HPP_
