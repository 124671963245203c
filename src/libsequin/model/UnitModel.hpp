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
 * Defines the base class of all unit models.
 */

#ifndef LIBSEQUIN_UNITMODEL_HPP_
#define LIBSEQUIN_UNITMODEL_HPP_

#include "sequin/Model.hpp"
#include "model/Block.hpp"
#include "model/Port.hpp"
#include "config/Configuration.hpp"
#include "config/ConfigSchema.hpp"
#include "SequentialInitializer.hpp"

#include <string>
#include <vector>

namespace sequin
{

class IParameterProvider;
class IConfigHelper;
class ISolverAdapter;

namespace model
{

class IPropertyPackage;

/**
 * @brief Base class for unit models
 * @details A unit model is a block with ports. It is configured from a validated Configuration
 *          and initialized by the SequentialInitializer. Leaf units provide an initial guess that
 *          is computed from their inlet ports.
 *          
 *          Each unit declares its options in a ConfigSchema. The common options are declared by
 *          commonSchema().
 */
class UnitModel : public Block, public IModel
{
public:

	UnitModel(const std::string& name, Block* parent);
	virtual ~UnitModel() SEQUIN_NOEXCEPT;

	virtual const char* unitName() const SEQUIN_NOEXCEPT { return _name.c_str(); }

	virtual bool hasVariable(const std::string& path) const;
	virtual double getValue(const std::string& path) const;
	virtual bool setValue(const std::string& path, double value);
	virtual bool fixVariable(const std::string& path, double value);
	virtual bool unfixVariable(const std::string& path);
	virtual bool isFixed(const std::string& path) const;
	virtual int degreesOfFreedom() const { return Block::degreesOfFreedom(); }
	virtual SolverStatus initialize(IParameterProvider& solverOptions);
	virtual SolverStatus solve(IParameterProvider& solverOptions);

	/**
	 * @brief Initializes the unit using the given solver
	 * @details See SequentialInitializer for the algorithm.
	 * @param [in] solver Solver adapter
	 * @param [in] options Solver options
	 * @return Result of the initialization
	 */
	InitializationResult initialize(ISolverAdapter& solver, IParameterProvider& options);

	/**
	 * @brief Returns the option table of this unit
	 * @param [in] helper Provides the available property packages
	 * @return Option table
	 */
	virtual config::ConfigSchema schema(const IConfigHelper& helper) const = 0;

	/**
	 * @brief Validates the options in the current scope of @p paramProvider and builds the unit
	 * @details Fails with ConfigurationException before anything is built if the options are invalid.
	 * @param [in] paramProvider Parameter provider
	 * @param [in] helper Configuration helper
	 */
	void configure(IParameterProvider& paramProvider, const IConfigHelper& helper);

	/**
	 * @brief Builds variables, constraints, ports, and sections from a validated configuration
	 * @details A unit can only be built once.
	 * @param [in] cfg Validated configuration
	 * @param [in] helper Configuration helper
	 */
	void build(const config::Configuration& cfg, const IConfigHelper& helper);

	inline const config::Configuration& configuration() const SEQUIN_NOEXCEPT { return _config; }
	inline bool isBuilt() const SEQUIN_NOEXCEPT { return _built; }

	inline const std::vector<Port*>& ports() const SEQUIN_NOEXCEPT { return _ports; }
	Port* port(const std::string& name) const;
	std::vector<Port*> inlets() const;

	/**
	 * @brief Returns the special constraints declared by this unit itself
	 * @return Special constraints
	 */
	std::vector<Constraint*> specialConstraints() const;

	/**
	 * @brief Computes an initial guess from the current inlet values
	 */
	virtual void initialGuess() { }

	/**
	 * @brief Resolves the property package selected by a configuration
	 * @details Resolution order is the @c PROPERTY_PACKAGE option of @p cfg, then @p inherited,
	 *          then the default package of @p helper. The arguments follow the package that was chosen.
	 * @param [in] cfg Configuration with @c PROPERTY_PACKAGE and @c property_package_args
	 * @param [in] inherited Configuration of the enclosing unit or side (already resolved)
	 * @param [in] helper Configuration helper
	 * @return Configuration with resolved @c PROPERTY_PACKAGE and @c property_package_args
	 */
	static config::Configuration resolvePropertyPackage(const config::Configuration& cfg, const config::Configuration& inherited, const IConfigHelper& helper);

	static const char* useDefaultPackage() SEQUIN_NOEXCEPT { return "USE_DEFAULT"; }

	/**
	 * @brief Declares the options common to all units
	 * @param [in] name Name of the schema
	 * @param [in] helper Provides the available property packages
	 * @return Option table with common options
	 */
	static config::ConfigSchema commonSchema(const std::string& name, const IConfigHelper& helper);

protected:

	/**
	 * @brief Builds the unit, see build()
	 * @param [in] cfg Validated configuration with resolved property packages
	 * @param [in] helper Configuration helper
	 */
	virtual void buildUnit(const config::Configuration& cfg, const IConfigHelper& helper) = 0;

	Port* addPort(const std::string& name, PortDirection dir);

	/**
	 * @brief Creates and configures the property package selected by @p cfg
	 * @details The created package is owned by this unit.
	 * @param [in] cfg Configuration with resolved @c PROPERTY_PACKAGE and @c property_package_args
	 * @param [in] helper Configuration helper
	 * @return Property package
	 */
	IPropertyPackage* createPropertyPackage(const config::Configuration& cfg, const IConfigHelper& helper);

	std::vector<Port*> _ports;
	std::vector<IPropertyPackage*> _packages;
	config::Configuration _config;
	bool _built;
};

} // namespace model

} // namespace sequin

#endif  // LIBSEQUIN_UNITMODEL_HPP_
