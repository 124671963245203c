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
 * Defines model interfaces.
 */

#ifndef LIBSEQUIN_MODEL_HPP_
#define LIBSEQUIN_MODEL_HPP_

#include <string>

#include "sequin/LibExportImport.hpp"
#include "sequin/sequinCompilerInfo.hpp"

namespace sequin
{

class IParameterProvider;

/**
 * @brief Termination status of a solve
 */
enum class SolverStatus : int
{
	Optimal = 0, //!< Converged to the requested tolerance
	Infeasible = 1, //!< Solver failed to find a solution
	Other = 2 //!< Solve was not possible (e.g., non-square system or non-finite residual)
};

/**
 * @brief Converts a SolverStatus to its string representation
 * @param [in] status Status
 * @return String representation
 */
SEQUIN_API const char* to_string(SolverStatus status) SEQUIN_NOEXCEPT;

/**
 * @brief Interface common to all unit models
 * @details Users of the library are not supposed to implement this interface.
 *          It defines all possible interactions of user code with unit models implemented
 *          in this library. Variables are addressed by dotted paths relative to the unit
 *          (e.g., @c inlet_1.flow_mol or @c condense.area).
 */
class SEQUIN_API IModel
{
public:

	virtual ~IModel() SEQUIN_NOEXCEPT { }

	/**
	 * @brief Returns the type of this unit model
	 * @return Unit type as used in the @c UNIT_TYPE option
	 */
	virtual const char* unitType() const SEQUIN_NOEXCEPT = 0;

	/**
	 * @brief Returns the name of this unit model
	 * @return Name of this unit model
	 */
	virtual const char* unitName() const SEQUIN_NOEXCEPT = 0;

	/**
	 * @brief Checks whether a given variable exists
	 * @param [in] path Path of the variable relative to the unit
	 * @return @c true if the variable exists, otherwise @c false
	 */
	virtual bool hasVariable(const std::string& path) const = 0;

	/**
	 * @brief Returns the value of a variable
	 * @param [in] path Path of the variable relative to the unit
	 * @return Value of the variable or @c NaN if the variable was not found or has no value
	 */
	virtual double getValue(const std::string& path) const = 0;

	/**
	 * @brief Sets the value of a variable
	 * @param [in] path Path of the variable relative to the unit
	 * @param [in] value Value
	 * @return @c true if the value has been set, otherwise @c false (variable not found)
	 */
	virtual bool setValue(const std::string& path, double value) = 0;

	/**
	 * @brief Sets the value of a variable and fixes it
	 * @param [in] path Path of the variable relative to the unit
	 * @param [in] value Value
	 * @return @c true if the variable has been fixed, otherwise @c false (variable not found)
	 */
	virtual bool fixVariable(const std::string& path, double value) = 0;

	/**
	 * @brief Unfixes a variable
	 * @param [in] path Path of the variable relative to the unit
	 * @return @c true if the variable has been unfixed, otherwise @c false (variable not found)
	 */
	virtual bool unfixVariable(const std::string& path) = 0;

	/**
	 * @brief Checks whether a given variable is fixed
	 * @param [in] path Path of the variable relative to the unit
	 * @return @c true if the variable exists and is fixed, otherwise @c false
	 */
	virtual bool isFixed(const std::string& path) const = 0;

	/**
	 * @brief Returns the number of unfixed variables minus the number of active constraints
	 * @return Degrees of freedom
	 */
	virtual int degreesOfFreedom() const = 0;

	/**
	 * @brief Initializes the unit model by sequential-modular decomposition
	 * @details The fixed and active state of the model is unchanged on return, also if the
	 *          solver does not converge. Variable values are left at the final iterate.
	 * @param [in] solverOptions Options of the nonlinear solver
	 * @return Status of the final coupled solve
	 */
	virtual SolverStatus initialize(IParameterProvider& solverOptions) = 0;

	/**
	 * @brief Solves the complete equation system of the unit model once
	 * @param [in] solverOptions Options of the nonlinear solver
	 * @return Status of the solve
	 */
	virtual SolverStatus solve(IParameterProvider& solverOptions) = 0;
};

} // namespace sequin

#endif  // LIBSEQUIN_MODEL_HPP_
