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
 * Defines exceptions.
 */

#ifndef LIBSEQUIN_EXCEPTIONS_HPP_
#define LIBSEQUIN_EXCEPTIONS_HPP_

#include <stdexcept>

#include "sequin/LibExportImport.hpp"

namespace sequin
{

/**
 * @brief Signals invalid parameter or option values
 */
class SEQUIN_API InvalidParameterException : public std::domain_error
{
public:
	explicit InvalidParameterException(const std::string& what_arg) : std::domain_error(what_arg) { }
	explicit InvalidParameterException(const char* what_arg) : std::domain_error(what_arg) { }
};


/**
 * @brief Signals a configuration that does not match its schema
 * @details Raised during validation, that is, before any part of a unit is assembled.
 */
class SEQUIN_API ConfigurationException : public InvalidParameterException
{
public:
	explicit ConfigurationException(const std::string& what_arg) : InvalidParameterException(what_arg) { }
	explicit ConfigurationException(const char* what_arg) : InvalidParameterException(what_arg) { }
};


/**
 * @brief Signals a structural defect of an assembled unit
 * @details Raised for unwired or doubly wired ports, mismatching port layouts,
 *          and a nonzero number of degrees of freedom before a coupled solve.
 */
class SEQUIN_API AssemblyInvariantException : public std::runtime_error
{
public:
	explicit AssemblyInvariantException(const std::string& what_arg) : std::runtime_error(what_arg) { }
	explicit AssemblyInvariantException(const char* what_arg) : std::runtime_error(what_arg) { }
};


/**
 * @brief Signals that a snapshot does not fit the model it is restored to
 */
class SEQUIN_API SnapshotRestoreException : public std::runtime_error
{
public:
	explicit SnapshotRestoreException(const std::string& what_arg) : std::runtime_error(what_arg) { }
	explicit SnapshotRestoreException(const char* what_arg) : std::runtime_error(what_arg) { }
};


/**
 * @brief Signals errors while setting up a nonlinear solver
 */
class SEQUIN_API SolverException : public std::runtime_error
{
public:
	explicit SolverException(const std::string& what_arg) : std::runtime_error(what_arg) { }
	explicit SolverException(const char* what_arg) : std::runtime_error(what_arg) { }
};


} // namespace sequin

#endif  // LIBSEQUIN_EXCEPTIONS_HPP_
