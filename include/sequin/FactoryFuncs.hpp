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
 * Provides function for creating and destroying important classes.
 */

#ifndef LIBSEQUIN_FACTORYFUNCS_HPP_
#define LIBSEQUIN_FACTORYFUNCS_HPP_

#include "sequin/LibExportImport.hpp"
#include "sequin/sequinCompilerInfo.hpp"


namespace sequin
{

	class IModelBuilder;

	/**
	 * @brief Creates an IModelBuilder object
	 * @sa sequinCreateModelBuilder()
	 * @return IModelBuilder object or @c NULL if something went wrong
	 */
	SEQUIN_API IModelBuilder* createModelBuilder();

	/**
	 * @brief Destroys a given model builder
	 * @details Because a different memory space is assigned to dynamically loaded libraries,
	 *          memory allocated by the library has to be freed in the library. Thus, users
	 *          have to explicitly destroy their IModelBuilder objects here.
	 * @sa sequinDestroyModelBuilder()
	 * @param [in] builder IModelBuilder to be destroyed
	 */
	SEQUIN_API void destroyModelBuilder(IModelBuilder* const builder) SEQUIN_NOEXCEPT;

} // namespace sequin

extern "C"
{
	/**
	 * @brief Creates an IModelBuilder object
	 * @return IModelBuilder object or @c NULL if something went wrong
	 */
	SEQUIN_API sequin::IModelBuilder* sequinCreateModelBuilder();

	/**
	 * @brief Destroys a given model builder
	 * @param [in] builder IModelBuilder to be destroyed
	 */
	SEQUIN_API void sequinDestroyModelBuilder(sequin::IModelBuilder* const builder);
}


#endif  // LIBSEQUIN_FACTORYFUNCS_HPP_
