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
 * Provides version info.
 */

#ifndef LIBSEQUIN_LIBVERSIONINFO_HPP_
#define LIBSEQUIN_LIBVERSIONINFO_HPP_

#include "sequin/LibExportImport.hpp"
#include "sequin/sequinCompilerInfo.hpp"

namespace sequin
{

	/**
	 * @brief Returns the version string of the libsequin library
	 * @sa sequinGetLibraryVersion()
	 * @return Version string
	 */
	SEQUIN_API const char* getLibraryVersion() SEQUIN_NOEXCEPT;

} // namespace sequin

extern "C"
{
	/**
	 * @brief Returns the version string of the libsequin library
	 * @return Version string
	 */
	SEQUIN_API const char* sequinGetLibraryVersion();
}

#endif  // LIBSEQUIN_LIBVERSIONINFO_HPP_
