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
 * Defines preprocessor macros for importing and exporting symbols from and to dynamic libraries.
 */

#ifndef LIBSEQUIN_LIBEXPORT_HPP_
#define LIBSEQUIN_LIBEXPORT_HPP_


// Export and import classes when using MS Visual Studio compiler
#ifndef SEQUIN_API
	#ifdef _MSC_VER
		#if defined(libsequin_shared_EXPORTS) || defined(libsequin_static_EXPORTS) || defined(libsequin_EXPORTS)
			#define SEQUIN_API _declspec(dllexport)
		#else
			#define SEQUIN_API _declspec(dllimport)
		#endif
	#else
		#define SEQUIN_API __attribute__((visibility("default")))
	#endif
#endif

#endif  // LIBSEQUIN_LIBEXPORT_HPP_
