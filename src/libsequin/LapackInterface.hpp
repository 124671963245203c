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
 * Declares the LAPACK routines used by the dense linear algebra.
 */

#ifndef LIBSEQUIN_LAPACKINTERFACE_HPP_
#define LIBSEQUIN_LAPACKINTERFACE_HPP_

#ifdef SEQUIN_LAPACK_64BIT_INT
	#include <cstdint>
#endif

namespace sequin
{
	#ifdef SEQUIN_LAPACK_64BIT_INT
		typedef int64_t lapackInt_t;
	#else
		typedef int lapackInt_t;
	#endif

	// Determine LAPACK function names
	#ifdef SEQUIN_LAPACK_TRAILING_UNDERSCORE
		#ifdef SEQUIN_LAPACK_UPPERCASE
			#define SEQUIN_LAPACK_FUNC(nameLower, nameUpper) nameUpper##_
		#else
			#define SEQUIN_LAPACK_FUNC(nameLower, nameUpper) nameLower##_
		#endif
	#else
		#ifdef SEQUIN_LAPACK_PRECEDING_UNDERSCORE
			#ifdef SEQUIN_LAPACK_UPPERCASE
				#define SEQUIN_LAPACK_FUNC(nameLower, nameUpper) _##nameUpper
			#else
				#define SEQUIN_LAPACK_FUNC(nameLower, nameUpper) _##nameLower
			#endif
		#else
			#ifdef SEQUIN_LAPACK_UPPERCASE
				#define SEQUIN_LAPACK_FUNC(nameLower, nameUpper) nameUpper
			#else
				#define SEQUIN_LAPACK_FUNC(nameLower, nameUpper) nameLower
			#endif
		#endif
	#endif

	extern "C" void SEQUIN_LAPACK_FUNC(dgetrf,DGETRF) (lapackInt_t* m, lapackInt_t* n, double* A, lapackInt_t* lda, lapackInt_t* ipiv, lapackInt_t* info);

	extern "C" void SEQUIN_LAPACK_FUNC(dgetrs,DGETRS) (char* trans, lapackInt_t* n, lapackInt_t* nrhs, double* a, 
			lapackInt_t* lda, lapackInt_t* ipiv, double* b, lapackInt_t* ldb, lapackInt_t* info);

	extern "C" void SEQUIN_LAPACK_FUNC(dgemv,DGEMV) (char* trans, lapackInt_t* m, lapackInt_t* n,
			double* alpha, double* a, lapackInt_t* lda, double* x, lapackInt_t* incx, double* beta,
			double* y, lapackInt_t* incy);

	#define LapackFactorDense SEQUIN_LAPACK_FUNC(dgetrf,DGETRF)
	#define LapackSolveDense SEQUIN_LAPACK_FUNC(dgetrs,DGETRS)
	#define LapackMultiplyDense SEQUIN_LAPACK_FUNC(dgemv,DGEMV)
}

#endif  // LIBSEQUIN_LAPACKINTERFACE_HPP_
