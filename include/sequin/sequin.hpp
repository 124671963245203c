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
 * @mainpage SEQUIN
 * The library assembles steady-state unit models from optional sections and initializes
 * them by sequential-modular decomposition
 * 
 * @authors    Please refer to AUTHORS.md
 * @date       2008-present
 * @copyright  GNU General Public License v3.0 (or, at your option, any later version).
 */

/**
 * @file
 * Main include file for the public interface to SEQUIN.
 */

#include "sequin/sequinCompilerInfo.hpp"
#include "sequin/LibExportImport.hpp"
#include "sequin/LibVersionInfo.hpp"
#include "sequin/Exceptions.hpp"
#include "sequin/Logging.hpp"
#include "sequin/ParameterProvider.hpp"
#include "sequin/Model.hpp"
#include "sequin/ModelBuilder.hpp"
#include "sequin/FactoryFuncs.hpp"
