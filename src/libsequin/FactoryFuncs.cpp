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

#include "sequin/LibVersionInfo.hpp"
#include "sequin/FactoryFuncs.hpp"
#include "ModelBuilderImpl.hpp"

namespace sequin
{

	const char* getLibraryVersion() SEQUIN_NOEXCEPT
	{
		return SEQUIN_VERSION;
	}

	IModelBuilder* createModelBuilder()
	{
		return new ModelBuilder();
	}

	void destroyModelBuilder(IModelBuilder* const builder) SEQUIN_NOEXCEPT
	{
		delete builder;
	}

} // namespace sequin

extern "C"
{
	const char* sequinGetLibraryVersion() { return sequin::getLibraryVersion(); }

	sequin::IModelBuilder* sequinCreateModelBuilder() { return sequin::createModelBuilder(); }

	void sequinDestroyModelBuilder(sequin::IModelBuilder* const builder) { sequin::destroyModelBuilder(builder); }
}
