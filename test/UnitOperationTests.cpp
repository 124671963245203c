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

#include <catch.hpp>
#include "Approx.hpp"

#include "UnitOperationTests.hpp"

#include "sequin/Model.hpp"
#include "sequin/ModelBuilder.hpp"
#include "common/JsonParameterProvider.hpp"

namespace sequin
{
namespace test
{

namespace unitoperation
{
	sequin::IModel* createAndConfigureUnit(const std::string& json, sequin::IModelBuilder& mb)
	{
		sequin::JsonParameterProvider jpp(json);
		sequin::IModel* const unit = mb.createUnit(jpp);
		REQUIRE(nullptr != unit);
		return unit;
	}

	void fixPort(sequin::IModel& unit, const std::string& port, double flow, double enth, double pressure)
	{
		REQUIRE(unit.fixVariable(port + ".flow_mol", flow));
		REQUIRE(unit.fixVariable(port + ".enth_mol", enth));
		REQUIRE(unit.fixVariable(port + ".pressure", pressure));
	}

	void fixHeatTransfer(sequin::IModel& unit, const std::string& prefix, double area, double coeff)
	{
		REQUIRE(unit.fixVariable(prefix + "area", area));
		REQUIRE(unit.fixVariable(prefix + "overall_heat_transfer_coefficient", coeff));
	}

	void checkHeatExchangerBalances(const sequin::IModel& unit, const std::string& prefix, double relTol)
	{
		const double q = unit.getValue(prefix + "heat_duty");
		const double f1 = unit.getValue(prefix + "inlet_1.flow_mol");
		const double f2 = unit.getValue(prefix + "inlet_2.flow_mol");

		CHECK(unit.getValue(prefix + "outlet_1.flow_mol") == RelApprox(f1).epsilon(relTol));
		CHECK(unit.getValue(prefix + "outlet_2.flow_mol") == RelApprox(f2).epsilon(relTol));

		// Heat released by side 1 is taken up by side 2
		const double q1 = f1 * (unit.getValue(prefix + "inlet_1.enth_mol") - unit.getValue(prefix + "outlet_1.enth_mol"));
		const double q2 = f2 * (unit.getValue(prefix + "outlet_2.enth_mol") - unit.getValue(prefix + "inlet_2.enth_mol"));
		CHECK(q1 == RelApprox(q).epsilon(relTol).margin(1e-3));
		CHECK(q2 == RelApprox(q).epsilon(relTol).margin(1e-3));

		const double u = unit.getValue(prefix + "overall_heat_transfer_coefficient");
		const double a = unit.getValue(prefix + "area");
		const double dT = unit.getValue(prefix + "delta_temperature");
		CHECK(q == RelApprox(u * a * dT).epsilon(relTol).margin(1e-3));
	}

} // namespace unitoperation

} // namespace test
} // namespace sequin
