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
#include <cmath>
#include <vector>
#include <memory>
#include <string>

#include "Approx.hpp"

#include "linalg/DenseMatrix.hpp"
#include "nonlin/Solver.hpp"
#include "nonlin/CompositeSolver.hpp"
#include "common/JsonParameterProvider.hpp"
#include "sequin/Exceptions.hpp"

namespace
{
	// x0 * x1 = 4, x0 = x1 with solution (2, 2)
	bool productResidual(double const* const x, double* const res)
	{
		res[0] = x[0] * x[1] - 4.0;
		res[1] = x[0] - x[1];
		return true;
	}

	bool productJacobian(double const* const x, sequin::linalg::detail::DenseMatrixBase& jac)
	{
		jac.native(0, 0) = x[1];
		jac.native(0, 1) = x[0];
		jac.native(1, 0) = 1.0;
		jac.native(1, 1) = -1.0;
		return true;
	}

	// x^2 + 1 = 0 has no real solution
	bool noRootResidual(double const* const x, double* const res)
	{
		res[0] = x[0] * x[0] + 1.0;
		return true;
	}

	bool noRootJacobian(double const* const x, sequin::linalg::detail::DenseMatrixBase& jac)
	{
		jac.native(0, 0) = 2.0 * x[0];
		return true;
	}

	bool solveProduct(const std::string& solverName, const char* config, std::vector<double>& point)
	{
		std::unique_ptr<sequin::nonlin::Solver> solver(sequin::nonlin::createSolver(solverName));
		REQUIRE(solver);
		CHECK(solver->name() == solverName);

		sequin::JsonParameterProvider jpp(config);
		REQUIRE(solver->configure(jpp));

		std::vector<double> mem(solver->workspaceSize(2), 0.0);
		sequin::linalg::DenseMatrix jac(2, 2);
		return solver->solve(&productResidual, &productJacobian, 1e-10, point.data(), mem.data(), jac, 2);
	}
}

TEST_CASE("Nonlinear solvers find the root of a small system", "[NonlinearSolver]")
{
	const std::vector<std::string> names = {"ATRN_RES", "ATRN_ERR", "COMPOSITE"};
	for (const std::string& name : names)
	{
		SECTION(name)
		{
			std::vector<double> point = {1.0, 3.0};
			REQUIRE(solveProduct(name, "{}", point));
			CHECK(point[0] == RelApprox(2.0).epsilon(1e-6));
			CHECK(point[1] == RelApprox(2.0).epsilon(1e-6));

			double res[2];
			productResidual(point.data(), res);
			CHECK(std::abs(res[0]) <= 1e-8);
			CHECK(std::abs(res[1]) <= 1e-8);
		}
	}
}

TEST_CASE("Nonlinear solvers accept full initial damping", "[NonlinearSolver]")
{
	std::vector<double> point = {1.0, 3.0};
	REQUIRE(solveProduct("ATRN_ERR", R"json({ "INIT_DAMPING": 1.0, "MIN_DAMPING": 1e-6, "MAX_ITERATIONS": 100 })json", point));
	CHECK(point[0] == RelApprox(2.0).epsilon(1e-6));
	CHECK(point[1] == RelApprox(2.0).epsilon(1e-6));
}

TEST_CASE("Nonlinear solvers report failure", "[NonlinearSolver]")
{
	const std::vector<std::string> names = {"ATRN_RES", "ATRN_ERR", "COMPOSITE"};
	for (const std::string& name : names)
	{
		SECTION(name)
		{
			std::unique_ptr<sequin::nonlin::Solver> solver(sequin::nonlin::createSolver(name));
			REQUIRE(solver);

			sequin::JsonParameterProvider jpp(R"json({ "MAX_ITERATIONS": 20 })json");
			REQUIRE(solver->configure(jpp));

			std::vector<double> mem(solver->workspaceSize(1), 0.0);
			sequin::linalg::DenseMatrix jac(1, 1);
			double point = 1.0;
			CHECK_FALSE(solver->solve(&noRootResidual, &noRootJacobian, 1e-10, &point, mem.data(), jac, 1));
		}
	}
}

TEST_CASE("Nonlinear solver factory", "[NonlinearSolver]")
{
	CHECK(sequin::nonlin::createSolver("PTC") == nullptr);

	// Empty name selects the default composite solver
	std::unique_ptr<sequin::nonlin::Solver> def(sequin::nonlin::createSolver(""));
	REQUIRE(def);
	CHECK(std::string(def->name()) == "COMPOSITE");

	std::unique_ptr<sequin::nonlin::Solver> res(sequin::nonlin::createSolver("ATRN_RES"));
	REQUIRE(res);
	CHECK(res->workspaceSize(3) == 15);
}

TEST_CASE("Nonlinear solver options are validated", "[NonlinearSolver]")
{
	std::unique_ptr<sequin::nonlin::Solver> solver(sequin::nonlin::createSolver("ATRN_RES"));
	REQUIRE(solver);

	SECTION("Initial damping above one")
	{
		sequin::JsonParameterProvider jpp(R"json({ "INIT_DAMPING": 1.5 })json");
		CHECK_THROWS_AS(solver->configure(jpp), sequin::InvalidParameterException);
	}

	SECTION("Minimal damping above initial damping")
	{
		sequin::JsonParameterProvider jpp(R"json({ "INIT_DAMPING": 0.1, "MIN_DAMPING": 0.5 })json");
		CHECK_THROWS_AS(solver->configure(jpp), sequin::InvalidParameterException);
	}

	SECTION("Non-positive iteration count")
	{
		sequin::JsonParameterProvider jpp(R"json({ "MAX_ITERATIONS": 0 })json");
		CHECK_THROWS_AS(solver->configure(jpp), sequin::InvalidParameterException);
	}
}

TEST_CASE("Composite solver subsolvers", "[NonlinearSolver]")
{
	SECTION("Default subsolvers")
	{
		sequin::nonlin::CompositeSolver solver;
		sequin::JsonParameterProvider jpp("{}");
		REQUIRE(solver.configure(jpp));
		CHECK(solver.workspaceSize(2) == 10);
	}

	SECTION("Subsolvers replace the defaults")
	{
		sequin::nonlin::CompositeSolver solver;
		sequin::JsonParameterProvider jpp(R"json({ "SUBSOLVERS": ["ATRN_RES"] })json");
		REQUIRE(solver.configure(jpp));

		std::vector<double> point = {1.0, 3.0};
		std::vector<double> mem(solver.workspaceSize(2), 0.0);
		sequin::linalg::DenseMatrix jac(2, 2);
		REQUIRE(solver.solve(&productResidual, &productJacobian, 1e-10, point.data(), mem.data(), jac, 2));
		CHECK(point[0] == RelApprox(2.0).epsilon(1e-6));
	}

	SECTION("Unknown subsolver")
	{
		sequin::nonlin::CompositeSolver solver;
		sequin::JsonParameterProvider jpp(R"json({ "SUBSOLVERS": ["ATRN_RES", "NEWTON"] })json");
		CHECK_THROWS_AS(solver.configure(jpp), sequin::SolverException);
	}

	SECTION("Composite cannot contain itself")
	{
		sequin::nonlin::CompositeSolver solver;
		sequin::JsonParameterProvider jpp(R"json({ "SUBSOLVERS": ["COMPOSITE"] })json");
		CHECK_THROWS_AS(solver.configure(jpp), sequin::SolverException);
	}

	SECTION("Empty subsolver name")
	{
		sequin::nonlin::CompositeSolver solver;
		sequin::JsonParameterProvider jpp(R"json({ "SUBSOLVERS": [""] })json");
		CHECK_THROWS_AS(solver.configure(jpp), sequin::SolverException);
	}

	SECTION("Composite identifier selects the default subsolvers")
	{
		std::unique_ptr<sequin::nonlin::Solver> solver(sequin::nonlin::createSolver("COMPOSITE"));
		REQUIRE(solver);
		CHECK(solver->workspaceSize(2) == 10);
	}
}
