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

#include <vector>
#include <random>
#include <algorithm>
#include <cmath>

#include "linalg/DenseMatrix.hpp"
#include "linalg/Norms.hpp"

namespace
{
	/**
	 * @brief Creates a diagonally dominant matrix with normally distributed off-diagonal entries
	 * @param [in] n Number of rows and columns
	 * @param [in] seed Seed of the random number generator
	 * @return Random matrix
	 */
	inline sequin::linalg::DenseMatrix randomMatrix(unsigned int n, unsigned int seed)
	{
		std::default_random_engine generator(seed);
		std::normal_distribution<double> distribution(0.0, 1.0);

		sequin::linalg::DenseMatrix dm(n, n);
		for (unsigned int row = 0; row < dm.rows(); ++row)
		{
			for (unsigned int col = 0; col < dm.columns(); ++col)
				dm.native(row, col) = distribution(generator);

			dm.native(row, row) += 2.0 * n;
		}
		return dm;
	}

	inline std::vector<double> randomVector(unsigned int n, unsigned int seed)
	{
		std::default_random_engine generator(seed);
		std::normal_distribution<double> distribution(0.0, 1.0);

		std::vector<double> v(n, 0.0);
		for (unsigned int i = 0; i < n; ++i)
			v[i] = distribution(generator);

		return v;
	}
}

TEST_CASE("DenseMatrix multiplies vectors", "[DenseMatrix],[LinAlg]")
{
	sequin::linalg::DenseMatrix dm(2, 3);
	dm.native(0, 0) = 1.0;
	dm.native(0, 1) = 2.0;
	dm.native(0, 2) = 3.0;
	dm.native(1, 0) = -1.0;
	dm.native(1, 1) = 0.5;
	dm.native(1, 2) = 4.0;

	const std::vector<double> x = {1.0, 2.0, 3.0};

	SECTION("Plain product")
	{
		std::vector<double> y(2, 42.0);
		dm.multiplyVector(x.data(), y.data());
		CHECK(y[0] == RelApprox(14.0));
		CHECK(y[1] == RelApprox(12.0));
	}

	SECTION("Scaled and accumulated")
	{
		std::vector<double> y = {1.0, 2.0};
		dm.multiplyVector(x.data(), 2.0, -1.0, y.data());
		CHECK(y[0] == RelApprox(27.0));
		CHECK(y[1] == RelApprox(22.0));
	}
}

TEST_CASE("DenseMatrix LU solves", "[DenseMatrix],[LinAlg]")
{
	using sequin::linalg::DenseMatrix;

	const DenseMatrix dm = randomMatrix(8, 17);
	DenseMatrix fdm = dm;

	REQUIRE(fdm.factorize());

	std::vector<double> y = randomVector(dm.rows(), 23);

	std::vector<double> x = y;
	REQUIRE(fdm.solve(x.data()));

	// Calculate residual in y
	dm.multiplyVector(x.data(), 1.0, -1.0, y.data());
	REQUIRE(sequin::linalg::linfNorm(y.data(), y.size()) <= 1e-12);
}

TEST_CASE("DenseMatrix LU solves with row equilibration", "[DenseMatrix],[LinAlg]")
{
	using sequin::linalg::DenseMatrix;

	// Rows differ by many orders of magnitude like energy and mass balances
	DenseMatrix dm = randomMatrix(6, 5);
	for (unsigned int col = 0; col < dm.columns(); ++col)
	{
		dm.native(0, col) *= 1e6;
		dm.native(3, col) *= 1e-4;
	}

	DenseMatrix fdm = dm;
	std::vector<double> factors(dm.rows(), 0.0);
	fdm.rowScaleFactors(factors.data());
	CHECK(factors[0] > 1e6);
	CHECK(factors[3] < 1.0);

	fdm.scaleRows(factors.data());
	for (unsigned int row = 0; row < fdm.rows(); ++row)
	{
		double maxAbs = 0.0;
		for (unsigned int col = 0; col < fdm.columns(); ++col)
			maxAbs = std::max(maxAbs, std::abs(fdm.native(row, col)));
		CHECK(maxAbs == RelApprox(1.0));
	}

	REQUIRE(fdm.factorize());

	std::vector<double> y = randomVector(dm.rows(), 11);
	std::vector<double> x = y;
	REQUIRE(fdm.solve(factors.data(), x.data()));

	// Residual of each row relative to its magnitude
	const double xMax = sequin::linalg::linfNorm(x.data(), x.size());
	dm.multiplyVector(x.data(), 1.0, -1.0, y.data());
	for (unsigned int row = 0; row < dm.rows(); ++row)
		CHECK(std::abs(y[row]) / factors[row] <= 1e-10 * (1.0 + xMax));
}

TEST_CASE("DenseMatrix detects singular matrix", "[DenseMatrix],[LinAlg]")
{
	sequin::linalg::DenseMatrix dm(3, 3);
	dm.setAll(1.0);
	dm.native(1, 1) = 2.0;

	// First and last row are identical
	CHECK_FALSE(dm.factorize());
}

TEST_CASE("DenseMatrix copy and move", "[DenseMatrix],[LinAlg]")
{
	using sequin::linalg::DenseMatrix;

	DenseMatrix dm(2, 2);
	dm.setAll(3.0);

	DenseMatrix cpy(dm);
	cpy.native(0, 1) = -1.0;
	CHECK(dm.native(0, 1) == 3.0);
	CHECK(cpy.native(0, 0) == 3.0);

	DenseMatrix moved(std::move(cpy));
	CHECK(moved.native(0, 1) == -1.0);
	CHECK(cpy.data() == nullptr);
	CHECK(cpy.elements() == 0);

	DenseMatrix assigned;
	assigned = dm;
	CHECK(assigned.rows() == 2);
	CHECK(assigned.native(1, 1) == 3.0);

	assigned.resize(3, 1);
	CHECK(assigned.elements() == 3);
}
