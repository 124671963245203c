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

#include "model/EquationBlock.hpp"
#include "model/Block.hpp"
#include "linalg/DenseMatrix.hpp"
#include "linalg/Norms.hpp"

#include <cmath>
#include <limits>
#include <algorithm>

namespace sequin
{

namespace model
{

EquationBlock::EquationBlock(Block& root) : _root(root)
{
	root.activeSystem(_constraints, _unknowns);
	_work.resize(2 * _constraints.size());
	computeScaling();
}

void EquationBlock::computeScaling()
{
	_scaling.resize(_unknowns.size());
	for (unsigned int i = 0; i < _unknowns.size(); ++i)
	{
		const Variable* const v = _unknowns[i];
		_scaling[i] = v->hasValue() ? std::max(std::abs(v->value()), 1.0) : 1.0;
		if (!std::isfinite(_scaling[i]))
			_scaling[i] = 1.0;
	}
}

void EquationBlock::gather(double* const x) const
{
	for (unsigned int i = 0; i < _unknowns.size(); ++i)
	{
		const Variable* const v = _unknowns[i];
		x[i] = v->hasValue() ? v->value() / _scaling[i] : 0.0;
	}
}

void EquationBlock::scatter(double const* const x)
{
	for (unsigned int i = 0; i < _unknowns.size(); ++i)
		_unknowns[i]->setValue(x[i] * _scaling[i]);
}

bool EquationBlock::residual(double const* const x, double* const res)
{
	scatter(x);
	return residual(res);
}

bool EquationBlock::residual(double* const res) const
{
	bool finite = true;
	for (unsigned int i = 0; i < _constraints.size(); ++i)
	{
		res[i] = _constraints[i]->residual();
		finite = finite && std::isfinite(res[i]);
	}
	return finite;
}

bool EquationBlock::jacobian(double const* const x, linalg::detail::DenseMatrixBase& jac)
{
	const unsigned int nEq = _constraints.size();
	double* const r0 = _work.data();
	double* const r1 = _work.data() + nEq;

	if (!residual(x, r0))
		return false;

	const double sqrtEps = std::sqrt(std::numeric_limits<double>::epsilon());
	bool finite = true;
	for (unsigned int j = 0; j < _unknowns.size(); ++j)
	{
		Variable* const v = _unknowns[j];
		const double h = sqrtEps * std::max(std::abs(x[j]), 1.0);
		v->setValue((x[j] + h) * _scaling[j]);

		finite = residual(r1) && finite;
		for (unsigned int i = 0; i < nEq; ++i)
			jac.native(i, j) = (r1[i] - r0[i]) / h;

		v->setValue(x[j] * _scaling[j]);
	}

	return finite;
}

double EquationBlock::residualNorm() const
{
	std::vector<double> res(_constraints.size());
	if (!residual(res.data()))
		return std::numeric_limits<double>::infinity();
	return linalg::linfNorm(res.data(), res.size());
}

} // namespace model

} // namespace sequin
