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

#include "model/Block.hpp"
#include "model/Variable.hpp"
#include "model/Port.hpp"
#include "sequin/Exceptions.hpp"

#include <cmath>
#include <limits>
#include <vector>

namespace
{
	sequin::model::Port* makePort(sequin::model::Block& owner, const std::string& name, sequin::model::PortDirection dir, double flow, double enth, double pressure)
	{
		sequin::model::Port* const p = new sequin::model::Port(name, dir, &owner);
		p->addMember("flow_mol", owner.addVariable(name + ".flow_mol", flow));
		p->addMember("enth_mol", owner.addVariable(name + ".enth_mol", enth));
		p->addMember("pressure", owner.addVariable(name + ".pressure", pressure));
		return p;
	}
}

TEST_CASE("Variable values and fixing", "[Variable]")
{
	sequin::model::Block root("root", nullptr);
	sequin::model::Variable* const x = root.addVariable("x");

	CHECK_FALSE(x->hasValue());
	CHECK(std::isnan(x->value()));
	CHECK(x->path() == "root.x");
	CHECK(x->lowerBound() == -std::numeric_limits<double>::infinity());
	CHECK(x->upperBound() == std::numeric_limits<double>::infinity());

	// Fixing without a value is an error
	CHECK_THROWS_AS(x->fix(), sequin::InvalidParameterException);
	CHECK_FALSE(x->isFixed());

	x->fix(2.5);
	CHECK(x->isFixed());
	CHECK(x->value() == 2.5);
	CHECK_THROWS_AS(x->clearValue(), sequin::InvalidParameterException);

	x->unfix();
	CHECK_FALSE(x->isFixed());
	CHECK(x->value() == 2.5);

	x->clearValue();
	CHECK_FALSE(x->hasValue());

	CHECK_THROWS_AS(x->setBounds(1.0, 0.0), sequin::InvalidParameterException);
	x->setBounds(0.0, 1.0);
	CHECK(x->lowerBound() == 0.0);
	CHECK(x->upperBound() == 1.0);
}

TEST_CASE("Block lookup and degrees of freedom", "[Block]")
{
	sequin::model::Block root("root", nullptr);
	sequin::model::Block* const child = root.adoptChild(new sequin::model::Block("child", &root));

	sequin::model::Variable* const a = root.addVariable("a", 1.0);
	sequin::model::Variable* const b = child->addVariable("in.b", 2.0);
	sequin::model::Variable* const c = child->addVariable("c", 3.0);

	CHECK_THROWS_AS(root.addVariable("a"), sequin::InvalidParameterException);
	sequin::model::Block orphan("orphan", nullptr);
	CHECK_THROWS_AS(root.adoptChild(&orphan), sequin::InvalidParameterException);

	CHECK(root.findVariable("a") == a);
	CHECK(root.findVariable("child.in.b") == b);
	CHECK(root.findVariable("child.c") == c);
	CHECK(root.findVariable("child.d") == nullptr);
	CHECK(root.findVariable("other.c") == nullptr);
	CHECK(root.findBlock("child") == child);
	CHECK(b->path() == "root.child.in.b");

	root.addConstraint("sum", std::vector<sequin::model::Variable*>{a, b, c}, [=]() { return a->value() + b->value() - c->value(); });
	sequin::model::Constraint* const eq = child->addConstraint("eq", std::vector<sequin::model::Variable*>{b, c}, [=]() { return b->value() - c->value(); }, 2.0);

	CHECK(root.findConstraint("child.eq") == eq);
	CHECK(eq->residual() == -2.0);

	// Three unknowns, two equations
	CHECK(root.degreesOfFreedom() == 1);
	a->fix();
	CHECK(root.degreesOfFreedom() == 0);

	eq->deactivate();
	CHECK(root.degreesOfFreedom() == 1);
	eq->activate();

	std::vector<sequin::model::Constraint*> cons;
	std::vector<sequin::model::Variable*> unknowns;
	root.activeSystem(cons, unknowns);
	REQUIRE(cons.size() == 2);
	REQUIRE(unknowns.size() == 2);
	CHECK(unknowns[0] == b);
	CHECK(unknowns[1] == c);
}

TEST_CASE("Unreferenced variables are not unknowns", "[Block]")
{
	sequin::model::Block root("root", nullptr);
	sequin::model::Variable* const a = root.addVariable("a", 1.0);
	root.addVariable("unused", 1.0);
	root.addConstraint("a_eq", std::vector<sequin::model::Variable*>{a}, [=]() { return a->value() - 1.0; });

	CHECK(root.degreesOfFreedom() == 0);
}

TEST_CASE("Special constraint determines a variable", "[Variable]")
{
	sequin::model::Block root("root", nullptr);
	sequin::model::Variable* const a = root.addVariable("a", 1.0);
	sequin::model::Variable* const b = root.addVariable("b", 1.0);
	sequin::model::Constraint* const c = root.addConstraint("c", std::vector<sequin::model::Variable*>{a}, [=]() { return a->value(); });

	CHECK_FALSE(c->isSpecial());
	c->determines(b);
	CHECK(c->isSpecial());
	CHECK(c->determinedVariable() == b);
	REQUIRE(c->variables().size() == 1);
	CHECK(c->variables()[0] == a);
}

TEST_CASE("Port propagation copies values but not fixed flags", "[Port]")
{
	sequin::model::Block root("root", nullptr);
	sequin::model::Port* const src = makePort(root, "out", sequin::model::PortDirection::Outlet, 10.0, 2000.0, 1e5);
	sequin::model::Port* const dst = makePort(root, "in", sequin::model::PortDirection::Inlet, 1.0, 1.0, 1.0);

	src->fix();
	CHECK(sequin::model::compatible(*src, *dst));
	CHECK(dst->path() == "root.in");

	sequin::model::propagate(*src, *dst);
	CHECK(dst->member("flow_mol")->value() == 10.0);
	CHECK(dst->member("enth_mol")->value() == 2000.0);
	CHECK(dst->member("pressure")->value() == 1e5);
	CHECK_FALSE(dst->member("flow_mol")->isFixed());
	CHECK_FALSE(dst->member("pressure")->isFixed());

	// Propagating twice equals propagating once
	sequin::model::propagate(*src, *dst);
	CHECK(dst->member("flow_mol")->value() == 10.0);
	CHECK(dst->member("enth_mol")->value() == 2000.0);
	CHECK(dst->member("pressure")->value() == 1e5);

	// Members without a value are skipped
	src->unfix();
	src->member("enth_mol")->clearValue();
	dst->member("enth_mol")->setValue(5.0);
	sequin::model::propagate(*src, *dst);
	CHECK(dst->member("enth_mol")->value() == 5.0);

	delete src;
	delete dst;
}

TEST_CASE("Port fixFree only fixes free members", "[Port]")
{
	sequin::model::Block root("root", nullptr);
	sequin::model::Port* const p = makePort(root, "in", sequin::model::PortDirection::Inlet, 1.0, 2.0, 3.0);
	p->member("pressure")->fix();

	std::vector<sequin::model::Variable*> fixed;
	p->fixFree(fixed);

	REQUIRE(fixed.size() == 2);
	CHECK(fixed[0] == p->member("flow_mol"));
	CHECK(fixed[1] == p->member("enth_mol"));
	CHECK(p->member("flow_mol")->isFixed());
	CHECK(p->member("enth_mol")->isFixed());
	CHECK(p->member("pressure")->isFixed());

	delete p;
}

TEST_CASE("Incompatible ports cannot be connected", "[Arc]")
{
	sequin::model::Block root("root", nullptr);
	sequin::model::Port* const src = makePort(root, "out", sequin::model::PortDirection::Outlet, 1.0, 2.0, 3.0);
	sequin::model::Port* const dst = new sequin::model::Port("in", sequin::model::PortDirection::Inlet, &root);
	dst->addMember("flow_mol", root.addVariable("in.flow_mol", 1.0));
	dst->addMember("pressure", root.addVariable("in.pressure", 1.0));

	CHECK_FALSE(sequin::model::compatible(*src, *dst));
	CHECK_THROWS_AS(sequin::model::Arc("bad", *src, *dst), sequin::AssemblyInvariantException);
	CHECK_THROWS_AS(sequin::model::propagate(*src, *dst), sequin::AssemblyInvariantException);

	delete src;
	delete dst;
}

TEST_CASE("Arc expansion creates scaled equality constraints", "[Arc]")
{
	sequin::model::Block root("root", nullptr);
	sequin::model::Port* const src = makePort(root, "out", sequin::model::PortDirection::Outlet, 10.0, 2000.0, 2e5);
	sequin::model::Port* const dst = makePort(root, "in", sequin::model::PortDirection::Inlet, 9.0, 1000.0, 1e5);

	const sequin::model::Arc arc("link", *src, *dst);
	arc.expand(root);

	REQUIRE(root.constraints().size() == 3);
	sequin::model::Constraint const* const flow = root.constraint("link.flow_mol");
	sequin::model::Constraint const* const enth = root.constraint("link.enth_mol");
	sequin::model::Constraint const* const pressure = root.constraint("link.pressure");
	REQUIRE(flow);
	REQUIRE(enth);
	REQUIRE(pressure);

	CHECK(flow->residual() == Approx(1.0));
	CHECK(enth->residual() == Approx(1.0));
	CHECK(pressure->residual() == Approx(1.0));

	arc.propagate();
	CHECK(flow->residual() == 0.0);
	CHECK(enth->residual() == 0.0);
	CHECK(pressure->residual() == 0.0);

	delete src;
	delete dst;
}
