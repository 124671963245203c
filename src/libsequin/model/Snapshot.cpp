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

#include "model/Snapshot.hpp"
#include "model/Block.hpp"
#include "sequin/Exceptions.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

namespace sequin
{

namespace model
{

bool StoreSpec::storesValueOf(const Variable& var) const SEQUIN_NOEXCEPT
{
	return _value && var.hasValue() && (!_onlyFixed || var.isFixed());
}

namespace
{
	inline std::string relativePath(const std::string& fullPath, std::size_t prefixLength)
	{
		return fullPath.substr(prefixLength);
	}

	bool recordLess(const SnapshotRecord& a, const SnapshotRecord& b)
	{
		if (a.path == b.path)
			return a.kind < b.kind;
		return a.path < b.path;
	}
}

Snapshot Snapshot::capture(const Block& root, const StoreSpec& spec)
{
	Snapshot snap(spec);

	// Paths are stored relative to the root
	const std::size_t prefixLength = root.path().size() + 1;

	std::vector<Variable*> vars;
	root.collectVariables(vars);

	for (std::vector<Variable*>::const_iterator it = vars.begin(); it != vars.end(); ++it)
	{
		const Variable& v = **it;
		const bool withValue = spec.storesValueOf(v);
		if (!spec.storesFixed() && !withValue)
			continue;

		SnapshotRecord rec;
		rec.path = relativePath(v.path(), prefixLength);
		rec.kind = SnapshotRecord::Kind::Variable;
		rec.fixed = v.isFixed();
		rec.active = true;
		rec.hasValue = withValue;
		rec.value = withValue ? v.value() : 0.0;
		snap._records.push_back(rec);
	}

	if (spec.storesActive())
	{
		std::vector<Constraint*> cons;
		root.collectConstraints(cons);

		for (std::vector<Constraint*>::const_iterator it = cons.begin(); it != cons.end(); ++it)
		{
			SnapshotRecord rec;
			rec.path = relativePath((*it)->path(), prefixLength);
			rec.kind = SnapshotRecord::Kind::Constraint;
			rec.fixed = false;
			rec.active = (*it)->isActive();
			rec.hasValue = false;
			rec.value = 0.0;
			snap._records.push_back(rec);
		}
	}

	std::stable_sort(snap._records.begin(), snap._records.end(), recordLess);
	return snap;
}

void Snapshot::restore(Block& root) const
{
	std::vector<Variable*> vars(_records.size(), nullptr);
	std::vector<Constraint*> cons(_records.size(), nullptr);

	// Resolve everything before writing
	for (std::size_t i = 0; i < _records.size(); ++i)
	{
		const SnapshotRecord& rec = _records[i];
		if (rec.kind == SnapshotRecord::Kind::Variable)
			vars[i] = root.findVariable(rec.path);
		else
			cons[i] = root.findConstraint(rec.path);

		if (!vars[i] && !cons[i])
			throw SnapshotRestoreException("Cannot restore " + rec.path + " which is no longer present in " + root.path());

		if (vars[i] && _spec.storesFixed() && rec.fixed && !rec.hasValue && !vars[i]->hasValue())
			throw SnapshotRestoreException("Cannot restore fixed state of " + rec.path + " which has lost its value");
	}

	for (std::size_t i = 0; i < _records.size(); ++i)
	{
		const SnapshotRecord& rec = _records[i];
		if (vars[i])
		{
			if (rec.hasValue)
				vars[i]->setValue(rec.value);

			if (_spec.storesFixed())
			{
				if (rec.fixed)
					vars[i]->fix();
				else
					vars[i]->unfix();
			}
		}
		else
		{
			if (rec.active)
				cons[i]->activate();
			else
				cons[i]->deactivate();
		}
	}
}

nlohmann::json Snapshot::toJson() const
{
	nlohmann::json arr = nlohmann::json::array();
	for (std::vector<SnapshotRecord>::const_iterator it = _records.begin(); it != _records.end(); ++it)
	{
		nlohmann::json rec;
		rec["path"] = it->path;
		if (it->kind == SnapshotRecord::Kind::Variable)
		{
			rec["kind"] = "variable";
			if (_spec.storesFixed())
				rec["fixed"] = it->fixed;
			if (it->hasValue)
				rec["value"] = it->value;
		}
		else
		{
			rec["kind"] = "constraint";
			rec["active"] = it->active;
		}
		arr.push_back(rec);
	}
	return arr;
}

} // namespace model

} // namespace sequin
