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
 * Provides capture and restore of the fixed/active state of a block subtree.
 */

#ifndef LIBSEQUIN_SNAPSHOT_HPP_
#define LIBSEQUIN_SNAPSHOT_HPP_

#include "sequin/sequinCompilerInfo.hpp"

#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace sequin
{

namespace model
{

class Block;
class Variable;

/**
 * @brief Selects the state that is captured by a Snapshot
 */
class StoreSpec
{
public:

	/**
	 * @brief Captures fixed flags of all variables, active flags of all constraints, and values
	 * @param [in] onlyFixed Determines whether values are captured only for fixed variables
	 * @return Store specification
	 */
	static StoreSpec valueIsFixedIsActive(bool onlyFixed = true) { return StoreSpec(true, onlyFixed, true, true); }

	/**
	 * @brief Captures fixed flags of all variables and active flags of all constraints
	 * @return Store specification
	 */
	static StoreSpec isFixedIsActive() { return StoreSpec(false, false, true, true); }

	/**
	 * @brief Captures the values of all variables
	 * @return Store specification
	 */
	static StoreSpec value() { return StoreSpec(true, false, false, false); }

	inline bool storesFixed() const SEQUIN_NOEXCEPT { return _fixed; }
	inline bool storesActive() const SEQUIN_NOEXCEPT { return _active; }

	/**
	 * @brief Checks whether the value of the given variable is captured
	 * @param [in] var Variable
	 * @return @c true if the value is captured, otherwise @c false
	 */
	bool storesValueOf(const Variable& var) const SEQUIN_NOEXCEPT;

private:
	StoreSpec(bool value, bool onlyFixed, bool fixed, bool active) : _value(value), _onlyFixed(onlyFixed), _fixed(fixed), _active(active) { }

	bool _value;
	bool _onlyFixed;
	bool _fixed;
	bool _active;
};

/**
 * @brief Captured state of a variable or constraint
 */
struct SnapshotRecord
{
	enum class Kind : int
	{
		Variable,
		Constraint
	};

	std::string path; //!< Path relative to the captured block
	Kind kind;
	bool fixed; //!< Fixed flag (variables)
	bool active; //!< Active flag (constraints)
	bool hasValue; //!< Determines whether a value has been captured
	double value; //!< Captured value (variables)
};

/**
 * @brief Immutable record of the state of a block subtree
 * @details Records are ordered by path. A snapshot only refers to its elements by path,
 *          so it can be restored into the same subtree any number of times.
 */
class Snapshot
{
public:

	/**
	 * @brief Captures the state of the subtree rooted at @p root
	 * @param [in] root Root block
	 * @param [in] spec Selects the captured state
	 * @return Snapshot
	 */
	static Snapshot capture(const Block& root, const StoreSpec& spec);

	/**
	 * @brief Writes the captured state back into the subtree rooted at @p root
	 * @details All paths are resolved before anything is written. If a path cannot be
	 *          resolved, a SnapshotRestoreException is thrown and the subtree is left unchanged.
	 *          Elements that are not captured are left untouched.
	 * @param [in,out] root Root block
	 */
	void restore(Block& root) const;

	inline const std::vector<SnapshotRecord>& records() const SEQUIN_NOEXCEPT { return _records; }
	inline unsigned int size() const SEQUIN_NOEXCEPT { return _records.size(); }
	inline const StoreSpec& spec() const SEQUIN_NOEXCEPT { return _spec; }

	/**
	 * @brief Serializes the snapshot into an ordered JSON array of records
	 * @return JSON array
	 */
	nlohmann::json toJson() const;

private:
	Snapshot(const StoreSpec& spec) : _spec(spec) { }

	StoreSpec _spec;
	std::vector<SnapshotRecord> _records;
};

} // namespace model

} // namespace sequin

#endif  // LIBSEQUIN_SNAPSHOT_HPP_
