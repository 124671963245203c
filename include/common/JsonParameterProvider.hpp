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
 * Defines a ParameterProvider that uses JSON.
 */

#ifndef SEQUIN_JSONPARAMETERPROVIDER_HPP_
#define SEQUIN_JSONPARAMETERPROVIDER_HPP_

#include "sequin/ParameterProvider.hpp"
#include "common/CompilerSpecific.hpp"

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <stack>
#include <ostream>

namespace sequin
{

/**
 * @brief ParameterProvider backed by a JSON document
 * @details Scalars wrapped in single element arrays are unwrapped on read,
 *          integers are accepted where booleans are requested. The setters
 *          write into the currently opened scope and are used for composing
 *          options in code.
 */
class SEQUIN_API JsonParameterProvider : public sequin::IParameterProvider
{
public:

	JsonParameterProvider();
	JsonParameterProvider(const char* data);
	JsonParameterProvider(const std::string& data);
	JsonParameterProvider(const nlohmann::json& data);
	JsonParameterProvider(const JsonParameterProvider& cpy);
	JsonParameterProvider(JsonParameterProvider&& cpy) SEQUIN_NOEXCEPT;

	virtual ~JsonParameterProvider() SEQUIN_NOEXCEPT;

	JsonParameterProvider& operator=(const JsonParameterProvider& cpy);
	JsonParameterProvider& operator=(JsonParameterProvider&& cpy) SEQUIN_NOEXCEPT;

	virtual double getDouble(const std::string& paramName);
	virtual int getInt(const std::string& paramName);
	virtual uint64_t getUint64(const std::string& paramName);
	virtual bool getBool(const std::string& paramName);
	virtual std::string getString(const std::string& paramName);
	virtual std::vector<double> getDoubleArray(const std::string& paramName);
	virtual std::vector<int> getIntArray(const std::string& paramName);
	virtual std::vector<bool> getBoolArray(const std::string& paramName);
	virtual std::vector<std::string> getStringArray(const std::string& paramName);
	virtual bool exists(const std::string& paramName);
	virtual bool isArray(const std::string& paramName);
	virtual bool isScope(const std::string& paramName);
	virtual std::size_t numElements(const std::string& paramName);
	virtual std::vector<std::string> parameterNames();
	virtual void pushScope(const std::string& scope);
	virtual void popScope();

	/**
	 * @brief Creates an empty subscope if it does not exist yet
	 * @param [in] scope Name of the scope
	 */
	void addScope(const std::string& scope);

	void set(const std::string& paramName, double val);
	void set(const std::string& paramName, int val);
	void set(const std::string& paramName, bool val);
	void set(const std::string& paramName, char const* val);
	void set(const std::string& paramName, const std::string& val);
	void set(const std::string& paramName, const std::vector<double>& val);
	void set(const std::string& paramName, const std::vector<std::string>& val);

	void remove(const std::string& name);

	inline nlohmann::json* data() { return _root; }
	inline nlohmann::json const* data() const { return _root; }

	void toFile(const std::string& fileName) const;
	static JsonParameterProvider fromFile(const std::string& fileName);

private:
	JsonParameterProvider(nlohmann::json* data);

	nlohmann::json* _root;
	std::stack<nlohmann::json*> _opened;
};

std::ostream& operator<<(std::ostream& out, const JsonParameterProvider& jpp);

} // namespace sequin

#endif  // SEQUIN_JSONPARAMETERPROVIDER_HPP_
