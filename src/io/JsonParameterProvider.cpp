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

#include <nlohmann/json.hpp>

#include <fstream>

#include "common/JsonParameterProvider.hpp"
#include "sequin/Exceptions.hpp"

using json = nlohmann::json;

namespace
{
	/**
	 * @brief Returns the scalar stored in a field, unwrapping single element arrays
	 */
	inline const json& scalarField(const json& scope, const std::string& paramName)
	{
		const json& p = scope.at(paramName);
		if (p.is_array() && (p.size() == 1))
			return p[0];
		return p;
	}

	template <typename T>
	inline std::vector<T> arrayField(const json& scope, const std::string& paramName)
	{
		const json& p = scope.at(paramName);
		if (!p.is_array())
			return std::vector<T>(1, p.get<T>());
		return p.get<std::vector<T>>();
	}
}

namespace sequin
{

JsonParameterProvider::JsonParameterProvider() : _root(new json(json::object()))
{
	_opened.push(_root);
}

JsonParameterProvider::JsonParameterProvider(const char* data) : _root(new json(json::parse(data)))
{
	_opened.push(_root);
}

JsonParameterProvider::JsonParameterProvider(const std::string& data) : _root(new json(json::parse(data)))
{
	_opened.push(_root);
}

JsonParameterProvider::JsonParameterProvider(const json& data) : _root(new json(data))
{
	_opened.push(_root);
}

JsonParameterProvider::JsonParameterProvider(json* data) : _root(data)
{
	_opened.push(_root);
}

// Opened scopes point into the source tree, so a copy starts at its own root
JsonParameterProvider::JsonParameterProvider(const JsonParameterProvider& cpy) : _root(new json(*cpy._root))
{
	_opened.push(_root);
}

JsonParameterProvider::JsonParameterProvider(JsonParameterProvider&& cpy) SEQUIN_NOEXCEPT : _root(cpy._root), _opened(std::move(cpy._opened))
{
	cpy._root = nullptr;
	cpy._opened = std::stack<json*>();
}

JsonParameterProvider::~JsonParameterProvider() SEQUIN_NOEXCEPT
{
	delete _root;
}

JsonParameterProvider& JsonParameterProvider::operator=(const JsonParameterProvider& cpy)
{
	if (this == &cpy)
		return *this;

	delete _root;
	_root = new json(*cpy._root);
	_opened = std::stack<json*>();
	_opened.push(_root);
	return *this;
}

JsonParameterProvider& JsonParameterProvider::operator=(JsonParameterProvider&& cpy) SEQUIN_NOEXCEPT
{
	delete _root;
	_root = cpy._root;
	_opened = std::move(cpy._opened);
	cpy._root = nullptr;
	cpy._opened = std::stack<json*>();
	return *this;
}

double JsonParameterProvider::getDouble(const std::string& paramName)
{
	return scalarField(*_opened.top(), paramName).get<double>();
}

int JsonParameterProvider::getInt(const std::string& paramName)
{
	const json& p = scalarField(*_opened.top(), paramName);
	if (p.is_boolean())
		return p.get<bool>();
	return p.get<int>();
}

uint64_t JsonParameterProvider::getUint64(const std::string& paramName)
{
	return scalarField(*_opened.top(), paramName).get<uint64_t>();
}

bool JsonParameterProvider::getBool(const std::string& paramName)
{
	const json& p = scalarField(*_opened.top(), paramName);
	if (p.is_number_integer())
		return p.get<int>() != 0;
	return p.get<bool>();
}

std::string JsonParameterProvider::getString(const std::string& paramName)
{
	return scalarField(*_opened.top(), paramName).get<std::string>();
}

std::vector<double> JsonParameterProvider::getDoubleArray(const std::string& paramName)
{
	return arrayField<double>(*_opened.top(), paramName);
}

std::vector<int> JsonParameterProvider::getIntArray(const std::string& paramName)
{
	return arrayField<int>(*_opened.top(), paramName);
}

std::vector<bool> JsonParameterProvider::getBoolArray(const std::string& paramName)
{
	const json& p = _opened.top()->at(paramName);
	if (!p.is_array())
		return std::vector<bool>(1, getBool(paramName));

	std::vector<bool> vals(p.size());
	for (std::size_t i = 0; i < p.size(); ++i)
		vals[i] = p[i].is_number_integer() ? (p[i].get<int>() != 0) : p[i].get<bool>();
	return vals;
}

std::vector<std::string> JsonParameterProvider::getStringArray(const std::string& paramName)
{
	return arrayField<std::string>(*_opened.top(), paramName);
}

bool JsonParameterProvider::exists(const std::string& paramName)
{
	return _opened.top()->find(paramName) != _opened.top()->end();
}

bool JsonParameterProvider::isArray(const std::string& paramName)
{
	return _opened.top()->at(paramName).is_array();
}

bool JsonParameterProvider::isScope(const std::string& paramName)
{
	return _opened.top()->at(paramName).is_object();
}

std::size_t JsonParameterProvider::numElements(const std::string& paramName)
{
	return _opened.top()->at(paramName).size();
}

std::vector<std::string> JsonParameterProvider::parameterNames()
{
	std::vector<std::string> names;
	const json& scope = *_opened.top();
	if (!scope.is_object())
		return names;

	names.reserve(scope.size());
	for (json::const_iterator it = scope.begin(); it != scope.end(); ++it)
		names.push_back(it.key());
	return names;
}

void JsonParameterProvider::pushScope(const std::string& scope)
{
	json& s = _opened.top()->at(scope);
	if (!s.is_object())
		throw InvalidParameterException("Field " + scope + " is not a scope");

	_opened.push(&s);
}

void JsonParameterProvider::popScope()
{
	if (_opened.size() > 1)
		_opened.pop();
}

void JsonParameterProvider::addScope(const std::string& scope)
{
	if (!exists(scope))
		(*_opened.top())[scope] = json::object();
}

void JsonParameterProvider::set(const std::string& paramName, double val)
{
	(*_opened.top())[paramName] = val;
}

void JsonParameterProvider::set(const std::string& paramName, int val)
{
	(*_opened.top())[paramName] = val;
}

void JsonParameterProvider::set(const std::string& paramName, bool val)
{
	(*_opened.top())[paramName] = val;
}

void JsonParameterProvider::set(const std::string& paramName, char const* val)
{
	(*_opened.top())[paramName] = std::string(val);
}

void JsonParameterProvider::set(const std::string& paramName, const std::string& val)
{
	(*_opened.top())[paramName] = val;
}

void JsonParameterProvider::set(const std::string& paramName, const std::vector<double>& val)
{
	(*_opened.top())[paramName] = val;
}

void JsonParameterProvider::set(const std::string& paramName, const std::vector<std::string>& val)
{
	(*_opened.top())[paramName] = val;
}

void JsonParameterProvider::remove(const std::string& name)
{
	_opened.top()->erase(name);
}

void JsonParameterProvider::toFile(const std::string& fileName) const
{
	std::ofstream ofs(fileName, std::ios::out | std::ios::trunc);
	ofs << _root->dump(4);
}

JsonParameterProvider JsonParameterProvider::fromFile(const std::string& fileName)
{
	std::ifstream ifs(fileName);
	if (!ifs)
		throw InvalidParameterException("Cannot open options file " + fileName);

	json* root = new json();
	try
	{
		ifs >> (*root);
	}
	catch (const json::exception&)
	{
		delete root;
		throw;
	}

	return JsonParameterProvider(root);
}

std::ostream& operator<<(std::ostream& out, const JsonParameterProvider& jpp)
{
	out << jpp.data()->dump(4);
	return out;
}

} // namespace sequin
