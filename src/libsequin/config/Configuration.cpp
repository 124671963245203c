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

#include "config/Configuration.hpp"
#include "sequin/Exceptions.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace sequin
{

namespace config
{

namespace
{
	template <typename T>
	Configuration derive(const json& data, const std::string& name, const T& value)
	{
		json d = data;
		d[name] = value;
		return Configuration(d);
	}
}

Configuration::Configuration() : _data(std::make_shared<const json>(json::object())) { }

Configuration::Configuration(const json& data) : _data(std::make_shared<const json>(data))
{
	if (!_data->is_object())
		throw ConfigurationException("Configuration has to be a JSON object");
}

bool Configuration::has(const std::string& name) const
{
	return _data->find(name) != _data->end();
}

bool Configuration::isScope(const std::string& name) const
{
	const json::const_iterator it = _data->find(name);
	return (it != _data->end()) && it->is_object();
}

std::vector<std::string> Configuration::optionNames() const
{
	std::vector<std::string> names;
	names.reserve(_data->size());
	for (json::const_iterator it = _data->begin(); it != _data->end(); ++it)
		names.push_back(it.key());
	return names;
}

bool Configuration::getBool(const std::string& name) const
{
	const json::const_iterator it = _data->find(name);
	if ((it == _data->end()) || !it->is_boolean())
		throw ConfigurationException("Option " + name + " is missing or not a boolean");
	return it->get<bool>();
}

int Configuration::getInt(const std::string& name) const
{
	const json::const_iterator it = _data->find(name);
	if ((it == _data->end()) || !it->is_number_integer())
		throw ConfigurationException("Option " + name + " is missing or not an integer");
	return it->get<int>();
}

double Configuration::getDouble(const std::string& name) const
{
	const json::const_iterator it = _data->find(name);
	if ((it == _data->end()) || !it->is_number())
		throw ConfigurationException("Option " + name + " is missing or not a number");
	return it->get<double>();
}

std::string Configuration::getString(const std::string& name) const
{
	const json::const_iterator it = _data->find(name);
	if ((it == _data->end()) || !it->is_string())
		throw ConfigurationException("Option " + name + " is missing or not a string");
	return it->get<std::string>();
}

Configuration Configuration::scope(const std::string& name) const
{
	const json::const_iterator it = _data->find(name);
	if ((it == _data->end()) || !it->is_object())
		throw ConfigurationException("Option " + name + " is missing or not a scope");
	return Configuration(*it);
}

Configuration Configuration::with(const std::string& name, bool value) const { return derive(*_data, name, value); }
Configuration Configuration::with(const std::string& name, int value) const { return derive(*_data, name, value); }
Configuration Configuration::with(const std::string& name, double value) const { return derive(*_data, name, value); }
Configuration Configuration::with(const std::string& name, const char* value) const { return derive(*_data, name, std::string(value)); }
Configuration Configuration::with(const std::string& name, const std::string& value) const { return derive(*_data, name, value); }
Configuration Configuration::with(const std::string& name, const Configuration& value) const { return derive(*_data, name, value.data()); }

std::string Configuration::dump() const
{
	return _data->dump();
}

} // namespace config

} // namespace sequin
