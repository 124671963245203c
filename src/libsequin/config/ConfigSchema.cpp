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

#include "config/ConfigSchema.hpp"
#include "sequin/ParameterProvider.hpp"
#include "sequin/Exceptions.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace sequin
{

namespace config
{

const char* to_string(OptionKind kind) SEQUIN_NOEXCEPT
{
	switch (kind)
	{
		case OptionKind::Bool:
			return "bool";
		case OptionKind::Int:
			return "int";
		case OptionKind::Double:
			return "double";
		case OptionKind::String:
			return "string";
		case OptionKind::Block:
			return "block";
		case OptionKind::ImplicitBlock:
			return "implicit block";
	}
	return "unknown";
}

namespace
{
	std::string qualified(const std::string& schemaName, const std::string& option)
	{
		if (schemaName.empty())
			return option;
		return schemaName + "/" + option;
	}

	json readImplicitScope(IParameterProvider& paramProvider)
	{
		json data = json::object();
		const std::vector<std::string> names = paramProvider.parameterNames();
		for (std::vector<std::string>::const_iterator it = names.begin(); it != names.end(); ++it)
		{
			const std::string& n = *it;
			if (paramProvider.isScope(n))
			{
				paramProvider.pushScope(n);
				try
				{
					data[n] = readImplicitScope(paramProvider);
				}
				catch (...)
				{
					paramProvider.popScope();
					throw;
				}
				paramProvider.popScope();
			}
			else if (paramProvider.isArray(n) && (paramProvider.numElements(n) != 1))
			{
				try
				{
					data[n] = paramProvider.getDoubleArray(n);
				}
				catch (const std::exception&)
				{
					data[n] = paramProvider.getStringArray(n);
				}
			}
			else
			{
				try
				{
					data[n] = paramProvider.getDouble(n);
				}
				catch (const std::exception&)
				{
					data[n] = paramProvider.getString(n);
				}
			}
		}
		return data;
	}
}

ConfigSchema::ConfigSchema() : _name() { }
ConfigSchema::ConfigSchema(const std::string& name) : _name(name) { }

OptionSpec& ConfigSchema::declare(const std::string& name, OptionKind kind, const std::string& description)
{
	if (option(name))
		throw InvalidParameterException("Option " + qualified(_name, name) + " is declared twice");

	OptionSpec spec;
	spec.name = name;
	spec.kind = kind;
	spec.description = description;
	spec.required = false;
	spec.minValue = -std::numeric_limits<double>::infinity();
	spec.maxValue = std::numeric_limits<double>::infinity();
	_options.push_back(spec);
	return _options.back();
}

ConfigSchema& ConfigSchema::declareBool(const std::string& name, bool defaultValue, const std::string& description)
{
	declare(name, OptionKind::Bool, description);
	_defaults = _defaults.with(name, defaultValue);
	return *this;
}

ConfigSchema& ConfigSchema::declareBool(const std::string& name, bool defaultValue, const std::vector<bool>& domain, const std::string& description)
{
	OptionSpec& spec = declare(name, OptionKind::Bool, description);
	spec.boolDomain = domain;
	_defaults = _defaults.with(name, defaultValue);
	return *this;
}

ConfigSchema& ConfigSchema::declareInt(const std::string& name, int defaultValue, int minValue, int maxValue, const std::string& description)
{
	OptionSpec& spec = declare(name, OptionKind::Int, description);
	spec.minValue = minValue;
	spec.maxValue = maxValue;
	_defaults = _defaults.with(name, defaultValue);
	return *this;
}

ConfigSchema& ConfigSchema::declareDouble(const std::string& name, double defaultValue, const std::string& description)
{
	declare(name, OptionKind::Double, description);
	_defaults = _defaults.with(name, defaultValue);
	return *this;
}

ConfigSchema& ConfigSchema::declareDouble(const std::string& name, double defaultValue, double minValue, double maxValue, const std::string& description)
{
	OptionSpec& spec = declare(name, OptionKind::Double, description);
	spec.minValue = minValue;
	spec.maxValue = maxValue;
	_defaults = _defaults.with(name, defaultValue);
	return *this;
}

ConfigSchema& ConfigSchema::declareString(const std::string& name, const std::string& defaultValue, const std::vector<std::string>& domain, const std::string& description)
{
	OptionSpec& spec = declare(name, OptionKind::String, description);
	spec.stringDomain = domain;
	_defaults = _defaults.with(name, defaultValue);
	return *this;
}

ConfigSchema& ConfigSchema::declareRequiredString(const std::string& name, const std::vector<std::string>& domain, const std::string& description)
{
	OptionSpec& spec = declare(name, OptionKind::String, description);
	spec.stringDomain = domain;
	spec.required = true;
	return *this;
}

ConfigSchema& ConfigSchema::declareBlock(const std::string& name, const ConfigSchema& schema, const std::string& description)
{
	OptionSpec& spec = declare(name, OptionKind::Block, description);
	spec.schema = std::make_shared<const ConfigSchema>(schema);
	return *this;
}

ConfigSchema& ConfigSchema::declareImplicitBlock(const std::string& name, const std::string& description)
{
	declare(name, OptionKind::ImplicitBlock, description);
	_defaults = _defaults.with(name, Configuration());
	return *this;
}

ConfigSchema& ConfigSchema::addCheck(Check check)
{
	_checks.push_back(check);
	return *this;
}

const OptionSpec* ConfigSchema::option(const std::string& name) const
{
	for (std::vector<OptionSpec>::const_iterator it = _options.begin(); it != _options.end(); ++it)
	{
		if (it->name == name)
			return &(*it);
	}
	return nullptr;
}

Configuration ConfigSchema::validate(IParameterProvider& paramProvider) const
{
	json data = json::object();

	const std::vector<std::string> names = paramProvider.parameterNames();
	for (std::vector<std::string>::const_iterator it = names.begin(); it != names.end(); ++it)
	{
		const std::string& n = *it;
		const OptionSpec* const spec = option(n);
		if (!spec)
			throw ConfigurationException("Unknown option " + qualified(_name, n));

		if ((spec->kind == OptionKind::Block) || (spec->kind == OptionKind::ImplicitBlock))
		{
			if (!paramProvider.isScope(n))
				throw ConfigurationException("Option " + qualified(_name, n) + " has to be a scope");

			paramProvider.pushScope(n);
			try
			{
				if (spec->kind == OptionKind::Block)
					data[n] = spec->schema->validate(paramProvider).data();
				else
					data[n] = readImplicitScope(paramProvider);
			}
			catch (...)
			{
				paramProvider.popScope();
				throw;
			}
			paramProvider.popScope();
			continue;
		}

		try
		{
			switch (spec->kind)
			{
				case OptionKind::Bool:
					data[n] = paramProvider.getBool(n);
					break;
				case OptionKind::Int:
					data[n] = paramProvider.getInt(n);
					break;
				case OptionKind::Double:
					data[n] = paramProvider.getDouble(n);
					break;
				case OptionKind::String:
					data[n] = paramProvider.getString(n);
					break;
				default:
					break;
			}
		}
		catch (const ConfigurationException&)
		{
			throw;
		}
		catch (const std::exception& e)
		{
			throw ConfigurationException("Option " + qualified(_name, n) + " is not of type " + to_string(spec->kind) + ": " + e.what());
		}
	}

	return validate(Configuration(data));
}

Configuration ConfigSchema::validate(const Configuration& given) const
{
	const json& in = given.data();
	json data = json::object();

	for (json::const_iterator it = in.begin(); it != in.end(); ++it)
	{
		if (!option(it.key()))
			throw ConfigurationException("Unknown option " + qualified(_name, it.key()));
	}

	for (std::vector<OptionSpec>::const_iterator it = _options.begin(); it != _options.end(); ++it)
	{
		const OptionSpec& spec = *it;
		const std::string qName = qualified(_name, spec.name);
		const json::const_iterator val = in.find(spec.name);

		if (val == in.end())
		{
			if (spec.required)
				throw ConfigurationException("Required option " + qName + " is missing");

			if (spec.kind == OptionKind::Block)
				data[spec.name] = spec.schema->defaults().data();
			else
				data[spec.name] = _defaults.data().at(spec.name);
			continue;
		}

		switch (spec.kind)
		{
			case OptionKind::Bool:
			{
				bool b = false;
				if (val->is_boolean())
					b = val->get<bool>();
				else if (val->is_number_integer())
					b = (val->get<int>() != 0);
				else
					throw ConfigurationException("Option " + qName + " has to be a boolean");

				if (!spec.boolDomain.empty() && (std::find(spec.boolDomain.begin(), spec.boolDomain.end(), b) == spec.boolDomain.end()))
					throw ConfigurationException("Value " + std::string(b ? "true" : "false") + " of option " + qName + " is not in its domain");

				data[spec.name] = b;
				break;
			}
			case OptionKind::Int:
			case OptionKind::Double:
			{
				if (!val->is_number() || ((spec.kind == OptionKind::Int) && !val->is_number_integer()))
					throw ConfigurationException("Option " + qName + " has to be of type " + to_string(spec.kind));

				const double d = val->get<double>();
				if ((d < spec.minValue) || (d > spec.maxValue))
				{
					std::ostringstream oss;
					oss << "Value " << d << " of option " << qName << " is not in [" << spec.minValue << ", " << spec.maxValue << "]";
					throw ConfigurationException(oss.str());
				}

				data[spec.name] = *val;
				break;
			}
			case OptionKind::String:
			{
				if (!val->is_string())
					throw ConfigurationException("Option " + qName + " has to be a string");

				const std::string s = val->get<std::string>();
				if (!spec.stringDomain.empty() && (std::find(spec.stringDomain.begin(), spec.stringDomain.end(), s) == spec.stringDomain.end()))
					throw ConfigurationException("Value " + s + " of option " + qName + " is not in its domain");

				data[spec.name] = s;
				break;
			}
			case OptionKind::Block:
				if (!val->is_object())
					throw ConfigurationException("Option " + qName + " has to be a scope");

				data[spec.name] = spec.schema->validate(Configuration(*val)).data();
				break;
			case OptionKind::ImplicitBlock:
				if (!val->is_object())
					throw ConfigurationException("Option " + qName + " has to be a scope");

				data[spec.name] = *val;
				break;
		}
	}

	const Configuration cfg(data);
	runChecks(cfg);
	return cfg;
}

Configuration ConfigSchema::defaults() const
{
	return validate(Configuration());
}

void ConfigSchema::runChecks(const Configuration& cfg) const
{
	for (std::vector<Check>::const_iterator it = _checks.begin(); it != _checks.end(); ++it)
		(*it)(cfg);
}

} // namespace config

} // namespace sequin
