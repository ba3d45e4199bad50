/***********************************************************************************************************************
*                                                                                                                      *
* vanhal                                                                                                               *
*                                                                                                                      *
* Copyright (c) 2012-2024 Andrew D. Zonenberg and contributors                                                         *
* All rights reserved.                                                                                                 *
*                                                                                                                      *
* Redistribution and use in source and binary forms, with or without modification, are permitted provided that the     *
* following conditions are met:                                                                                        *
*                                                                                                                      *
*    * Redistributions of source code must retain the above copyright notice, this list of conditions, and the         *
*      following disclaimer.                                                                                           *
*                                                                                                                      *
*    * Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the       *
*      following disclaimer in the documentation and/or other materials provided with the distribution.                *
*                                                                                                                      *
*    * Neither the name of the author nor the names of any contributors may be used to endorse or promote products     *
*      derived from this software without specific prior written permission.                                           *
*                                                                                                                      *
* THIS SOFTWARE IS PROVIDED BY THE AUTHORS "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED   *
* TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL *
* THE AUTHORS BE HELD LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES        *
* (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR       *
* BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT *
* (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE       *
* POSSIBILITY OF SUCH DAMAGE.                                                                                          *
*                                                                                                                      *
***********************************************************************************************************************/

/**
	@file
	@brief Implementation of ConfigurableNode
 */

#include "vanhal.h"

using namespace std;

DecoderParameter ConfigurableNode::m_invalidParameter;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

ConfigurableNode::ConfigurableNode()
{
}

ConfigurableNode::~ConfigurableNode()
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Accessors

/**
	@brief Gets a parameter by name

	Unknown names are reported and return a scratch parameter that is not part of the configuration.
 */
DecoderParameter& ConfigurableNode::GetParameter(const string& s)
{
	auto it = m_parameters.find(s);
	if(it == m_parameters.end())
	{
		LogError("Invalid parameter name \"%s\"\n", s.c_str());
		m_invalidParameter = DecoderParameter();
		return m_invalidParameter;
	}

	return it->second;
}

const DecoderParameter& ConfigurableNode::GetParameter(const string& s) const
{
	auto it = m_parameters.find(s);
	if(it == m_parameters.end())
	{
		LogError("Invalid parameter name \"%s\"\n", s.c_str());
		return m_invalidParameter;
	}

	return it->second;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Serialization

/**
	@brief Serializes this node's configuration to a YAML node

	@return YAML block with one string-valued entry per parameter, under "parameters"
 */
YAML::Node ConfigurableNode::SerializeConfiguration() const
{
	YAML::Node node;

	YAML::Node parameters;
	for(auto& it : m_parameters)
		parameters[it.first] = it.second.ToString();
	node["parameters"] = parameters;

	return node;
}

/**
	@brief Loads parameter values from a YAML node produced by SerializeConfiguration()

	Parameters not mentioned in the node keep their current value.

	@return True if every entry was applied, false if any entry was unknown or malformed
 */
bool ConfigurableNode::LoadParameters(const YAML::Node& node)
{
	bool ok = true;

	try
	{
		auto parameters = node["parameters"];
		if(!parameters)
			return true;
		if(!parameters.IsMap())
		{
			LogError("\"parameters\" must be a map\n");
			return false;
		}

		for(auto it : parameters)
		{
			auto name = it.first.as<string>();
			if(!HasParameter(name))
			{
				LogWarning("Ignoring unknown parameter \"%s\"\n", name.c_str());
				ok = false;
				continue;
			}

			if(!m_parameters[name].ParseString(it.second.as<string>()))
			{
				LogError("Bad value for parameter \"%s\"\n", name.c_str());
				ok = false;
			}
		}
	}
	catch(const YAML::Exception& ex)
	{
		LogError("Malformed configuration: %s\n", ex.what());
		return false;
	}

	return ok;
}

/**
	@brief Loads the configuration from a YAML file

	@return True on success, false if the file could not be read or contained bad values
 */
bool ConfigurableNode::LoadFromFile(const string& path)
{
	try
	{
		auto docs = YAML::LoadAllFromFile(path);
		if(docs.empty())
		{
			LogError("Configuration file \"%s\" is empty\n", path.c_str());
			return false;
		}
		return LoadParameters(docs[0]);
	}
	catch(const YAML::BadFile& ex)
	{
		LogError("Unable to open configuration file \"%s\"\n", path.c_str());
		return false;
	}
	catch(const YAML::Exception& ex)
	{
		LogError("Failed to parse configuration file \"%s\": %s\n", path.c_str(), ex.what());
		return false;
	}
}

/**
	@brief Writes the configuration to a YAML file

	@return True on success, false if the file could not be written
 */
bool ConfigurableNode::SaveToFile(const string& path) const
{
	YAML::Emitter out;
	out << SerializeConfiguration();

	FILE* fp = fopen(path.c_str(), "w");
	if(!fp)
	{
		LogError("Unable to open \"%s\" for writing\n", path.c_str());
		return false;
	}

	size_t len = out.size();
	bool ok = (len == fwrite(out.c_str(), 1, len, fp));
	if(!ok)
		LogError("Write to \"%s\" failed\n", path.c_str());

	if(0 != fclose(fp))
	{
		LogError("Close of \"%s\" failed\n", path.c_str());
		ok = false;
	}

	return ok;
}
