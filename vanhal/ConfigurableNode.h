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
	@brief Declaration of ConfigurableNode
 */

#ifndef ConfigurableNode_h
#define ConfigurableNode_h

/**
	@brief Base class for anything configured by a set of named parameters

	Parameters are serialized to YAML as strings, so a configuration file is human readable and editable:

	@code
	parameters:
	  Bit Rate: 125 kbps
	  Tolerance: 25 %
	@endcode
 */
class ConfigurableNode
{
public:
	ConfigurableNode();
	virtual ~ConfigurableNode();

	//Parameters
public:
	DecoderParameter& GetParameter(const std::string& s);
	const DecoderParameter& GetParameter(const std::string& s) const;
	typedef std::map<std::string, DecoderParameter> ParameterMapType;

	bool HasParameter(const std::string& s) const
	{ return (m_parameters.find(s) != m_parameters.end()); }

	ParameterMapType::iterator begin()
	{ return m_parameters.begin(); }

	ParameterMapType::iterator end()
	{ return m_parameters.end(); }

	ParameterMapType::const_iterator begin() const
	{ return m_parameters.begin(); }

	ParameterMapType::const_iterator end() const
	{ return m_parameters.end(); }

	size_t GetParamCount() const
	{ return m_parameters.size(); }

	virtual YAML::Node SerializeConfiguration() const;
	virtual bool LoadParameters(const YAML::Node& node);

	bool LoadFromFile(const std::string& path);
	bool SaveToFile(const std::string& path) const;

protected:
	ParameterMapType m_parameters;

	///@brief Placeholder returned when an unknown parameter is requested
	static DecoderParameter m_invalidParameter;
};

#endif
