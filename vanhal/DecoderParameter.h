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
	@brief Declaration of DecoderParameter
 */

#ifndef DecoderParameter_h
#define DecoderParameter_h

/**
	@brief A configuration setting of a decoder

	Parameters are typed, carry a unit for pretty printing, and can be converted to and from strings so they can be
	stored in configuration files.
 */
class DecoderParameter
{
public:

	/**
		@brief Types of data a parameter can store
	 */
	enum ParameterTypes
	{
		TYPE_FLOAT,			//32-bit floating point number
		TYPE_INT,			//64-bit integer
		TYPE_BOOL,			//boolean value
		TYPE_ENUM,			//enumerated constant
		TYPE_STRING			//arbitrary string
	};

	DecoderParameter(ParameterTypes type = DecoderParameter::TYPE_FLOAT, Unit unit = Unit(Unit::UNIT_COUNTS));

	//Copies take the value but get their own change signal
	DecoderParameter(const DecoderParameter& rhs);
	DecoderParameter& operator=(const DecoderParameter& rhs);

	bool ParseString(const std::string& str);
	std::string ToString() const;

	/**
		@brief Returns the value of the parameter interpreted as a boolean
	 */
	bool GetBoolVal() const
	{ return (m_intval != 0); }

	/**
		@brief Returns the value of the parameter interpreted as an integer
	 */
	int64_t GetIntVal() const
	{ return m_intval; }

	/**
		@brief Returns the value of the parameter interpreted as a floating point number
	 */
	float GetFloatVal() const
	{ return m_floatval; }

	/**
		@brief Returns the value of the parameter interpreted as a string
	 */
	std::string GetStringVal() const
	{ return m_string; }

	void SetBoolVal(bool b);
	void SetIntVal(int64_t i);
	void SetFloatVal(float f);
	void SetStringVal(const std::string& s);

	ParameterTypes GetType() const
	{ return m_type; }

	/**
		@brief Adds a (name, value) pair to a TYPE_ENUM parameter.
	 */
	void AddEnumValue(const std::string& name, int value)
	{
		m_forwardEnumMap[name] = value;
		m_reverseEnumMap[value] = name;
	}

	/**
		@brief Gets a list of valid enumerated parameter names for a TYPE_ENUM parameter.
	 */
	void GetEnumValues(std::vector<std::string>& values) const
	{
		for(auto it : m_forwardEnumMap)
			values.push_back(it.first);
	}

	/**
		@brief Signal emitted every time the parameter's value changes
	 */
	sigc::signal<void()> signal_changed()
	{ return m_changeSignal; }

protected:
	ParameterTypes				m_type;

	sigc::signal<void()>		m_changeSignal;

	Unit						m_unit;

	std::map<std::string, int>	m_forwardEnumMap;
	std::map<int, std::string>	m_reverseEnumMap;

	int64_t						m_intval;
	float						m_floatval;
	std::string					m_string;
};

#endif
