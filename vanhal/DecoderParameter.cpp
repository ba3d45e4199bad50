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
	@brief Implementation of DecoderParameter
 */

#include "vanhal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// DecoderParameter

/**
	@brief Creates a parameter

	@param type	Type of parameter
	@param unit	Unit of measurement (ignored for non-numeric types)
 */
DecoderParameter::DecoderParameter(ParameterTypes type, Unit unit)
	: m_type(type)
	, m_unit(unit)
	, m_intval(0)
	, m_floatval(0)
	, m_string("")
{

}

DecoderParameter::DecoderParameter(const DecoderParameter& rhs)
	: m_type(rhs.m_type)
	, m_unit(rhs.m_unit)
	, m_forwardEnumMap(rhs.m_forwardEnumMap)
	, m_reverseEnumMap(rhs.m_reverseEnumMap)
	, m_intval(rhs.m_intval)
	, m_floatval(rhs.m_floatval)
	, m_string(rhs.m_string)
{
}

DecoderParameter& DecoderParameter::operator=(const DecoderParameter& rhs)
{
	m_type = rhs.m_type;
	m_unit = rhs.m_unit;
	m_forwardEnumMap = rhs.m_forwardEnumMap;
	m_reverseEnumMap = rhs.m_reverseEnumMap;
	m_intval = rhs.m_intval;
	m_floatval = rhs.m_floatval;
	m_string = rhs.m_string;
	return *this;
}

/**
	@brief Sets the parameter to a value represented as a string.

	The string is converted to the appropriate internal representation. Strings are always in the "C" locale format
	produced by ToString().

	@return True if the string was understood, false if the value was rejected (the parameter is unchanged)
 */
bool DecoderParameter::ParseString(const string& str)
{
	auto s = Trim(str);

	switch(m_type)
	{
		case TYPE_BOOL:
			if( (s == "1") || (s == "true") )
				m_intval = 1;
			else if( (s == "0") || (s == "false") )
				m_intval = 0;
			else
			{
				LogWarning("\"%s\" is not a boolean value\n", s.c_str());
				return false;
			}
			m_floatval = m_intval;
			break;

		case TYPE_FLOAT:
			if(s.empty() || !(isdigit(static_cast<unsigned char>(s[0])) || (s[0] == '-') || (s[0] == '.')) )
			{
				LogWarning("\"%s\" is not a number\n", s.c_str());
				return false;
			}
			m_floatval = m_unit.ParseString(s);
			m_intval = m_floatval;
			break;

		case TYPE_INT:
			if(s.empty() || !(isdigit(static_cast<unsigned char>(s[0])) || (s[0] == '-')) )
			{
				LogWarning("\"%s\" is not an integer\n", s.c_str());
				return false;
			}

			//If there's a decimal point parse it as a float
			//so e.g. "115.2 kbps" parses correctly
			if(s.find(".") != string::npos)
			{
				m_floatval = m_unit.ParseString(s);
				m_intval = llround(m_floatval);
			}
			else
			{
				m_intval = m_unit.ParseStringInt64(s);
				m_floatval = m_intval;
			}
			break;

		case TYPE_STRING:
			m_intval = 0;
			m_floatval = 0;
			break;

		case TYPE_ENUM:
			if(m_forwardEnumMap.find(s) == m_forwardEnumMap.end())
			{
				LogWarning("\"%s\" is not a valid choice\n", s.c_str());
				return false;
			}
			m_intval = m_forwardEnumMap[s];
			m_floatval = m_intval;
			break;
	}

	m_string = s;
	m_changeSignal.emit();
	return true;
}

/**
	@brief Returns a string representation of the parameter's value, suitable for ParseString()
 */
string DecoderParameter::ToString() const
{
	switch(m_type)
	{
		case TYPE_FLOAT:
			return m_unit.PrettyPrint(m_floatval);

		case TYPE_INT:
			return m_unit.PrettyPrintInt64(m_intval);

		case TYPE_BOOL:
			return m_intval ? "true" : "false";

		case TYPE_STRING:
			return m_string;

		case TYPE_ENUM:
			{
				if(m_reverseEnumMap.find(m_intval) != m_reverseEnumMap.end())
					return m_reverseEnumMap.at(m_intval);
				else
					return "";
			}

		default:
			return "unimplemented";
	}
}

/**
	@brief Sets the parameter to a boolean value
 */
void DecoderParameter::SetBoolVal(bool b)
{
	m_intval = b;
	m_floatval = b;
	m_string = b ? "true" : "false";

	m_changeSignal.emit();
}

/**
	@brief Sets the parameter to an integer value
 */
void DecoderParameter::SetIntVal(int64_t i)
{
	m_intval = i;
	m_floatval = i;
	m_string = "";

	if(m_reverseEnumMap.find(i) != m_reverseEnumMap.end())
		m_string = m_reverseEnumMap[i];

	m_changeSignal.emit();
}

/**
	@brief Sets the parameter to a floating point value
 */
void DecoderParameter::SetFloatVal(float f)
{
	m_intval = f;
	m_floatval = f;
	m_string = "";

	m_changeSignal.emit();
}

/**
	@brief Sets the parameter to a string
 */
void DecoderParameter::SetStringVal(const string& s)
{
	m_intval = 0;
	m_floatval = 0;
	m_string = s;

	m_changeSignal.emit();
}
