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
	@brief Implementation of the text helpers of the VAN decoder data types
 */

#include "vanprotocols.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// VanDecodeError

const char* VanDecodeError::GetTypeName(errtype t)
{
	switch(t)
	{
		case ERR_TIMING:
			return "timing error";

		case ERR_STUFFING:
			return "stuffing violation";

		case ERR_FRAMING:
			return "framing error";

		case ERR_CHECKSUM:
			return "checksum mismatch";

		case ERR_TRUNCATION:
			return "truncated";

		default:
			return "unknown";
	}
}

string VanDecodeError::ToString() const
{
	string ret = GetTypeName(m_type);
	ret += " @ " + to_string(m_timestamp);
	if(!m_detail.empty())
		ret += ": " + m_detail;
	return ret;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// VanField

const char* VanField::GetTypeName(ftype t)
{
	switch(t)
	{
		case FIELD_SOF:
			return "SOF";

		case FIELD_IDENTIFIER:
			return "ID";

		case FIELD_CONTROL:
			return "COM";

		case FIELD_DATA:
			return "Data";

		case FIELD_CHECKSUM:
			return "CRC";

		case FIELD_EOD:
			return "EOD";

		case FIELD_ACK:
			return "ACK";

		case FIELD_EOF:
			return "EOF";

		default:
			return "unknown";
	}
}

string VanField::ToString() const
{
	string ret = GetTypeName(m_type);
	switch(m_type)
	{
		case FIELD_IDENTIFIER:
			ret += " " + to_string_hex(m_value, true, 3);
			break;

		case FIELD_CONTROL:
			ret += " " + to_string_hex(m_value);
			break;

		case FIELD_DATA:
			ret += "[" + to_string(m_index) + "] " + to_string_hex(m_value, true, 2);
			break;

		case FIELD_CHECKSUM:
			ret += " " + to_string_hex(m_value, true, 4);
			break;

		case FIELD_ACK:
			ret += m_value ? " ok" : " none";
			break;

		default:
			break;
	}

	if(m_recovered)
		ret += " (recovered)";
	return ret;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// VanFrame

const char* VanFrame::GetValidityName(validity v)
{
	switch(v)
	{
		case VALID_WELL_FORMED:
			return "well-formed";

		case VALID_TRUNCATED:
			return "truncated";

		case VALID_FRAMING_ERROR:
			return "framing error";

		default:
			return "unknown";
	}
}

/**
	@brief Formats the frame in the "ID FLAGS DATA CRC" layout commonly used in VAN bus logs
 */
string VanFrame::ToString() const
{
	string ret = to_string_hex(m_identifier, true, 3) + " ";
	ret += m_rak ? 'A' : '-';
	ret += m_rw ? 'R' : 'W';
	ret += m_rtr ? 'T' : '-';

	ret += " ";
	for(size_t i=0; i<m_data.size(); i++)
	{
		if(i)
			ret += "-";
		ret += to_string_hex(m_data[i], true, 2);
	}

	ret += " CRC " + to_string_hex(m_checksum, true, 4) + (m_checksumValid ? " ok" : " bad");
	ret += m_ack ? " ACK" : " NO_ACK";
	ret += string(" ") + GetValidityName(m_validity);
	return ret;
}
