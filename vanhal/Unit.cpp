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
	@brief Implementation of Unit
 */

#include "vanhal.h"

using namespace std;

/**
	@brief Gets the scale factor, SI prefix and suffix to print a value with
 */
void Unit::GetScaling(double num, double& scaleFactor, string& prefix, string& suffix) const
{
	scaleFactor = 1;
	prefix = "";
	suffix = "";
	num = fabs(num);

	switch(m_type)
	{
		//Not a SI base unit, so prefixes are offset by 10^15
		case UNIT_FS:
			{
				static const char* prefixes[] = {"f", "p", "n", "μ", "m", ""};
				size_t i = 0;
				while( (i < 5) && (num >= 1e3) )
				{
					num *= 1e-3;
					scaleFactor *= 1e-3;
					i ++;
				}
				prefix = prefixes[i];
				suffix = "s";
			}
			break;

		case UNIT_BITRATE:
		case UNIT_SAMPLERATE:
			if(num >= 1e9)
			{
				scaleFactor = 1e-9;
				prefix = "G";
			}
			else if(num >= 1e6)
			{
				scaleFactor = 1e-6;
				prefix = "M";
			}
			else if(num >= 1e3)
			{
				scaleFactor = 1e-3;
				prefix = "k";
			}
			suffix = (m_type == UNIT_BITRATE) ? "bps" : "S/s";
			break;

		//Convert fractional num to percentage
		case UNIT_PERCENT:
			scaleFactor = 100;
			suffix = "%";
			break;

		default:
			break;
	}
}

/**
	@brief Prints a value with SI scaling factors, using as few decimals as needed (up to 5)
 */
string Unit::PrettyPrint(double value) const
{
	double scaleFactor;
	string prefix;
	string suffix;
	GetScaling(value, scaleFactor, prefix, suffix);

	double value_rescaled = value * scaleFactor;

	//If not a round number, add more digits
	int digits = 5;
	double mul = 1;
	for(int i=0; i<5; i++)
	{
		if(fabs(round(value_rescaled*mul) - value_rescaled*mul) < 0.001)
		{
			digits = i;
			break;
		}
		mul *= 10;
	}

	//No space for bare numbers
	const char* space = suffix.empty() ? "" : " ";

	char tmp[128];
	snprintf(tmp, sizeof(tmp), "%.*f%s%s%s", digits, value_rescaled, space, prefix.c_str(), suffix.c_str());
	return tmp;
}

string Unit::PrettyPrintInt64(int64_t value) const
{
	return PrettyPrint(static_cast<double>(value));
}

/**
	@brief Finds the first character after the number, which may be a SI prefix
 */
size_t Unit::FindPrefix(const string& str)
{
	for(size_t i=0; i<str.size(); i++)
	{
		auto c = static_cast<unsigned char>(str[i]);
		if(isspace(c) || isdigit(c) || (c == '.') || (c == '-') || (c == '+') || (c == 'e') )
			continue;
		return i;
	}
	return string::npos;
}

/**
	@brief Parses a string based on the supplied unit

	Garbage parses as zero.
 */
double Unit::ParseString(const string& str) const
{
	double scale = 1;
	size_t i = FindPrefix(str);
	if(i != string::npos)
	{
		switch(str[i])
		{
			case 'G':
				scale = 1e9;
				break;

			case 'M':
				scale = 1e6;
				break;

			case 'K':
			case 'k':
				scale = 1e3;
				break;

			case 'm':
				scale = 1e-3;
				break;

			case 'u':
				scale = 1e-6;
				break;

			case 'n':
				scale = 1e-9;
				break;

			case 'p':
				scale = 1e-12;
				break;

			case 'f':
				scale = 1e-15;
				break;

			default:
				if(str.compare(i, strlen("μ"), "μ") == 0)
					scale = 1e-6;
				break;
		}
	}

	double ret = 0;
	if(1 != sscanf(str.c_str(), "%20lf", &ret))
		return 0;

	if(m_type == UNIT_FS)
		ret *= FS_PER_SECOND;
	else if(m_type == UNIT_PERCENT)
		ret *= 0.01;

	return ret * scale;
}

/**
	@brief Parses an integer, keeping full 64-bit precision
 */
int64_t Unit::ParseStringInt64(const string& str) const
{
	//Fractional values and time go through the floating point path
	if( (m_type == UNIT_FS) || (m_type == UNIT_PERCENT) || (str.find('.') != string::npos) )
		return llround(ParseString(str));

	int64_t scale = 1;
	size_t i = FindPrefix(str);
	if(i != string::npos)
	{
		if(str[i] == 'G')
			scale = 1000000000LL;
		else if(str[i] == 'M')
			scale = 1000000LL;
		else if( (str[i] == 'K') || (str[i] == 'k') )
			scale = 1000LL;
	}

	int64_t ret = 0;
	if(1 != sscanf(str.c_str(), "%" SCNd64, &ret))
		return 0;
	return ret * scale;
}
