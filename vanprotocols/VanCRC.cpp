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
	@brief Implementation of VanCRC
 */

#include "vanprotocols.h"

using namespace std;

/**
	@brief Computes the 15-bit checksum of a bit sequence, MSB first
 */
uint16_t VanCRC::Compute(const vector<bool>& bits)
{
	uint16_t crc = INIT;
	for(auto b : bits)
	{
		bool feedback = ( (crc >> 14) & 1 ) ^ b;
		crc = (crc << 1) & MASK;
		if(feedback)
			crc ^= POLYNOMIAL;
	}
	return crc ^ MASK;
}

/**
	@brief Computes the 15-bit checksum of a byte sequence, each byte MSB first
 */
uint16_t VanCRC::Compute(const uint8_t* bytes, size_t len)
{
	vector<bool> bits;
	bits.reserve(len * 8);
	for(size_t i=0; i<len; i++)
	{
		for(int j=7; j>=0; j--)
			bits.push_back( (bytes[i] >> j) & 1 );
	}
	return Compute(bits);
}

/**
	@brief Checks a transmitted 15-bit checksum against the bits it covers
 */
bool VanCRC::Validate(const vector<bool>& bits, uint16_t checksum)
{
	return Compute(bits) == (checksum & MASK);
}
