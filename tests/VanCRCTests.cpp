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
	@brief Tests for VanCRC
 */

#include <catch2/catch.hpp>

#include "../vanprotocols/vanprotocols.h"

using namespace std;

/**
	@brief Identifier and command bits of a frame followed by its data bytes, as covered by the checksum
 */
static vector<bool> CoveredBits(uint16_t id, uint8_t com, const vector<uint8_t>& data)
{
	vector<bool> bits;
	for(int i=11; i>=0; i--)
		bits.push_back( (id >> i) & 1 );
	for(int i=3; i>=0; i--)
		bits.push_back( (com >> i) & 1 );
	for(auto b : data)
	{
		for(int i=7; i>=0; i--)
			bits.push_back( (b >> i) & 1 );
	}
	return bits;
}

TEST_CASE("VanCRC_KnownFrames", "[crc]")
{
	//Captured on a car bus: 8C4 WA- 8A-24-40 CRC 9B32
	auto capture = CoveredBits(0x8c4, 0xc, {0x8a, 0x24, 0x40});
	CHECK(VanCRC::Compute(capture) == 0x4d99);
	CHECK(VanCRC::ToWireFormat(VanCRC::Compute(capture)) == 0x9b32);
	CHECK(VanCRC::Validate(capture, 0x4d99));

	CHECK(VanCRC::Compute(CoveredBits(0x100, 0x8, {0xab})) == 0x7a88);
	CHECK(VanCRC::Compute(CoveredBits(0x8c4, 0xf, {})) == 0x118d);
	CHECK(VanCRC::Compute(CoveredBits(0x200, 0x8, {0x01, 0x02, 0x03})) == 0x6ff0);
}

TEST_CASE("VanCRC_Bytes", "[crc]")
{
	const uint8_t check[] = {'1', '2', '3', '4', '5', '6', '7', '8', '9'};
	CHECK(VanCRC::Compute(check, sizeof(check)) == 0x6b39);

	//Initial value and final inversion cancel out on an empty input
	CHECK(VanCRC::Compute(NULL, 0) == 0x0000);

	//Byte and bit interfaces agree
	const uint8_t frame[] = {0x8c, 0x4c, 0x8a, 0x24, 0x40};
	CHECK(VanCRC::Compute(frame, sizeof(frame)) == 0x4d99);
}

TEST_CASE("VanCRC_DetectsSingleBitErrors", "[crc]")
{
	auto bits = CoveredBits(0x8c4, 0xc, {0x8a, 0x24, 0x40});
	auto good = VanCRC::Compute(bits);

	for(size_t i=0; i<bits.size(); i++)
	{
		INFO(i);
		auto damaged = bits;
		damaged[i] = !damaged[i];
		CHECK_FALSE(VanCRC::Validate(damaged, good));
	}
}

TEST_CASE("VanCRC_WireFormat", "[crc]")
{
	CHECK(VanCRC::ToWireFormat(0x7fff) == 0xfffe);
	CHECK(VanCRC::ToWireFormat(0x118d) == 0x231a);

	//Only the low 15 bits are significant
	CHECK(VanCRC::ToWireFormat(0xffff) == 0xfffe);
	CHECK(VanCRC::Validate(CoveredBits(0x100, 0x8, {0xab}), 0x8000 | 0x7a88));
}
