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
	@brief Declaration of VanCRC
 */

#ifndef VanCRC_h
#define VanCRC_h

/**
	@brief The VAN frame check sequence

	CRC-15, polynomial x^15 + x^11 + x^10 + x^9 + x^8 + x^7 + x^4 + x^3 + x^2 + 1 (0x0F9D), initial value 0x7FFF,
	inverted result. Covers the identifier, command and data fields. On the wire the 15-bit value is followed by a
	zero bit, so it is usually written as a 16-bit number with the LSB clear.
 */
class VanCRC
{
public:
	static constexpr uint16_t POLYNOMIAL = 0x0f9d;
	static constexpr uint16_t INIT = 0x7fff;
	static constexpr uint16_t MASK = 0x7fff;

	static uint16_t Compute(const std::vector<bool>& bits);
	static uint16_t Compute(const uint8_t* bytes, size_t len);

	static bool Validate(const std::vector<bool>& bits, uint16_t checksum);

	/**
		@brief Converts a 15-bit checksum to the 16-bit form it has on the wire
	 */
	static uint16_t ToWireFormat(uint16_t checksum)
	{ return (checksum & MASK) << 1; }
};

#endif
