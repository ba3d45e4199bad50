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
	@brief Tests for BiphaseDecoder
 */

#include <catch2/catch.hpp>

#include "../vanprotocols/vanprotocols.h"
#include "VanSignalGenerator.h"

using namespace std;

/**
	@brief Runs a sample stream through edge extraction, bit timing and the line decoder
 */
static vector<VanBit> DecodeLine(const vector<LogicSample>& samples)
{
	VanDecoderConfig config;
	QueueSampleSource source;
	for(auto& s : samples)
		source.Push(s);
	source.Close();

	BiphaseDecoder decoder(BitTimingRecovery(EdgeExtractor(source), config), config);

	vector<VanBit> bits;
	VanBit bit;
	while(decoder.GetNextBit(bit) == STREAM_OK)
		bits.push_back(bit);
	return bits;
}

static vector<LogicSample> EdgesToSamples(const vector<int64_t>& times)
{
	vector<LogicSample> samples;
	bool level = true;
	samples.push_back(LogicSample(0, level));
	for(auto t : times)
	{
		level = !level;
		samples.push_back(LogicSample(t, level));
	}
	return samples;
}

/**
	@brief Edges of a start of frame up to the middle of the fourth zero bit
 */
static vector<int64_t> FourZeroes()
{
	vector<int64_t> times;
	for(int i=0; i<8; i++)
		times.push_back(1000 + 32*i);
	return times;
}

TEST_CASE("BiphaseDecoder_Frame", "[biphase]")
{
	VanTestFrame frame(0x100, 0x8, {0xab});
	VanSignalGenerator gen;
	gen.AddFrame(frame);

	auto bits = DecodeLine(gen.GetSamples());
	auto expected = VanSignalGenerator::GetFrameBits(frame);
	REQUIRE(expected.size() == 48);

	//Sync, destuffed frame bits, end of data, acknowledge, end of frame
	REQUIRE(bits.size() == 1 + expected.size() + 1 + 2 + 8);
	CHECK(bits[0].m_type == VanBit::TYPE_SYNC);

	for(size_t i=0; i<expected.size(); i++)
	{
		INFO(i);
		auto& b = bits[1 + i];
		REQUIRE(b.m_type == VanBit::TYPE_BIT);
		CHECK(b.m_value == expected[i]);
		CHECK_FALSE(b.m_recovered);

		//Stuff bits never come out
		CHECK( (b.m_index % 5) != 4);
		CHECK(b.m_start < b.m_end);
	}

	auto& eod = bits[1 + expected.size()];
	CHECK(eod.m_type == VanBit::TYPE_EOD);
	CHECK( (eod.m_index % 5) == 4);

	//Past the end of data every line bit is a data bit, stuff slot or not
	vector<bool> tail;
	for(size_t i=expected.size() + 2; i<bits.size(); i++)
	{
		CHECK(bits[i].m_type == VanBit::TYPE_BIT);
		CHECK(bits[i].m_index == bits[i-1].m_index + 1);
		tail.push_back(bits[i].m_value);
	}
	CHECK(tail == vector<bool>{true, false, true, true, true, true, true, true, true, true});
}

TEST_CASE("BiphaseDecoder_StuffingViolation", "[biphase]")
{
	VanTestFrame frame(0x100, 0x8, {0xab});
	frame.m_stuffViolationAfter = 11;
	VanSignalGenerator gen;
	gen.AddFrame(frame);

	auto bits = DecodeLine(gen.GetSamples());

	//Decoding stops at the violation and waits for the next sync
	REQUIRE(bits.size() == 14);
	CHECK(bits[0].m_type == VanBit::TYPE_SYNC);
	for(size_t i=1; i<13; i++)
		CHECK(bits[i].m_type == VanBit::TYPE_BIT);
	CHECK(bits[13].m_type == VanBit::TYPE_ERROR);
	CHECK(bits[13].m_error.m_type == VanDecodeError::ERR_STUFFING);
}

TEST_CASE("BiphaseDecoder_EndOfData", "[biphase]")
{
	auto times = FourZeroes();
	times.push_back(1256);
	times.push_back(1288);

	auto bits = DecodeLine(EdgesToSamples(times));
	REQUIRE(bits.size() == 6);
	CHECK(bits[0].m_type == VanBit::TYPE_SYNC);
	CHECK(bits[0].m_start == 1000);
	for(size_t i=1; i<5; i++)
	{
		CHECK(bits[i].m_type == VanBit::TYPE_BIT);
		CHECK_FALSE(bits[i].m_value);
		CHECK(bits[i].m_index == i-1);
	}
	CHECK(bits[5].m_type == VanBit::TYPE_EOD);
	CHECK(bits[5].m_index == 4);
}

TEST_CASE("BiphaseDecoder_MissingMidBit", "[biphase]")
{
	//Stuff bit, a cell boundary, then a full bit with no transition in the middle
	auto times = FourZeroes();
	times.push_back(1288);
	times.push_back(1320);
	times.push_back(1384);

	auto bits = DecodeLine(EdgesToSamples(times));
	REQUIRE(bits.size() == 6);
	CHECK(bits[4].m_type == VanBit::TYPE_BIT);
	CHECK(bits[5].m_type == VanBit::TYPE_ERROR);
	CHECK(bits[5].m_error.m_type == VanDecodeError::ERR_TIMING);
	CHECK(bits[5].m_error.m_detail == "missing mid-bit transition");
}

TEST_CASE("BiphaseDecoder_Glitch", "[biphase]")
{
	SECTION("Interval close to a half bit is recovered")
	{
		auto times = FourZeroes();
		times.push_back(1288);
		times.push_back(1332);
		times.push_back(1352);

		auto bits = DecodeLine(EdgesToSamples(times));
		REQUIRE(bits.size() == 6);
		CHECK(bits[5].m_type == VanBit::TYPE_BIT);
		CHECK_FALSE(bits[5].m_value);
		CHECK(bits[5].m_recovered);
		CHECK(bits[5].m_index == 5);
	}

	SECTION("Interval too far off is a timing error")
	{
		auto times = FourZeroes();
		times.push_back(1269);

		auto bits = DecodeLine(EdgesToSamples(times));
		REQUIRE(bits.size() == 6);
		CHECK(bits[5].m_type == VanBit::TYPE_ERROR);
		CHECK(bits[5].m_error.m_type == VanDecodeError::ERR_TIMING);
		CHECK(bits[5].m_error.m_timestamp == 1224);
	}

	SECTION("Moved mid-bit transition in a frame")
	{
		VanTestFrame frame(0x123, 0x8, {0x00, 0x55});
		frame.m_glitchBit = 26;
		frame.m_glitchShift = 10;
		VanSignalGenerator gen;
		gen.AddFrame(frame);

		auto bits = DecodeLine(gen.GetSamples());
		auto expected = VanSignalGenerator::GetFrameBits(frame);
		REQUIRE(bits.size() == 1 + expected.size() + 1 + 2 + 8);

		size_t recovered = 0;
		for(size_t i=0; i<expected.size(); i++)
		{
			INFO(i);
			REQUIRE(bits[1 + i].m_type == VanBit::TYPE_BIT);
			CHECK(bits[1 + i].m_value == expected[i]);
			if(bits[1 + i].m_recovered)
				recovered ++;
		}
		CHECK(recovered == 2);
	}
}

TEST_CASE("BiphaseDecoder_Noise", "[biphase]")
{
	//Reported once until the next sync
	auto bits = DecodeLine(EdgesToSamples({1000, 1005, 1012, 1062, 1065}));
	REQUIRE(bits.size() == 1);
	CHECK(bits[0].m_type == VanBit::TYPE_ERROR);
	CHECK(bits[0].m_error.m_type == VanDecodeError::ERR_TIMING);
	CHECK(bits[0].m_error.m_detail == "bus activity without bit lock");
}

TEST_CASE("BiphaseDecoder_Idle", "[biphase]")
{
	auto times = FourZeroes();
	times.push_back(5000);

	auto bits = DecodeLine(EdgesToSamples(times));
	REQUIRE(bits.size() == 7);
	CHECK(bits[5].m_type == VanBit::TYPE_IDLE);
	CHECK(bits[5].m_start == 1224);
	CHECK(bits[5].m_end == 5000);

	//The lone edge after the gap never locks
	CHECK(bits[6].m_type == VanBit::TYPE_ERROR);
}
