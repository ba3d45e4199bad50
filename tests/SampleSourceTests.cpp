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
	@brief Tests for the sample sources and edge extraction
 */

#include <catch2/catch.hpp>

#include "../vanprotocols/vanprotocols.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Sample sources

TEST_CASE("QueueSampleSource_Streaming", "[source]")
{
	QueueSampleSource source;
	LogicSample sample;

	CHECK(source.GetNextSample(sample) == STREAM_PENDING);

	source.Push(LogicSample(10, true));
	source.Push(LogicSample(20, false));
	CHECK(source.size() == 2);

	REQUIRE(source.GetNextSample(sample) == STREAM_OK);
	CHECK(sample == LogicSample(10, true));
	REQUIRE(source.GetNextSample(sample) == STREAM_OK);
	CHECK(sample == LogicSample(20, false));
	CHECK(source.GetNextSample(sample) == STREAM_PENDING);

	//Samples queued before the end are still delivered, late ones are not
	source.Push(LogicSample(30, true));
	source.Close();
	source.Push(LogicSample(40, false));
	CHECK(source.IsClosed());

	REQUIRE(source.GetNextSample(sample) == STREAM_OK);
	CHECK(sample.m_timestamp == 30);
	CHECK(source.GetNextSample(sample) == STREAM_END);
	CHECK(source.GetNextSample(sample) == STREAM_END);
}

TEST_CASE("WaveformSampleSource_Sparse", "[source]")
{
	SparseDigitalWaveform wfm;
	wfm.m_timescale = 2;
	wfm.m_triggerPhase = 10;
	wfm.push_back(0, 100, true);
	wfm.push_back(100, 50, false);
	wfm.push_back(150, 10, true);

	WaveformSampleSource source(&wfm);
	LogicSample sample;

	REQUIRE(source.GetNextSample(sample) == STREAM_OK);
	CHECK(sample == LogicSample(10, true));
	REQUIRE(source.GetNextSample(sample) == STREAM_OK);
	CHECK(sample == LogicSample(210, false));
	REQUIRE(source.GetNextSample(sample) == STREAM_OK);
	CHECK(sample == LogicSample(310, true));
	CHECK(source.GetNextSample(sample) == STREAM_END);
}

TEST_CASE("WaveformSampleSource_Uniform", "[source]")
{
	UniformDigitalWaveform wfm;
	wfm.m_samples = {true, true, false};

	WaveformSampleSource source(&wfm);
	LogicSample sample;

	for(int64_t i=0; i<3; i++)
	{
		REQUIRE(source.GetNextSample(sample) == STREAM_OK);
		CHECK(sample.m_timestamp == i);
		CHECK(sample.GetLevel(0) == wfm.m_samples[i]);
	}
	CHECK(source.GetNextSample(sample) == STREAM_END);
}

TEST_CASE("WaveformSampleSource_TwoChannels", "[source]")
{
	SparseDigitalWaveform a;
	a.push_back(0, 10, false);
	a.push_back(10, 10, true);

	SparseDigitalWaveform b;
	b.push_back(0, 5, true);
	b.push_back(5, 15, false);

	WaveformSampleSource source(&a, &b);
	LogicSample sample;

	//Each channel holds its level between its own samples
	REQUIRE(source.GetNextSample(sample) == STREAM_OK);
	CHECK(sample == LogicSample(0, false, true));
	REQUIRE(source.GetNextSample(sample) == STREAM_OK);
	CHECK(sample == LogicSample(5, false, false));
	REQUIRE(source.GetNextSample(sample) == STREAM_OK);
	CHECK(sample == LogicSample(10, true, false));
	CHECK(source.GetNextSample(sample) == STREAM_END);
}

TEST_CASE("WaveformSampleSource_Malformed", "[source]")
{
	SparseDigitalWaveform wfm;
	wfm.push_back(0, 10, true);
	wfm.m_samples.push_back(false);

	WaveformSampleSource source(&wfm);
	LogicSample sample;
	CHECK(source.GetNextSample(sample) == STREAM_END);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// EdgeExtractor

TEST_CASE("EdgeExtractor_Transitions", "[edges]")
{
	QueueSampleSource source;
	EdgeExtractor edges(source);
	VanEdge edge;

	SECTION("Empty stream")
	{
		CHECK(edges.GetNextEdge(edge) == STREAM_PENDING);
		source.Close();
		CHECK(edges.GetNextEdge(edge) == STREAM_END);
	}

	SECTION("Level changes only")
	{
		source.Push(LogicSample(0, true));
		source.Push(LogicSample(10, true));
		source.Push(LogicSample(20, false));
		source.Push(LogicSample(30, false));
		source.Push(LogicSample(40, true));
		source.Close();

		REQUIRE(edges.GetNextEdge(edge) == STREAM_OK);
		CHECK(edge == VanEdge(20, false));
		REQUIRE(edges.GetNextEdge(edge) == STREAM_OK);
		CHECK(edge == VanEdge(40, true));
		CHECK(edges.GetNextEdge(edge) == STREAM_END);
	}

	SECTION("First sample is only a reference")
	{
		source.Push(LogicSample(0, false));
		source.Close();
		CHECK(edges.GetNextEdge(edge) == STREAM_END);
	}

	SECTION("Samples going back in time are dropped")
	{
		source.Push(LogicSample(0, true));
		source.Push(LogicSample(10, false));
		source.Push(LogicSample(5, true));
		source.Push(LogicSample(10, true));
		source.Push(LogicSample(20, true));
		source.Close();

		REQUIRE(edges.GetNextEdge(edge) == STREAM_OK);
		CHECK(edge == VanEdge(10, false));
		REQUIRE(edges.GetNextEdge(edge) == STREAM_OK);
		CHECK(edge == VanEdge(20, true));
		CHECK(edges.GetNextEdge(edge) == STREAM_END);
	}

	SECTION("Waiting for more samples")
	{
		source.Push(LogicSample(0, true));
		source.Push(LogicSample(10, false));

		REQUIRE(edges.GetNextEdge(edge) == STREAM_OK);
		CHECK(edge == VanEdge(10, false));
		CHECK(edges.GetNextEdge(edge) == STREAM_PENDING);

		source.Push(LogicSample(20, true));
		REQUIRE(edges.GetNextEdge(edge) == STREAM_OK);
		CHECK(edge == VanEdge(20, true));
	}
}

TEST_CASE("EdgeExtractor_Channel", "[edges]")
{
	QueueSampleSource source;
	source.Push(LogicSample(0, false, true));
	source.Push(LogicSample(10, true, true));
	source.Push(LogicSample(20, true, false));
	source.Close();

	EdgeExtractor edges(source, 1);
	CHECK(edges.GetChannel() == 1);

	VanEdge edge;
	REQUIRE(edges.GetNextEdge(edge) == STREAM_OK);
	CHECK(edge == VanEdge(20, false));
	CHECK(edges.GetNextEdge(edge) == STREAM_END);

	//Out of range channel falls back to the first one
	QueueSampleSource other;
	EdgeExtractor fallback(other, 5);
	CHECK(fallback.GetChannel() == 0);
}
