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
	@brief Declaration of VanDecoder
 */

#ifndef VanDecoder_h
#define VanDecoder_h

/**
	@brief Decodes a VAN bus capture into fields, frames and errors

	Each run builds a fresh pipeline (edges, bit timing, line decoder, frame decoder) from a snapshot of the
	configuration, so changing parameters during a run only takes effect on the next one.

	Samples can be pulled from a SampleSource with Run(), or pushed one at a time with PushSample() and Finish().
 */
class VanDecoder
	: public VanEventSink
	, public sigc::trackable
{
public:
	VanDecoder();
	VanDecoder(const VanDecoderConfig& config);
	virtual ~VanDecoder();

	bool Run(SampleSource& source);

	bool PushSample(const LogicSample& sample);
	void Finish();

	void Cancel();
	void Reset();

	VanDecoderConfig& GetConfig()
	{ return m_config; }

	const VanDecoderConfig& GetConfig() const
	{ return m_config; }

	bool IsCancelled() const
	{ return m_cancel; }

	///@brief True while a push mode run is accepting samples
	bool IsStreaming() const
	{ return (m_frames != nullptr) && m_streaming; }

	sigc::signal<void(const VanField&)> signal_field()
	{ return m_fieldSignal; }

	sigc::signal<void(const VanFrame&)> signal_frame()
	{ return m_frameSignal; }

	sigc::signal<void(const VanDecodeError&)> signal_error()
	{ return m_errorSignal; }

	//Statistics of the current (or last) run
	size_t GetFrameCount() const
	{ return m_frameCount; }

	size_t GetWellFormedCount() const
	{ return m_wellFormedCount; }

	size_t GetChecksumFailureCount() const
	{ return m_checksumFailures; }

	size_t GetErrorCount() const
	{ return m_errorCount; }

	//VanEventSink
	virtual void OnField(const VanField& field);
	virtual void OnFrame(const VanFrame& frame);
	virtual void OnError(const VanDecodeError& error);

protected:
	bool StartRun(SampleSource& source);
	StreamStatus Pump();
	void EndRun(bool flush);
	void LogSummary();
	void ConnectParameters();
	void OnParameterChanged();

	VanDecoderConfig m_config;

	///@brief Sample queue used in push mode
	QueueSampleSource m_queue;

	std::unique_ptr<VanFrameDecoder> m_frames;

	bool m_streaming;
	bool m_cancel;

	///@brief The pipeline is running, so calls from an event handler must not tear it down or re-enter it
	bool m_pumping;

	///@brief A parameter was changed after the current pipeline was built
	bool m_configChanged;

	size_t m_frameCount;
	size_t m_wellFormedCount;
	size_t m_checksumFailures;
	size_t m_errorCount;

	sigc::signal<void(const VanField&)> m_fieldSignal;
	sigc::signal<void(const VanFrame&)> m_frameSignal;
	sigc::signal<void(const VanDecodeError&)> m_errorSignal;
};

#endif
