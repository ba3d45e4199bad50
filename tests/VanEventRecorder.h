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
	@brief Declaration of VanEventRecorder
 */

#ifndef VanEventRecorder_h
#define VanEventRecorder_h

/**
	@brief Keeps everything a decoder emits, in order
 */
class VanEventRecorder
	: public VanEventSink
	, public sigc::trackable
{
public:
	virtual void OnField(const VanField& field)
	{
		m_fields.push_back(field);
		m_log.push_back("field " + field.ToString());
	}

	virtual void OnFrame(const VanFrame& frame)
	{
		m_frames.push_back(frame);
		m_log.push_back("frame " + frame.ToString());
	}

	virtual void OnError(const VanDecodeError& error)
	{
		m_errors.push_back(error);
		m_log.push_back("error " + error.ToString());
	}

	///@brief Subscribes to the signals of a decoder
	void Connect(VanDecoder& decoder)
	{
		decoder.signal_field().connect(sigc::mem_fun(*this, &VanEventRecorder::OnField));
		decoder.signal_frame().connect(sigc::mem_fun(*this, &VanEventRecorder::OnFrame));
		decoder.signal_error().connect(sigc::mem_fun(*this, &VanEventRecorder::OnError));
	}

	size_t CountFields(VanField::ftype type) const
	{
		size_t n = 0;
		for(auto& f : m_fields)
		{
			if(f.m_type == type)
				n++;
		}
		return n;
	}

	std::vector<VanField> m_fields;
	std::vector<VanFrame> m_frames;
	std::vector<VanDecodeError> m_errors;

	///@brief Every event as text, in emission order
	std::vector<std::string> m_log;
};

#endif
