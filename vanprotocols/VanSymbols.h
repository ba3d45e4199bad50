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
	@brief Declaration of the data types passed between the VAN decoder stages
 */

#ifndef VanSymbols_h
#define VanSymbols_h

/**
	@brief A transition of the primary channel
 */
class VanEdge
{
public:
	VanEdge()
	: m_timestamp(0)
	, m_rising(false)
	{}

	VanEdge(int64_t timestamp, bool rising)
	: m_timestamp(timestamp)
	, m_rising(rising)
	{}

	int64_t m_timestamp;
	bool m_rising;

	bool operator== (const VanEdge& e) const
	{
		return (m_timestamp == e.m_timestamp) && (m_rising == e.m_rising);
	}
};

/**
	@brief The interval between two consecutive edges, classified against the recovered half-bit period
 */
class VanBitCell
{
public:
	enum celltype
	{
		CELL_UNCLASSIFIED,	//no bit lock, edge passed through as-is
		CELL_SYNC,			//first edge of a burst that achieved bit lock (no interval)
		CELL_HALF,			//half a bit period
		CELL_FULL,			//a full bit period
		CELL_INVALID		//neither, see m_lockLost
	};

	VanBitCell()
	: m_type(CELL_UNCLASSIFIED)
	, m_start(0)
	, m_end(0)
	, m_halfBit(0)
	, m_resync(false)
	, m_lockLost(false)
	{}

	VanBitCell(celltype t, int64_t start, int64_t end, double halfBit)
	: m_type(t)
	, m_start(start)
	, m_end(end)
	, m_halfBit(halfBit)
	, m_resync(t == CELL_INVALID)
	, m_lockLost(false)
	{}

	int64_t GetLength() const
	{ return m_end - m_start; }

	celltype m_type;

	///@brief Timestamp of the edge that opened the interval
	int64_t m_start;

	///@brief Timestamp of the edge that closed the interval
	int64_t m_end;

	///@brief Half-bit period estimate the interval was classified against, in ticks
	double m_halfBit;

	///@brief Interval was out of tolerance, bit timing must be resynchronized
	bool m_resync;

	///@brief Bit lock was dropped after this interval (idle bus or too many bad intervals)
	bool m_lockLost;
};

/**
	@brief A problem found while decoding
 */
class VanDecodeError
{
public:
	enum errtype
	{
		ERR_TIMING,			//interval out of tolerance, or bus activity without bit lock
		ERR_STUFFING,		//stuff bit missing
		ERR_FRAMING,		//expected fixed pattern not found
		ERR_CHECKSUM,		//recomputed CRC disagrees with the transmitted one
		ERR_TRUNCATION		//stream ended in the middle of a frame
	};

	VanDecodeError()
	: m_type(ERR_TIMING)
	, m_timestamp(0)
	{}

	VanDecodeError(errtype t, int64_t timestamp, const std::string& detail)
	: m_type(t)
	, m_timestamp(timestamp)
	, m_detail(detail)
	{}

	static const char* GetTypeName(errtype t);
	std::string ToString() const;

	errtype m_type;
	int64_t m_timestamp;
	std::string m_detail;

	bool operator== (const VanDecodeError& e) const
	{
		return (m_type == e.m_type) && (m_timestamp == e.m_timestamp) && (m_detail == e.m_detail);
	}
};

/**
	@brief One item of the line decoder output
 */
class VanBit
{
public:
	enum btype
	{
		TYPE_BIT,			//a data bit (stuff bits already removed)
		TYPE_EOD,			//end-of-data code
		TYPE_SYNC,			//bit lock acquired, the next bit is the first bit of a burst
		TYPE_IDLE,			//bit lock lost
		TYPE_ERROR			//unrecoverable line error, decoding resumes at the next TYPE_SYNC
	};

	VanBit()
	: m_type(TYPE_BIT)
	, m_value(false)
	, m_recovered(false)
	, m_start(0)
	, m_end(0)
	, m_index(0)
	{}

	VanBit(btype t, int64_t start, int64_t end)
	: m_type(t)
	, m_value(false)
	, m_recovered(false)
	, m_start(start)
	, m_end(end)
	, m_index(0)
	{}

	btype m_type;
	bool m_value;

	///@brief The bit was inferred from an out-of-tolerance interval
	bool m_recovered;

	int64_t m_start;
	int64_t m_end;

	///@brief Raw (stuffed) bit index since the last sync
	size_t m_index;

	VanDecodeError m_error;
};

/**
	@brief A completed field of a VAN frame
 */
class VanField
{
public:
	enum ftype
	{
		FIELD_SOF,
		FIELD_IDENTIFIER,
		FIELD_CONTROL,
		FIELD_DATA,
		FIELD_CHECKSUM,
		FIELD_EOD,
		FIELD_ACK,
		FIELD_EOF
	};

	VanField()
	: m_type(FIELD_SOF)
	, m_value(0)
	, m_index(0)
	, m_start(0)
	, m_end(0)
	, m_firstBit(0)
	, m_nbits(0)
	, m_recovered(false)
	{}

	VanField(ftype t, uint32_t value, int64_t start, int64_t end, size_t firstBit, size_t nbits)
	: m_type(t)
	, m_value(value)
	, m_index(0)
	, m_start(start)
	, m_end(end)
	, m_firstBit(firstBit)
	, m_nbits(nbits)
	, m_recovered(false)
	{}

	static const char* GetTypeName(ftype t);
	std::string ToString() const;

	ftype m_type;
	uint32_t m_value;

	///@brief Byte index within the payload, for FIELD_DATA
	size_t m_index;

	int64_t m_start;
	int64_t m_end;

	///@brief Index of the first bit in the frame, counting destuffed bits from the first SOF bit
	size_t m_firstBit;
	size_t m_nbits;

	///@brief At least one bit of the field was recovered after a timing glitch
	bool m_recovered;

	bool operator== (const VanField& f) const
	{
		return (m_type == f.m_type) && (m_value == f.m_value) && (m_index == f.m_index) &&
			(m_start == f.m_start) && (m_end == f.m_end) &&
			(m_firstBit == f.m_firstBit) && (m_nbits == f.m_nbits) && (m_recovered == f.m_recovered);
	}
};

/**
	@brief A decoded (or abandoned) VAN frame
 */
class VanFrame
{
public:
	enum validity
	{
		VALID_WELL_FORMED,
		VALID_TRUNCATED,
		VALID_FRAMING_ERROR
	};

	VanFrame()
	: m_identifier(0)
	, m_ext(false)
	, m_rak(false)
	, m_rw(false)
	, m_rtr(false)
	, m_checksum(0)
	, m_checksumValid(false)
	, m_ack(false)
	, m_validity(VALID_TRUNCATED)
	, m_start(0)
	, m_end(0)
	, m_recoveredBits(0)
	{}

	static const char* GetValidityName(validity v);
	std::string ToString() const;

	//12-bit identifier
	uint16_t m_identifier;

	//Command field
	bool m_ext;
	bool m_rak;
	bool m_rw;
	bool m_rtr;

	std::vector<uint8_t> m_data;

	//15-bit transmitted CRC
	uint16_t m_checksum;
	bool m_checksumValid;

	//True if the acknowledge slot was driven dominant
	bool m_ack;

	validity m_validity;
	std::vector<VanDecodeError> m_errors;

	int64_t m_start;
	int64_t m_end;

	size_t m_recoveredBits;

	std::vector<VanField> m_fields;

	bool operator== (const VanFrame& f) const
	{
		return (m_identifier == f.m_identifier) && (m_ext == f.m_ext) && (m_rak == f.m_rak) && (m_rw == f.m_rw) &&
			(m_rtr == f.m_rtr) && (m_data == f.m_data) && (m_checksum == f.m_checksum) &&
			(m_checksumValid == f.m_checksumValid) && (m_ack == f.m_ack) && (m_validity == f.m_validity) &&
			(m_errors == f.m_errors) && (m_start == f.m_start) && (m_end == f.m_end) &&
			(m_recoveredBits == f.m_recoveredBits) && (m_fields == f.m_fields);
	}
};

#endif
