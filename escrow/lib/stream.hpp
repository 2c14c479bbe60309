#pragma once

#include <cassert>
#include <cstdint>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <type_traits>
#include <vector>

namespace escrow
{
// We operate on streams of uint8_t by convention
using stream = std::basic_streambuf<uint8_t>;
// Read a raw byte stream the size of `T' and fill value.
template <typename T>
bool try_read (escrow::stream & stream_a, T & value)
{
	static_assert (std::is_standard_layout<T>::value, "Can't stream read non-standard layout types");
	auto amount_read (stream_a.sgetn (reinterpret_cast<uint8_t *> (&value), sizeof (value)));
	return amount_read != sizeof (value);
}
// Strings are length prefixed
inline bool try_read (escrow::stream & stream_a, std::string & value)
{
	uint32_t size;
	auto error (try_read (stream_a, size));
	if (!error)
	{
		value.resize (size);
		if (size > 0)
		{
			auto amount_read (stream_a.sgetn (reinterpret_cast<uint8_t *> (&value[0]), size));
			error = amount_read != size;
		}
	}
	return error;
}
// A wrapper of try_read which throws if there is an error
template <typename T>
void read (escrow::stream & stream_a, T & value)
{
	auto error = try_read (stream_a, value);
	if (error)
	{
		throw std::runtime_error ("Failed to read type");
	}
}

template <typename T>
void write (escrow::stream & stream_a, T const & value)
{
	static_assert (std::is_standard_layout<T>::value, "Can't stream write non-standard layout types");
	auto amount_written (stream_a.sputn (reinterpret_cast<uint8_t const *> (&value), sizeof (value)));
	(void)amount_written;
	assert (amount_written == sizeof (value));
}

inline void write (escrow::stream & stream_a, std::string const & value)
{
	write (stream_a, static_cast<uint32_t> (value.size ()));
	auto amount_written (stream_a.sputn (reinterpret_cast<uint8_t const *> (value.data ()), value.size ()));
	(void)amount_written;
	assert (amount_written == static_cast<std::streamsize> (value.size ()));
}

class bufferstream : public std::basic_streambuf<uint8_t>
{
public:
	bufferstream (uint8_t const * data_a, size_t size_a)
	{
		this->setg (const_cast<uint8_t *> (data_a), const_cast<uint8_t *> (data_a), const_cast<uint8_t *> (data_a + size_a));
	}
};

class vectorstream : public std::basic_streambuf<uint8_t>
{
public:
	vectorstream (std::vector<uint8_t> & vector_a) :
	vector (vector_a)
	{
	}
	std::streamsize xsputn (char_type const * data_a, std::streamsize size_a) override
	{
		vector.insert (vector.end (), data_a, data_a + size_a);
		return size_a;
	}

private:
	std::vector<uint8_t> & vector;
};
}
