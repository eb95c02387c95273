// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "filesan/Error.hxx"

#include <fmt/core.h>

namespace Filesan {

LengthError::LengthError(std::size_t _length, std::size_t _max_length)
	:Error(fmt::format("Escaped name is {} bytes long, exceeding the maximum of {} bytes",
			   _length, _max_length)),
	 length(_length), max_length(_max_length) {}

MalformedEscapeError::MalformedEscapeError(const std::string &_msg,
					   std::size_t _position)
	:Error(fmt::format("{} at position {}", _msg, _position)),
	 position(_position) {}

EncodingError::EncodingError(std::size_t _position)
	:Error(fmt::format("Invalid UTF-8 at position {}", _position)),
	 position(_position) {}

} // namespace Filesan
