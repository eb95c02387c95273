// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace Filesan {

/**
 * Base class for all errors thrown by this library.
 */
class Error : public std::runtime_error {
public:
	explicit Error(const std::string &_msg)
		:std::runtime_error(_msg) {}
};

/**
 * An invalid #RuleSet was requested.  This is a programming error
 * (or a broken configuration file); the built-in rule sets never
 * throw it with the default escape character.
 */
class ConfigurationError : public Error {
public:
	explicit ConfigurationError(const std::string &_msg)
		:Error(_msg) {}
};

/**
 * The escaped name would be longer than the rule set allows.  The
 * name is never truncated implicitly; the caller may shorten the
 * input and try again.
 */
class LengthError : public Error {
	std::size_t length, max_length;

public:
	LengthError(std::size_t _length, std::size_t _max_length);

	/**
	 * The length (in bytes) the escaped name would have had.
	 */
	std::size_t GetLength() const noexcept {
		return length;
	}

	std::size_t GetMaxLength() const noexcept {
		return max_length;
	}
};

/**
 * A string passed to UnescapeFilename() was not produced by
 * EscapeFilename() with the same #RuleSet.
 */
class MalformedEscapeError : public Error {
	std::size_t position;

public:
	MalformedEscapeError(const std::string &_msg, std::size_t _position);

	/**
	 * The byte offset in the escaped string where the problem was
	 * detected.
	 */
	std::size_t GetPosition() const noexcept {
		return position;
	}
};

/**
 * The input of EscapeFilename() is not valid UTF-8.
 */
class EncodingError : public Error {
	std::size_t position;

public:
	explicit EncodingError(std::size_t _position);

	std::size_t GetPosition() const noexcept {
		return position;
	}
};

} // namespace Filesan
