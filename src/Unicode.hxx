// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * UTF-8 and UTF-16 helpers.
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

constexpr bool
IsHighSurrogate(char32_t ch) noexcept
{
	return ch >= 0xd800 && ch <= 0xdbff;
}

constexpr bool
IsLowSurrogate(char32_t ch) noexcept
{
	return ch >= 0xdc00 && ch <= 0xdfff;
}

constexpr bool
IsSurrogate(char32_t ch) noexcept
{
	return ch >= 0xd800 && ch <= 0xdfff;
}

/**
 * Is this a Unicode scalar value, i.e. a code point which may be
 * encoded in UTF-8?
 */
constexpr bool
IsUnicodeScalar(char32_t ch) noexcept
{
	return ch <= 0x10ffff && !IsSurrogate(ch);
}

/**
 * Split a supplementary character (above U+FFFF) into a UTF-16
 * surrogate pair.
 */
constexpr std::pair<char16_t, char16_t>
ToSurrogatePair(char32_t ch) noexcept
{
	ch -= 0x10000;
	return {
		char16_t(0xd800 + (ch >> 10)),
		char16_t(0xdc00 + (ch & 0x3ff)),
	};
}

constexpr char32_t
FromSurrogatePair(char16_t high, char16_t low) noexcept
{
	return 0x10000 + ((char32_t(high) - 0xd800) << 10) +
		(char32_t(low) - 0xdc00);
}

/**
 * Decode the first UTF-8 sequence of the given string.  Overlong
 * sequences, surrogates and code points above U+10FFFF are rejected.
 *
 * @return the code point and the number of bytes it occupies; the
 * length is 0 if the string is empty or does not begin with a valid
 * sequence
 */
[[gnu::pure]]
std::pair<char32_t, std::size_t>
DecodeUTF8(std::string_view s) noexcept;

/**
 * Is this string well-formed UTF-8?
 */
[[gnu::pure]]
bool
ValidateUTF8(std::string_view s) noexcept;

/**
 * Append the UTF-8 encoding of a Unicode scalar value.
 */
void
AppendUTF8(std::string &dest, char32_t ch);
