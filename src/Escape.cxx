// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "filesan/Escape.hxx"
#include "filesan/RuleSet.hxx"
#include "filesan/Error.hxx"
#include "Unicode.hxx"

#include <fmt/format.h>

#include <algorithm>
#include <exception>
#include <iterator>

#include <assert.h>

namespace Filesan {

static void
AppendEscapeUnit(std::string &dest, char32_t escape_char, char16_t unit)
{
	AppendUTF8(dest, escape_char);
	fmt::format_to(std::back_inserter(dest), "{:04X}", unsigned(unit));
}

static void
AppendEscapeSequence(std::string &dest, char32_t escape_char, char32_t ch)
{
	if (ch < 0x10000) {
		AppendEscapeUnit(dest, escape_char, char16_t(ch));
	} else {
		const auto [high, low] = ToSurrogatePair(ch);
		AppendEscapeUnit(dest, escape_char, high);
		AppendEscapeUnit(dest, escape_char, low);
	}
}

/**
 * Replace the first character of the (already escaped) name with its
 * escape sequence.  This is how reserved names are disguised; since
 * reserved names never contain the escape character (nor, for base
 * names, a case variant of an escape sequence), the result cannot be
 * reserved.
 */
static void
EscapeFirstCharacter(std::string &s, char32_t escape_char)
{
	const auto [ch, length] = DecodeUTF8(s);
	assert(length > 0);

	std::string sequence;
	AppendEscapeSequence(sequence, escape_char, ch);
	s.replace(0, length, sequence);
}

std::string
EscapeFilename(std::string_view original, const RuleSet &rules)
{
	const char32_t escape_char = rules.GetEscapeChar();

	std::string result;
	result.reserve(original.size());

	for (std::size_t position = 0; position < original.size();) {
		const auto [ch, length] = DecodeUTF8(original.substr(position));
		if (length == 0)
			throw EncodingError(position);

		position += length;

		if (rules.MustEscape(ch, position == original.size()))
			AppendEscapeSequence(result, escape_char, ch);
		else
			AppendUTF8(result, ch);
	}

	if (!result.empty() && rules.IsReservedName(result))
		EscapeFirstCharacter(result, escape_char);

	if (result.size() > rules.GetMaxLength())
		throw LengthError(result.size(), rules.GetMaxLength());

	return result;
}

static constexpr int
ParseUpperHexDigit(char ch) noexcept
{
	if (ch >= '0' && ch <= '9')
		return ch - '0';
	else if (ch >= 'A' && ch <= 'F')
		return ch - 'A' + 0xa;
	else
		return -1;
}

/**
 * Parser for the escaped representation.  Each method consumes input
 * from the front of #rest.
 */
class EscapedNameParser {
	const std::string_view input;
	std::string_view rest;
	const char32_t escape_char;

public:
	EscapedNameParser(std::string_view _input,
			  char32_t _escape_char) noexcept
		:input(_input), rest(_input), escape_char(_escape_char) {}

	bool IsEnd() const noexcept {
		return rest.empty();
	}

	std::size_t GetPosition() const noexcept {
		return input.size() - rest.size();
	}

	/**
	 * Decode the next (literal or escaped) character.
	 */
	char32_t Next() {
		const std::size_t start = GetPosition();
		const auto [ch, length] = DecodeUTF8(rest);
		if (length == 0)
			throw MalformedEscapeError("Invalid UTF-8", start);

		rest.remove_prefix(length);

		if (ch != escape_char)
			return ch;

		const char16_t unit = ParseUnit(start);
		if (IsLowSurrogate(unit))
			throw MalformedEscapeError("Unpaired low surrogate", start);

		if (!IsHighSurrogate(unit))
			return unit;

		const std::size_t low_start = GetPosition();
		const auto [next, next_length] = DecodeUTF8(rest);
		if (next_length == 0 || next != escape_char)
			throw MalformedEscapeError("Unpaired high surrogate", start);

		rest.remove_prefix(next_length);

		const char16_t low = ParseUnit(low_start);
		if (!IsLowSurrogate(low))
			throw MalformedEscapeError("Unpaired high surrogate", start);

		return FromSurrogatePair(unit, low);
	}

private:
	/**
	 * Parse the fixed-width hex field following an escape
	 * character.
	 *
	 * @param start the position of the escape character (for
	 * error messages)
	 */
	char16_t ParseUnit(std::size_t start) {
		if (rest.size() < ESCAPE_DIGITS)
			throw MalformedEscapeError("Truncated escape sequence",
						   start);

		unsigned value = 0;
		for (std::size_t i = 0; i < ESCAPE_DIGITS; ++i) {
			const int digit = ParseUpperHexDigit(rest[i]);
			if (digit < 0)
				throw MalformedEscapeError("Invalid hex digit in escape sequence",
							   start);

			value = (value << 4) | unsigned(digit);
		}

		rest.remove_prefix(ESCAPE_DIGITS);
		return char16_t(value);
	}
};

std::string
UnescapeFilename(std::string_view escaped, const RuleSet &rules)
{
	if (escaped.size() > rules.GetMaxLength())
		throw MalformedEscapeError(fmt::format("Escaped name is longer than {} bytes",
						       rules.GetMaxLength()),
					   rules.GetMaxLength());

	EscapedNameParser parser(escaped, rules.GetEscapeChar());

	std::string result;
	result.reserve(escaped.size());

	while (!parser.IsEnd())
		AppendUTF8(result, parser.Next());

	/* every well-formed escape sequence decodes to something, but
	   only the canonical form round-trips: escaping the result
	   must give back exactly the input */
	std::string canonical;
	try {
		canonical = EscapeFilename(result, rules);
	} catch (const LengthError &) {
		std::throw_with_nested(MalformedEscapeError("Decoded name cannot be escaped within the maximum length",
							    0));
	}

	if (canonical != escaped) {
		const auto i = std::mismatch(escaped.begin(), escaped.end(),
					     canonical.begin(), canonical.end()).first;
		throw MalformedEscapeError("Name is not in canonical escaped form",
					   std::size_t(std::distance(escaped.begin(), i)));
	}

	return result;
}

bool
IsLegalFilename(std::string_view name, const RuleSet &rules) noexcept
{
	if (name.size() > rules.GetMaxLength())
		return false;

	for (std::string_view rest = name; !rest.empty();) {
		const auto [ch, length] = DecodeUTF8(rest);
		if (length == 0 || rules.IsForbidden(ch))
			return false;

		rest.remove_prefix(length);

		if (rest.empty() && rules.IsForbiddenTrailing(ch))
			return false;
	}

	return name.empty() || !rules.IsReservedName(name);
}

} // namespace Filesan
