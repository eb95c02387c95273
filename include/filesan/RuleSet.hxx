// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Rule tables describing which file names are legal on an operating
 * system class.
 */

#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace Filesan {

/**
 * Operating system classes whose file name restrictions can be
 * combined with RuleSet::FromFlags().
 */
enum class CharFlags : unsigned {
	NONE = 0x0,

	/**
	 * Forbids NUL and '/'; reserves "." and "..".
	 */
	UNIX = 0x1,

	/**
	 * Forbids control characters and <>:"/\|?*; reserves the DOS
	 * device names; forbids a trailing dot or space.
	 */
	WINDOWS = 0x2,

	/**
	 * Forbids NUL, '/' and ':'; reserves "." and "..".
	 */
	MAC = 0x4,

	/**
	 * Forbids space and dot anywhere in the name.
	 */
	WINDOWS_END = 0x8,

	ALL = UNIX|WINDOWS|MAC,

#ifdef _WIN32
	SYSTEM = WINDOWS,
#elif defined(__APPLE__)
	SYSTEM = MAC,
#else
	SYSTEM = UNIX,
#endif
};

constexpr CharFlags
operator|(CharFlags a, CharFlags b) noexcept
{
	return CharFlags(unsigned(a) | unsigned(b));
}

constexpr CharFlags
operator&(CharFlags a, CharFlags b) noexcept
{
	return CharFlags(unsigned(a) & unsigned(b));
}

constexpr bool
Intersects(CharFlags a, CharFlags b) noexcept
{
	return (a & b) != CharFlags::NONE;
}

/**
 * The maximum length of a path component in bytes of its UTF-8
 * encoding (NAME_MAX on most file systems).
 */
static constexpr std::size_t DEFAULT_MAX_LENGTH = 255;

static constexpr char32_t DEFAULT_ESCAPE_CHAR = '%';

/**
 * The number of upper case hex digits following the escape
 * character.  Each escape sequence carries one UTF-16 code unit.
 */
static constexpr std::size_t ESCAPE_DIGITS = 4;

/**
 * An immutable description of what is forbidden in one path
 * component on a target system, and how forbidden characters are
 * escaped.
 *
 * Lengths are measured in bytes of the UTF-8 encoding.
 */
class RuleSet {
	std::set<char32_t> forbidden_chars;
	std::set<char32_t> forbidden_trailing;

	/**
	 * Compared (ASCII case-insensitively) with the base name, i.e.
	 * the part before the first dot.
	 */
	std::vector<std::string> reserved_names;

	/**
	 * Compared with the whole name.
	 */
	std::vector<std::string> reserved_exact_names;

	std::size_t max_length;

	char32_t escape_char;

	RuleSet(std::set<char32_t> &&_forbidden_chars,
		std::vector<std::string> &&_reserved_names,
		std::set<char32_t> &&_forbidden_trailing,
		std::size_t _max_length, char32_t _escape_char,
		std::vector<std::string> &&_reserved_exact_names) noexcept;

public:
	/**
	 * Assemble a rule set from its parts.
	 *
	 * Throws #ConfigurationError if the parts do not describe a
	 * usable rule set, e.g. if the escape character is forbidden
	 * or the maximum length is zero.
	 */
	static RuleSet Custom(std::set<char32_t> forbidden_chars,
			      std::vector<std::string> reserved_names,
			      std::set<char32_t> forbidden_trailing,
			      std::size_t max_length,
			      char32_t escape_char,
			      std::vector<std::string> reserved_exact_names={});

	/**
	 * Combine the restrictions of the given operating system
	 * classes.
	 */
	static RuleSet FromFlags(CharFlags flags,
				 char32_t escape_char=DEFAULT_ESCAPE_CHAR,
				 std::size_t max_length=DEFAULT_MAX_LENGTH);

	static RuleSet Windows(char32_t escape_char=DEFAULT_ESCAPE_CHAR) {
		return FromFlags(CharFlags::WINDOWS, escape_char);
	}

	static RuleSet Posix(char32_t escape_char=DEFAULT_ESCAPE_CHAR) {
		return FromFlags(CharFlags::UNIX, escape_char);
	}

	static RuleSet Mac(char32_t escape_char=DEFAULT_ESCAPE_CHAR) {
		return FromFlags(CharFlags::MAC, escape_char);
	}

	/**
	 * The union of all known restrictions: names escaped with this
	 * rule set are legal everywhere.
	 */
	static RuleSet Portable(char32_t escape_char=DEFAULT_ESCAPE_CHAR) {
		return FromFlags(CharFlags::ALL, escape_char);
	}

	/**
	 * The rules of the system this library was built for.
	 */
	static RuleSet Native(char32_t escape_char=DEFAULT_ESCAPE_CHAR) {
		return FromFlags(CharFlags::SYSTEM, escape_char);
	}

	const std::set<char32_t> &GetForbiddenChars() const noexcept {
		return forbidden_chars;
	}

	const std::set<char32_t> &GetForbiddenTrailing() const noexcept {
		return forbidden_trailing;
	}

	const std::vector<std::string> &GetReservedNames() const noexcept {
		return reserved_names;
	}

	const std::vector<std::string> &GetReservedExactNames() const noexcept {
		return reserved_exact_names;
	}

	std::size_t GetMaxLength() const noexcept {
		return max_length;
	}

	char32_t GetEscapeChar() const noexcept {
		return escape_char;
	}

	[[gnu::pure]]
	bool IsForbidden(char32_t ch) const noexcept {
		return forbidden_chars.contains(ch);
	}

	/**
	 * May this character appear literally (other than at the end)
	 * in a file name on the target system?
	 */
	[[gnu::pure]]
	bool IsAllowed(char32_t ch) const noexcept {
		return !IsForbidden(ch);
	}

	[[gnu::pure]]
	bool IsForbiddenTrailing(char32_t ch) const noexcept {
		return forbidden_trailing.contains(ch);
	}

	/**
	 * Must this character be replaced with an escape sequence?
	 *
	 * @param last true if this is the last character of the name
	 */
	[[gnu::pure]]
	bool MustEscape(char32_t ch, bool last) const noexcept {
		return ch == escape_char || IsForbidden(ch) ||
			(last && IsForbiddenTrailing(ch));
	}

	/**
	 * Is this name (or its base name) reserved by the target
	 * system?
	 */
	[[gnu::pure]]
	bool IsReservedName(std::string_view name) const noexcept;
};

} // namespace Filesan
