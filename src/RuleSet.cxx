// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "filesan/RuleSet.hxx"
#include "filesan/Error.hxx"
#include "Unicode.hxx"

#include <fmt/core.h>

#include <algorithm>
#include <array>

namespace Filesan {

static constexpr CharFlags NON = CharFlags::NONE;
static constexpr CharFlags WWW = CharFlags::WINDOWS;
static constexpr CharFlags WWM = CharFlags::WINDOWS|CharFlags::MAC;
static constexpr CharFlags UWM = CharFlags::UNIX|CharFlags::WINDOWS|CharFlags::MAC;
static constexpr CharFlags WEE = CharFlags::WINDOWS_END;

/**
 * For each ASCII character: the systems which do not allow it in a
 * file name.  Characters above U+007F are allowed everywhere.
 */
static constexpr std::array<CharFlags, 0x80> disallowed_chars{
	// NUL  SOH  STX  ETX  EOT  ENQ  ACK  BEL
	UWM, WWW, WWW, WWW, WWW, WWW, WWW, WWW,
	// BS   TAB  LF   VT   FF   CR   SO   SI
	WWW, WWW, WWW, WWW, WWW, WWW, WWW, WWW,
	// DLE  DC1  DC2  DC3  DC4  NAK  SYN  ETB
	WWW, WWW, WWW, WWW, WWW, WWW, WWW, WWW,
	// CAN  EM   SUB  ESC  FS   GS   RS   US
	WWW, WWW, WWW, WWW, WWW, WWW, WWW, WWW,
	// SP   !    "    #    $    %    &    '
	WEE, NON, WWW, NON, NON, NON, NON, NON,
	// (    )    *    +    ,    -    .    /
	NON, NON, WWW, NON, NON, NON, WEE, UWM,
	// 0    1    2    3    4    5    6    7
	NON, NON, NON, NON, NON, NON, NON, NON,
	// 8    9    :    ;    <    =    >    ?
	NON, NON, WWM, NON, WWW, NON, WWW, WWW,
	// @    A    B    C    D    E    F    G
	NON, NON, NON, NON, NON, NON, NON, NON,
	// H    I    J    K    L    M    N    O
	NON, NON, NON, NON, NON, NON, NON, NON,
	// P    Q    R    S    T    U    V    W
	NON, NON, NON, NON, NON, NON, NON, NON,
	// X    Y    Z    [    \    ]    ^    _
	NON, NON, NON, NON, WWW, NON, NON, NON,
	// `    a    b    c    d    e    f    g
	NON, NON, NON, NON, NON, NON, NON, NON,
	// h    i    j    k    l    m    n    o
	NON, NON, NON, NON, NON, NON, NON, NON,
	// p    q    r    s    t    u    v    w
	NON, NON, NON, NON, NON, NON, NON, NON,
	// x    y    z    {    |    }    ~    DEL
	NON, NON, NON, NON, WWW, NON, NON, NON,
};

/**
 * DOS device names.
 */
static constexpr std::array windows_reserved{
	"CON", "PRN", "AUX", "NUL",
	"COM1", "COM2", "COM3", "COM4", "COM5",
	"COM6", "COM7", "COM8", "COM9",
	"LPT1", "LPT2", "LPT3", "LPT4", "LPT5",
	"LPT6", "LPT7", "LPT8", "LPT9",
};

static constexpr std::array unix_reserved{".", ".."};

static constexpr std::array<char32_t, 2> windows_trailing{' ', '.'};

static constexpr bool
IsUpperHexDigit(char32_t ch) noexcept
{
	return (ch >= '0' && ch <= '9') || (ch >= 'A' && ch <= 'F');
}

static constexpr char
ToLowerASCII(char ch) noexcept
{
	return ch >= 'A' && ch <= 'Z'
		? char(ch - 'A' + 'a')
		: ch;
}

[[gnu::pure]]
static bool
StringIsEqualIgnoreCaseASCII(std::string_view a, std::string_view b) noexcept
{
	return a.size() == b.size() &&
		std::equal(a.begin(), a.end(), b.begin(),
			   [](char x, char y){
				   return ToLowerASCII(x) == ToLowerASCII(y);
			   });
}

/**
 * Does the UTF-8 string contain the given code point?
 */
[[gnu::pure]]
static bool
ContainsCodePoint(std::string_view s, char32_t ch) noexcept
{
	while (!s.empty()) {
		const auto [c, length] = DecodeUTF8(s);
		if (length == 0)
			return false;

		if (c == ch)
			return true;

		s.remove_prefix(length);
	}

	return false;
}

static constexpr bool
IsHexDigitASCII(char ch) noexcept
{
	return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f') ||
		(ch >= 'A' && ch <= 'F');
}

/**
 * Does the name contain a case variant of the (ASCII) escape
 * character followed by a hex field?  Such a name would match an
 * escaped name when compared case-insensitively.
 */
[[gnu::pure]]
static bool
ContainsEscapeSequenceIgnoreCase(std::string_view name,
				 char32_t escape_char) noexcept
{
	if (escape_char >= 0x80)
		return false;

	const char lower = ToLowerASCII(char(escape_char));
	for (std::size_t i = 0; i + ESCAPE_DIGITS < name.size(); ++i) {
		const auto field = name.substr(i + 1, ESCAPE_DIGITS);
		if (ToLowerASCII(name[i]) == lower &&
		    std::all_of(field.begin(), field.end(), IsHexDigitASCII))
			return true;
	}

	return false;
}

static void
CheckCodePoints(const std::set<char32_t> &chars, const char *what)
{
	for (const char32_t ch : chars)
		if (!IsUnicodeScalar(ch))
			throw ConfigurationError(fmt::format("{} contains invalid code point U+{:04X}",
							     what, unsigned(ch)));
}

static void
CheckReservedNames(const std::vector<std::string> &names,
		   char32_t escape_char, bool base_name)
{
	for (const auto &name : names) {
		if (name.empty())
			throw ConfigurationError("Empty reserved name");

		if (!ValidateUTF8(name))
			throw ConfigurationError("Reserved name is not valid UTF-8");

		if (ContainsCodePoint(name, escape_char))
			throw ConfigurationError(fmt::format("Reserved name '{}' contains the escape character",
							     name));

		if (base_name && ContainsEscapeSequenceIgnoreCase(name, escape_char))
			throw ConfigurationError(fmt::format("Reserved name '{}' contains a variant of the escape character",
							     name));

		if (base_name && name.find('.') != name.npos)
			throw ConfigurationError(fmt::format("Reserved name '{}' contains a dot and can never match a base name",
							     name));
	}
}

RuleSet::RuleSet(std::set<char32_t> &&_forbidden_chars,
		 std::vector<std::string> &&_reserved_names,
		 std::set<char32_t> &&_forbidden_trailing,
		 std::size_t _max_length, char32_t _escape_char,
		 std::vector<std::string> &&_reserved_exact_names) noexcept
	:forbidden_chars(std::move(_forbidden_chars)),
	 forbidden_trailing(std::move(_forbidden_trailing)),
	 reserved_names(std::move(_reserved_names)),
	 reserved_exact_names(std::move(_reserved_exact_names)),
	 max_length(_max_length), escape_char(_escape_char) {}

RuleSet
RuleSet::Custom(std::set<char32_t> forbidden_chars,
		std::vector<std::string> reserved_names,
		std::set<char32_t> forbidden_trailing,
		std::size_t max_length,
		char32_t escape_char,
		std::vector<std::string> reserved_exact_names)
{
	if (max_length == 0)
		throw ConfigurationError("Maximum length must be positive");

	if (!IsUnicodeScalar(escape_char))
		throw ConfigurationError(fmt::format("Escape character U+{:04X} is not a Unicode scalar value",
						     unsigned(escape_char)));

	if (forbidden_chars.contains(escape_char))
		throw ConfigurationError(fmt::format("Escape character U+{:04X} is forbidden",
						     unsigned(escape_char)));

	CheckCodePoints(forbidden_chars, "Forbidden character set");
	CheckCodePoints(forbidden_trailing, "Forbidden trailing character set");

	/* escape sequences consist of hex digits, so they must be
	   legal everywhere, including at the end */
	for (const auto *chars : {&forbidden_chars, &forbidden_trailing}) {
		const auto i = std::find_if(chars->begin(), chars->end(),
					    IsUpperHexDigit);
		if (i != chars->end())
			throw ConfigurationError(fmt::format("Hex digit '{}' must not be forbidden",
							     char(*i)));
	}

	CheckReservedNames(reserved_names, escape_char, true);
	CheckReservedNames(reserved_exact_names, escape_char, false);

	return RuleSet(std::move(forbidden_chars), std::move(reserved_names),
		       std::move(forbidden_trailing), max_length, escape_char,
		       std::move(reserved_exact_names));
}

RuleSet
RuleSet::FromFlags(CharFlags flags, char32_t escape_char,
		   std::size_t max_length)
{
	std::set<char32_t> forbidden_chars;
	for (std::size_t i = 0; i < disallowed_chars.size(); ++i)
		if (Intersects(disallowed_chars[i], flags))
			forbidden_chars.insert(char32_t(i));

	std::vector<std::string> reserved_names;
	std::set<char32_t> forbidden_trailing;
	if (Intersects(flags, CharFlags::WINDOWS)) {
		reserved_names.assign(windows_reserved.begin(),
				      windows_reserved.end());
		forbidden_trailing.insert(windows_trailing.begin(),
					  windows_trailing.end());
	}

	std::vector<std::string> reserved_exact_names;
	if (Intersects(flags, CharFlags::UNIX|CharFlags::MAC))
		reserved_exact_names.assign(unix_reserved.begin(),
					    unix_reserved.end());

	return Custom(std::move(forbidden_chars), std::move(reserved_names),
		      std::move(forbidden_trailing), max_length, escape_char,
		      std::move(reserved_exact_names));
}

bool
RuleSet::IsReservedName(std::string_view name) const noexcept
{
	if (std::find(reserved_exact_names.begin(), reserved_exact_names.end(),
		      name) != reserved_exact_names.end())
		return true;

	const auto base = name.substr(0, name.find('.'));
	return std::any_of(reserved_names.begin(), reserved_names.end(),
			   [base](const std::string &i){
				   return StringIsEqualIgnoreCaseASCII(base, i);
			   });
}

} // namespace Filesan
