// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "filesan/Config.hxx"
#include "filesan/RuleSet.hxx"
#include "filesan/Error.hxx"
#include "Unicode.hxx"
#include "Log.hxx"

#include <yaml-cpp/exceptions.h>
#include <yaml-cpp/node/parse.h>
#include <yaml-cpp/node/node.h>
#include <yaml-cpp/node/iterator.h>
#include <yaml-cpp/node/impl.h>
#include <yaml-cpp/node/convert.h>
#include <yaml-cpp/node/detail/impl.h>

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <exception>
#include <string_view>

using std::string_view_literals::operator""sv;

namespace Filesan {

static constexpr std::array known_keys{
	"base"sv,
	"escape_char"sv,
	"max_length"sv,
	"forbidden_chars"sv,
	"forbidden_ranges"sv,
	"forbidden_trailing"sv,
	"reserved_names"sv,
	"reserved_exact_names"sv,
};

static constexpr int
ParseHexDigit(char ch) noexcept
{
	if (ch >= '0' && ch <= '9')
		return ch - '0';
	else if (ch >= 'a' && ch <= 'f')
		return ch - 'a' + 0xa;
	else if (ch >= 'A' && ch <= 'F')
		return ch - 'A' + 0xa;
	else
		return -1;
}

/**
 * Parse "U+XXXX" notation (one to six hex digits).
 */
static char32_t
ParseCodePointNotation(std::string_view s)
{
	const auto digits = s.substr(2);
	if (digits.empty() || digits.size() > 6)
		throw ConfigurationError(fmt::format("Malformed code point: '{}'", s));

	char32_t value = 0;
	for (const char ch : digits) {
		const int digit = ParseHexDigit(ch);
		if (digit < 0)
			throw ConfigurationError(fmt::format("Malformed code point: '{}'", s));

		value = (value << 4) | char32_t(digit);
	}

	if (!IsUnicodeScalar(value))
		throw ConfigurationError(fmt::format("Not a Unicode scalar value: '{}'", s));

	return value;
}

/**
 * Parse a character specification: either a string consisting of
 * exactly one character or "U+XXXX".
 */
static char32_t
ParseChar(const YAML::Node &node, const char *key)
{
	if (!node.IsScalar())
		throw ConfigurationError(fmt::format("'{}': character expected", key));

	const auto value = node.as<std::string>();
	const std::string_view s = value;

	if (s.size() > 2 && s.starts_with("U+"sv))
		return ParseCodePointNotation(s);

	const auto [ch, length] = DecodeUTF8(s);
	if (length == 0 || length != s.size())
		throw ConfigurationError(fmt::format("'{}': exactly one character expected, got '{}'",
						     key, s));

	return ch;
}

static void
CheckSequence(const YAML::Node &node, const char *key)
{
	if (!node.IsSequence())
		throw ConfigurationError(fmt::format("'{}' must be a list", key));
}

static void
AddChars(std::set<char32_t> &dest, const YAML::Node &node, const char *key)
{
	CheckSequence(node, key);

	for (const auto &i : node)
		dest.insert(ParseChar(i, key));
}

static void
AddRanges(std::set<char32_t> &dest, const YAML::Node &node, const char *key)
{
	CheckSequence(node, key);

	for (const auto &i : node) {
		if (!i.IsSequence() || i.size() != 2)
			throw ConfigurationError(fmt::format("'{}': each range must be a list of two characters",
							     key));

		const char32_t first = ParseChar(i[0], key);
		const char32_t last = ParseChar(i[1], key);
		if (first > last)
			throw ConfigurationError(fmt::format("'{}': range U+{:04X}..U+{:04X} is empty",
							     key, unsigned(first),
							     unsigned(last)));

		for (char32_t ch = first; ch <= last; ++ch)
			if (!IsSurrogate(ch))
				dest.insert(ch);
	}
}

static void
AddNames(std::vector<std::string> &dest, const YAML::Node &node,
	 const char *key)
{
	CheckSequence(node, key);

	for (const auto &i : node) {
		if (!i.IsScalar())
			throw ConfigurationError(fmt::format("'{}': name expected", key));

		auto name = i.as<std::string>();
		if (std::find(dest.begin(), dest.end(), name) == dest.end())
			dest.emplace_back(std::move(name));
	}
}

static CharFlags
ParseBase(std::string_view name)
{
	if (name == "none"sv)
		return CharFlags::NONE;
	else if (name == "posix"sv)
		return CharFlags::UNIX;
	else if (name == "windows"sv)
		return CharFlags::WINDOWS;
	else if (name == "mac"sv)
		return CharFlags::MAC;
	else if (name == "portable"sv)
		return CharFlags::ALL;
	else if (name == "native"sv)
		return CharFlags::SYSTEM;
	else
		throw ConfigurationError(fmt::format("Unknown base rule set: '{}'", name));
}

/**
 * Warn about reserved names which can never match because an
 * escaped name never contains one of their characters literally.
 *
 * @param exact true if the names are compared with the whole name,
 * which means a forbidden trailing character is never literal either
 */
static void
WarnUnreachableNames(const RuleSet &rules,
		     const std::vector<std::string> &names, bool exact)
{
	for (const auto &name : names) {
		for (std::string_view rest = name; !rest.empty();) {
			const auto [ch, length] = DecodeUTF8(rest);
			if (length == 0)
				break;

			rest.remove_prefix(length);

			if (rules.IsForbidden(ch)) {
				LogFmt(1, "filesan",
				       "Reserved name '{}' contains forbidden character U+{:04X} and will never match",
				       name, unsigned(ch));
				break;
			}

			if (exact && rest.empty() && rules.IsForbiddenTrailing(ch))
				LogFmt(1, "filesan",
				       "Reserved name '{}' ends with forbidden trailing character U+{:04X} and will never match",
				       name, unsigned(ch));
		}
	}
}

static RuleSet
ParseRuleSet(const YAML::Node &node)
{
	if (!node.IsMap())
		throw ConfigurationError("Rule set must be a YAML map");

	for (const auto &i : node) {
		const auto key = i.first.as<std::string>();
		if (std::find(known_keys.begin(), known_keys.end(),
			      std::string_view{key}) == known_keys.end())
			throw ConfigurationError(fmt::format("Unknown key: '{}'", key));
	}

	char32_t escape_char = DEFAULT_ESCAPE_CHAR;
	if (const auto n = node["escape_char"])
		escape_char = ParseChar(n, "escape_char");

	CharFlags flags = CharFlags::NONE;
	if (const auto n = node["base"]) {
		if (!n.IsScalar())
			throw ConfigurationError("'base' must be a string");

		flags = ParseBase(n.as<std::string>());
	}

	const auto base = RuleSet::FromFlags(flags, escape_char);

	auto forbidden_chars = base.GetForbiddenChars();
	auto forbidden_trailing = base.GetForbiddenTrailing();
	auto reserved_names = base.GetReservedNames();
	auto reserved_exact_names = base.GetReservedExactNames();
	std::size_t max_length = base.GetMaxLength();

	if (const auto n = node["max_length"]) {
		if (!n.IsScalar())
			throw ConfigurationError("'max_length' must be a number");

		max_length = n.as<std::size_t>();
	}

	if (const auto n = node["forbidden_chars"])
		AddChars(forbidden_chars, n, "forbidden_chars");

	if (const auto n = node["forbidden_ranges"])
		AddRanges(forbidden_chars, n, "forbidden_ranges");

	if (const auto n = node["forbidden_trailing"])
		AddChars(forbidden_trailing, n, "forbidden_trailing");

	if (const auto n = node["reserved_names"])
		AddNames(reserved_names, n, "reserved_names");

	if (const auto n = node["reserved_exact_names"])
		AddNames(reserved_exact_names, n, "reserved_exact_names");

	auto rules = RuleSet::Custom(std::move(forbidden_chars),
				     std::move(reserved_names),
				     std::move(forbidden_trailing),
				     max_length, escape_char,
				     std::move(reserved_exact_names));

	WarnUnreachableNames(rules, rules.GetReservedNames(), false);
	WarnUnreachableNames(rules, rules.GetReservedExactNames(), true);

	LogFmt(5, "filesan",
	       "Rule set: {} forbidden characters, {} reserved names, escape character U+{:04X}, maximum length {}",
	       rules.GetForbiddenChars().size(),
	       rules.GetReservedNames().size() + rules.GetReservedExactNames().size(),
	       unsigned(rules.GetEscapeChar()), rules.GetMaxLength());

	return rules;
}

RuleSet
LoadRuleSet(const YAML::Node &node)
try {
	return ParseRuleSet(node);
} catch (const YAML::Exception &) {
	std::throw_with_nested(ConfigurationError("Malformed rule set"));
}

RuleSet
LoadRuleSetFile(const char *path)
try {
	auto rules = LoadRuleSet(YAML::LoadFile(path));
	LogFmt(4, "filesan", "Loaded rule set from '{}'", path);
	return rules;
} catch (...) {
	std::throw_with_nested(ConfigurationError(fmt::format("Failed to load rule set file '{}'",
							      path)));
}

} // namespace Filesan
