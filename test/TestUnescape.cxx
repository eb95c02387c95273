// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "filesan/Escape.hxx"
#include "filesan/RuleSet.hxx"
#include "filesan/Error.hxx"

#include <gtest/gtest.h>

#include <set>
#include <string>

using namespace Filesan;

using std::string_view_literals::operator""sv;

static constexpr std::string_view names[] = {
	""sv,
	"foo"sv,
	"foo.txt"sv,
	"a:b"sv,
	"trailing."sv,
	"trailing "sv,
	"."sv,
	".."sv,
	"..."sv,
	".hidden"sv,
	"CON"sv,
	"con"sv,
	"CON.txt"sv,
	"con.tar.gz"sv,
	"Lpt1"sv,
	"CONSOLE"sv,
	"%"sv,
	"%%"sv,
	"%0043ON"sv,
	"%003A"sv,
	"100%"sv,
	"a/b/c"sv,
	"a\\b"sv,
	"<>:\"|?*"sv,
	"\0"sv,
	"tab\there"sv,
	"line\nbreak"sv,
	"\x7f"sv,
	"\xc3\xbc" "ber"sv,
	"\xe2\x82\xac."sv,
	"\xf0\x9f\x98\x80"sv,
	"_"sv,
	"_005F"sv,
	"a b. "sv,
};

static const RuleSet &
GetRuleSet(std::size_t i)
{
	static const RuleSet rule_sets[] = {
		RuleSet::Windows(),
		RuleSet::Posix(),
		RuleSet::Mac(),
		RuleSet::Portable(),
		RuleSet::FromFlags(CharFlags::ALL|CharFlags::WINDOWS_END, '_'),
		RuleSet::Custom({0x1f600, 0xfc}, {"\xf0\x9f\x98\x80"}, {0x20ac},
				255, 0xa4, {"~"}),
	};

	return rule_sets[i];
}

static constexpr std::size_t n_rule_sets = 6;

TEST(Unescape, Scenarios)
{
	const auto rules = RuleSet::Windows();

	EXPECT_EQ(UnescapeFilename("", rules), "");
	EXPECT_EQ(UnescapeFilename("foo.txt", rules), "foo.txt");
	EXPECT_EQ(UnescapeFilename("a%003Ab", rules), "a:b");
	EXPECT_EQ(UnescapeFilename("trailing%002E", rules), "trailing.");
	EXPECT_EQ(UnescapeFilename("%0043ON", rules), "CON");
	EXPECT_EQ(UnescapeFilename("%004EUL.txt", rules), "NUL.txt");
	EXPECT_EQ(UnescapeFilename("100%0025", rules), "100%");
	EXPECT_EQ(UnescapeFilename("%00250025", rules), "%0025");

	const auto posix = RuleSet::Posix();
	EXPECT_EQ(UnescapeFilename("%002E.", posix), "..");
	EXPECT_EQ(UnescapeFilename("a%0000b", posix), "a\0b"sv);

	const auto custom = RuleSet::Custom({0x1f600}, {}, {}, 255, '%');
	EXPECT_EQ(UnescapeFilename("a%D83D%DE00b", custom), "a\xf0\x9f\x98\x80" "b");
}

TEST(Unescape, Malformed)
{
	const auto rules = RuleSet::Windows();

	/* not a hex field */
	EXPECT_THROW(UnescapeFilename("bad%ZZ", rules), MalformedEscapeError);
	EXPECT_THROW(UnescapeFilename("bad%ZZZZ", rules), MalformedEscapeError);
	EXPECT_THROW(UnescapeFilename("bad%00G1", rules), MalformedEscapeError);

	/* truncated */
	EXPECT_THROW(UnescapeFilename("%", rules), MalformedEscapeError);
	EXPECT_THROW(UnescapeFilename("a%003", rules), MalformedEscapeError);

	/* lower case hex digits are never generated */
	EXPECT_THROW(UnescapeFilename("a%003ab", rules), MalformedEscapeError);

	/* a literal escape character */
	EXPECT_THROW(UnescapeFilename("100%", rules), MalformedEscapeError);

	/* literal forbidden characters */
	EXPECT_THROW(UnescapeFilename("a:b", rules), MalformedEscapeError);
	EXPECT_THROW(UnescapeFilename("trailing.", rules), MalformedEscapeError);

	/* unescaped reserved name */
	EXPECT_THROW(UnescapeFilename("CON", rules), MalformedEscapeError);
	EXPECT_THROW(UnescapeFilename("aux.txt", rules), MalformedEscapeError);

	/* superfluous escape sequences */
	EXPECT_THROW(UnescapeFilename("%0061", rules), MalformedEscapeError);
	EXPECT_THROW(UnescapeFilename("CO%004E", rules), MalformedEscapeError);
	EXPECT_THROW(UnescapeFilename("%002E%002E", rules), MalformedEscapeError);

	/* surrogates */
	EXPECT_THROW(UnescapeFilename("%D83D", rules), MalformedEscapeError);
	EXPECT_THROW(UnescapeFilename("%D83Dx", rules), MalformedEscapeError);
	EXPECT_THROW(UnescapeFilename("%D83D%0041", rules), MalformedEscapeError);
	EXPECT_THROW(UnescapeFilename("%DE00%D83D", rules), MalformedEscapeError);

	/* a supplementary character that needs no escaping */
	EXPECT_THROW(UnescapeFilename("%D83D%DE00", rules), MalformedEscapeError);

	/* not UTF-8 */
	EXPECT_THROW(UnescapeFilename("\xc3", rules), MalformedEscapeError);

	/* too long */
	EXPECT_THROW(UnescapeFilename(std::string(256, 'a'), rules),
		     MalformedEscapeError);
}

TEST(Unescape, WrongRuleSet)
{
	const auto escaped = EscapeFilename("CON", RuleSet::Windows());
	EXPECT_THROW(UnescapeFilename(escaped, RuleSet::Posix()),
		     MalformedEscapeError);

	/* a literal '%' is fine with '_' as escape character */
	EXPECT_THROW(UnescapeFilename(EscapeFilename("50%", RuleSet::Posix('_')),
				      RuleSet::Posix('%')),
		     MalformedEscapeError);
}

TEST(Unescape, Position)
{
	const auto rules = RuleSet::Windows();

	try {
		UnescapeFilename("abc%00ZZ", rules);
		FAIL() << "MalformedEscapeError expected";
	} catch (const MalformedEscapeError &e) {
		EXPECT_EQ(e.GetPosition(), 3u);
	}

	try {
		UnescapeFilename("ab:c", rules);
		FAIL() << "MalformedEscapeError expected";
	} catch (const MalformedEscapeError &e) {
		EXPECT_EQ(e.GetPosition(), 2u);
	}
}

/**
 * unescape(escape(s)) == s, the result is legal, and no two names
 * are escaped to the same string.
 */
TEST(Unescape, RoundTrip)
{
	for (std::size_t r = 0; r < n_rule_sets; ++r) {
		const auto &rules = GetRuleSet(r);
		std::set<std::string> outputs;

		for (const auto name : names) {
			const auto escaped = EscapeFilename(name, rules);
			EXPECT_TRUE(IsLegalFilename(escaped, rules))
				<< "rule set " << r << ": '" << escaped << "'";
			EXPECT_EQ(UnescapeFilename(escaped, rules), name)
				<< "rule set " << r;
			EXPECT_TRUE(outputs.insert(escaped).second)
				<< "rule set " << r << ": duplicate '" << escaped << "'";
		}
	}
}

/**
 * If UnescapeFilename() accepts a string, that string is exactly what
 * EscapeFilename() produces for the result.
 */
static void
CheckUnescapeIsConsistent(std::string_view s, const RuleSet &rules,
			  std::size_t r)
{
	std::string unescaped;
	try {
		unescaped = UnescapeFilename(s, rules);
	} catch (const MalformedEscapeError &) {
		return;
	}

	EXPECT_EQ(EscapeFilename(unescaped, rules), s) << "rule set " << r;
}

TEST(Unescape, NeverReturnsWrongAnswer)
{
	for (std::size_t r = 0; r < n_rule_sets; ++r) {
		const auto &rules = GetRuleSet(r);

		for (const auto name : names) {
			CheckUnescapeIsConsistent(name, rules, r);

			const auto escaped = EscapeFilename(name, rules);
			if (!escaped.empty()) {
				/* truncated */
				CheckUnescapeIsConsistent(std::string_view{escaped}.substr(0, escaped.size() - 1),
							  rules, r);

				/* doubled */
				CheckUnescapeIsConsistent(escaped + escaped, rules, r);
			}
		}
	}
}

TEST(Unescape, RoundTripLongest)
{
	const auto rules = RuleSet::Windows();

	std::string name(rules.GetMaxLength() - 5, 'x');
	name.push_back(':');

	const auto escaped = EscapeFilename(name, rules);
	EXPECT_EQ(escaped.size(), rules.GetMaxLength());
	EXPECT_EQ(UnescapeFilename(escaped, rules), name);
}
