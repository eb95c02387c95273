// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Reversible escaping of arbitrary strings into legal file names.
 */

#pragma once

#include <string>
#include <string_view>

namespace Filesan {

class RuleSet;

/**
 * Escape the given UTF-8 string so it can be used as a path
 * component on the system described by the #RuleSet.
 *
 * The escape character, each forbidden character and a forbidden
 * trailing character are replaced with the escape character followed
 * by four upper case hex digits (e.g. "a:b" becomes "a%003Ab").
 * Characters above U+FFFF which need escaping are written as two
 * sequences (UTF-16 surrogate pair).  If the result is a reserved
 * name, its first character is escaped as well ("CON" becomes
 * "%0043ON").
 *
 * Distinct inputs always produce distinct outputs.
 *
 * Throws #LengthError if the result would exceed the maximum length,
 * #EncodingError if the input is not valid UTF-8.
 */
std::string
EscapeFilename(std::string_view original, const RuleSet &rules);

/**
 * The inverse of EscapeFilename().
 *
 * Throws #MalformedEscapeError if the string was not produced by
 * EscapeFilename() with the same #RuleSet.
 */
std::string
UnescapeFilename(std::string_view escaped, const RuleSet &rules);

/**
 * Check whether the given UTF-8 string is a legal name on the system
 * described by the #RuleSet.  The empty string is considered legal.
 */
[[gnu::pure]]
bool
IsLegalFilename(std::string_view name, const RuleSet &rules) noexcept;

} // namespace Filesan
