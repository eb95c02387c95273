// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Unicode.hxx"

#include <assert.h>

static constexpr bool
IsContinuation(char ch) noexcept
{
	return (static_cast<unsigned char>(ch) & 0xc0) == 0x80;
}

std::pair<char32_t, std::size_t>
DecodeUTF8(std::string_view s) noexcept
{
	if (s.empty())
		return {0, 0};

	const auto lead = static_cast<unsigned char>(s.front());

	if (lead < 0x80)
		return {lead, 1};

	std::size_t length;
	char32_t ch, min;

	if ((lead & 0xe0) == 0xc0) {
		length = 2;
		ch = lead & 0x1f;
		min = 0x80;
	} else if ((lead & 0xf0) == 0xe0) {
		length = 3;
		ch = lead & 0x0f;
		min = 0x800;
	} else if ((lead & 0xf8) == 0xf0) {
		length = 4;
		ch = lead & 0x07;
		min = 0x10000;
	} else
		/* stray continuation byte or 0xf8..0xff */
		return {0, 0};

	if (s.size() < length)
		return {0, 0};

	for (std::size_t i = 1; i < length; ++i) {
		if (!IsContinuation(s[i]))
			return {0, 0};

		ch = (ch << 6) | (static_cast<unsigned char>(s[i]) & 0x3f);
	}

	if (ch < min || !IsUnicodeScalar(ch))
		return {0, 0};

	return {ch, length};
}

bool
ValidateUTF8(std::string_view s) noexcept
{
	while (!s.empty()) {
		const auto length = DecodeUTF8(s).second;
		if (length == 0)
			return false;

		s.remove_prefix(length);
	}

	return true;
}

void
AppendUTF8(std::string &dest, char32_t ch)
{
	assert(IsUnicodeScalar(ch));

	if (ch < 0x80) {
		dest.push_back(char(ch));
	} else if (ch < 0x800) {
		dest.push_back(char(0xc0 | (ch >> 6)));
		dest.push_back(char(0x80 | (ch & 0x3f)));
	} else if (ch < 0x10000) {
		dest.push_back(char(0xe0 | (ch >> 12)));
		dest.push_back(char(0x80 | ((ch >> 6) & 0x3f)));
		dest.push_back(char(0x80 | (ch & 0x3f)));
	} else {
		dest.push_back(char(0xf0 | (ch >> 18)));
		dest.push_back(char(0x80 | ((ch >> 12) & 0x3f)));
		dest.push_back(char(0x80 | ((ch >> 6) & 0x3f)));
		dest.push_back(char(0x80 | (ch & 0x3f)));
	}
}
