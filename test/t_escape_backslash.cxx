// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "escape/Backslash.hxx"

#include <gtest/gtest.h>

#include <string.h>

using std::string_view_literals::operator""sv;

static constexpr bool
IsReserved(char32_t ch) noexcept
{
	return ch == ' ' || ch == ',' || ch == '=';
}

static constexpr bool
Never(char32_t) noexcept
{
	return false;
}

static constexpr struct BackslashEscapeData {
	const char *unescaped, *escaped;
} backslash_escape_data[] = {
	{ "", "" },
	{ "abc", "abc" },
	{ "a=b", "a\\=b" },
	{ "a,b c=d", "a\\,b\\ c\\=d" },
	{ "=", "\\=" },
	{ "   ", "\\ \\ \\ " },
	{ "trailing,", "trailing\\," },
	{ "back\\slash", "back\\slash" },
	{ "back\\=slash", "back\\\\=slash" },
	{ "many,,,,,,,,,,,,", "many\\,\\,\\,\\,\\,\\,\\,\\,\\,\\,\\,\\," },
};

TEST(BackslashEscape, Basic)
{
	for (const auto &i : backslash_escape_data) {
		EXPECT_EQ(EscapeIf(i.unescaped, IsReserved), i.escaped);
		EXPECT_EQ(UnescapeIf(i.escaped, IsReserved), i.unescaped);
	}
}

TEST(BackslashEscape, Find)
{
	EXPECT_EQ(FindEscapeIf("", IsReserved), std::string_view::npos);
	EXPECT_EQ(FindEscapeIf("foobar", IsReserved), std::string_view::npos);
	EXPECT_EQ(FindEscapeIf("=", IsReserved), 0u);
	EXPECT_EQ(FindEscapeIf("foo bar", IsReserved), 3u);
	EXPECT_EQ(FindEscapeIf("foo\\bar", IsReserved), std::string_view::npos);

	EXPECT_EQ(FindUnescapeIf("foo bar", IsReserved), std::string_view::npos);
	EXPECT_EQ(FindUnescapeIf("foo\\bar", IsReserved), std::string_view::npos);
	EXPECT_EQ(FindUnescapeIf("foo\\ bar", IsReserved), 3u);
	EXPECT_EQ(FindUnescapeIf("a\\\\,", IsReserved), 2u);
	EXPECT_EQ(FindUnescapeIf("trailing\\", IsReserved), std::string_view::npos);
}

TEST(BackslashEscape, NeverMatching)
{
	static constexpr auto s = "a,b c=d\\"sv;
	EXPECT_EQ(EscapeIf(s, Never), s);
	EXPECT_EQ(UnescapeIf(s, Never), s);
	EXPECT_EQ(EscapeSizeIf(s, Never), s.size());
}

/**
 * The marker is not reserved, so escaping twice escapes the reserved
 * characters again and the second pass is not a no-op.
 */
TEST(BackslashEscape, Twice)
{
	const auto once = EscapeIf("a=b,c d"sv, IsReserved);
	EXPECT_EQ(once, "a\\=b\\,c\\ d");

	const auto twice = EscapeIf(once, IsReserved);
	EXPECT_EQ(twice, "a\\\\=b\\\\,c\\\\ d");

	EXPECT_EQ(UnescapeIf(twice, IsReserved), once);
	EXPECT_EQ(UnescapeIf(once, IsReserved), "a=b,c d");

	/* on clean input, it is idempotent */
	const auto clean = EscapeIf("abc\\def"sv, IsReserved);
	EXPECT_EQ(EscapeIf(clean, IsReserved), clean);
}

TEST(BackslashEscape, Unescape)
{
	/* a marker not followed by a reserved character is kept */
	EXPECT_EQ(UnescapeIf("a\\b"sv, IsReserved), "a\\b");
	EXPECT_EQ(UnescapeIf("a\\"sv, IsReserved), "a\\");
	EXPECT_EQ(UnescapeIf("\\"sv, IsReserved), "\\");
	EXPECT_EQ(UnescapeIf("\\\\"sv, IsReserved), "\\\\");
	EXPECT_EQ(UnescapeIf("\\ \\,\\="sv, IsReserved), " ,=");
	EXPECT_EQ(UnescapeIf("a\\\\\\,b"sv, IsReserved), "a\\\\,b");
}

TEST(BackslashEscape, Buffer)
{
	for (const auto &i : backslash_escape_data) {
		const std::string_view unescaped{i.unescaped};
		const size_t size = EscapeSizeIf(unescaped, IsReserved);
		ASSERT_EQ(size, strlen(i.escaped));

		char buffer[256];
		size_t length = EscapeIf(unescaped, buffer, IsReserved);
		ASSERT_EQ(length, size);
		ASSERT_EQ(memcmp(buffer, i.escaped, length), 0);

		length = UnescapeIf(std::string_view{buffer, length}, buffer,
				    IsReserved);
		ASSERT_EQ(std::string_view(buffer, length), unescaped);
	}
}

TEST(BackslashEscape, UnescapeInPlace)
{
	char buffer[] = "foo\\ bar\\,\\baz\\=";
	const size_t length = UnescapeIf(buffer, buffer, IsReserved);
	EXPECT_EQ(std::string_view(buffer, length), "foo bar,\\baz=");
}

TEST(BackslashEscape, Properties)
{
	static constexpr const char *inputs[] = {
		"",
		"plain",
		"with space",
		" leading",
		"trailing ",
		"a,b=c d",
		"\\,\\=\\ ",
		"==,, ",
		"caf\xc3\xa9 \xe2\x82\xac=5",
	};

	for (const char *p : inputs) {
		const std::string_view src{p};
		const auto dest = EscapeIf(src, IsReserved);

		/* each match adds exactly one marker */
		size_t matches = 0;
		for (char ch : src)
			if (IsReserved(static_cast<unsigned char>(ch)))
				++matches;
		EXPECT_EQ(dest.size(), src.size() + matches);
		EXPECT_EQ(dest.size(), EscapeSizeIf(src, IsReserved));

		/* the clean prefix is preserved */
		const size_t begin = FindEscapeIf(src, IsReserved);
		if (begin == src.npos) {
			EXPECT_EQ(dest, src);
		} else {
			EXPECT_EQ(dest.substr(0, begin), src.substr(0, begin));
			EXPECT_EQ(dest[begin], '\\');
		}

		/* every reserved character is preceded by a marker */
		for (size_t i = 0; i < dest.size(); ++i) {
			if (IsReserved(static_cast<unsigned char>(dest[i]))) {
				ASSERT_GT(i, 0u);
				EXPECT_EQ(dest[i - 1], '\\');
			}
		}

		EXPECT_EQ(UnescapeIf(dest, IsReserved), src);
	}
}

TEST(BackslashEscape, PredicateKinds)
{
	static constexpr auto s = "a=b;c"sv;

	/* lambda */
	EXPECT_EQ(EscapeIf(s, [](char32_t ch){ return ch == ';'; }),
		  "a=b\\;c");

	/* function pointer */
	bool (*const f)(char32_t) noexcept = IsReserved;
	EXPECT_EQ(EscapeIf(s, f), "a\\=b;c");

	/* function object with state */
	struct Among {
		std::string_view chars;

		bool operator()(char32_t ch) const noexcept {
			return ch < 0x80 &&
				chars.find(static_cast<char>(ch)) != chars.npos;
		}
	};

	EXPECT_EQ(EscapeIf(s, Among{"=;"}), "a\\=b\\;c");
}

TEST(BackslashEscape, EachCharacterTestedOnce)
{
	static constexpr auto s = "abc=d\xc3\xa9,f"sv;

	unsigned calls = 0;
	const auto counting = [&calls](char32_t ch){
		++calls;
		return IsReserved(ch);
	};

	EXPECT_EQ(EscapeIf(s, counting), "abc\\=d\xc3\xa9\\,f");

	/* 8 characters, one of them two bytes long */
	EXPECT_EQ(calls, 8u);

	calls = 0;
	EXPECT_EQ(EscapeIf("abc"sv, counting), "abc");
	EXPECT_EQ(calls, 3u);
}

TEST(BackslashEscape, MultiByte)
{
	/* the predicate sees whole characters */
	const auto is_euro = [](char32_t ch){ return ch == 0x20ac; };
	EXPECT_EQ(EscapeIf("5\xe2\x82\xac"sv, is_euro), "5\\\xe2\x82\xac");
	EXPECT_EQ(UnescapeIf("5\\\xe2\x82\xac"sv, is_euro), "5\xe2\x82\xac");

	/* no byte of a multi-byte character is mistaken for a
	   character of its own */
	const auto is_0x82 = [](char32_t ch){ return ch == 0x82; };
	EXPECT_EQ(EscapeIf("5\xe2\x82\xac"sv, is_0x82), "5\xe2\x82\xac");

	/* 4-byte character at the beginning */
	const auto is_emoji = [](char32_t ch){ return ch == 0x1f600; };
	EXPECT_EQ(EscapeIf("\xf0\x9f\x98\x80x"sv, is_emoji),
		  "\\\xf0\x9f\x98\x80x");
}

TEST(BackslashEscape, Malformed)
{
	/* malformed bytes are copied verbatim */
	static constexpr auto s = "a\xff=\xe2\x82"sv;
	EXPECT_EQ(EscapeIf(s, IsReserved), "a\xff\\=\xe2\x82");

	const auto is_replacement = [](char32_t ch){
		return ch == UNICODE_REPLACEMENT_CHARACTER;
	};

	EXPECT_EQ(EscapeIf(s, is_replacement), "a\\\xff=\\\xe2\\\x82");
}
