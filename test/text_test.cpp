#include <gtest/gtest.h>

#include <sdamgia/text.hpp>

using namespace sdamgia;

TEST(text, minus_and_soft_hyphen)
{
	EXPECT_EQ(text::normalize("x \xE2\x88\x92 1"), "x - 1");
	EXPECT_EQ(text::normalize("пере\xC2\xAD" "нос"), "перенос");
}

TEST(text, compatibility_composition)
{
	EXPECT_EQ(text::normalize("\xEF\xAC\x81"), "fi");          // U+FB01 ligature
	EXPECT_EQ(text::normalize("x\xC2\xB2"), "x2");             // superscript two
	EXPECT_EQ(text::normalize("\xEF\xBC\xA1"), "A");           // fullwidth A
	EXPECT_EQ(text::normalize("e\xCC\x81"), "\xC3\xA9");       // e + combining acute
	EXPECT_EQ(text::normalize("a\xC2\xA0" "b"), "a b");
	EXPECT_EQ(text::normalize("x\xE2\x81\xBB"), "x-");         // superscript minus
}

TEST(text, normalize_is_idempotent)
{
	std::vector<std::string> samples({
		"Найдите $\\frac{1}{2}$ \xE2\x88\x92 x\xC2\xB2",
		"e\xC2\xAD\xCC\x81",
		"x\xE2\x81\xBB\xC2\xA0\xEF\xAC\x81",
		"",
		"plain"
	});

	for(std::string const& s : samples)
	{
		std::string once(text::normalize(s));
		EXPECT_EQ(text::normalize(once), once) << s;
	}
}

TEST(text, strip_handles_unicode_spaces)
{
	EXPECT_EQ(text::strip("  a b \n"), "a b");
	EXPECT_EQ(text::strip("\xC2\xA0" "42\xE2\x80\x89"), "42");
	EXPECT_EQ(text::strip(" \t "), "");
	EXPECT_EQ(text::strip("Ж"), "Ж");
}

TEST(text, split_words)
{
	EXPECT_EQ(text::split_words("Тип 7\xC2\xA0№  26669 "), std::vector<std::string>({"Тип", "7", "№", "26669"}));
	EXPECT_TRUE(text::split_words(" \n").empty());
}

TEST(text, drop_chars_counts_characters)
{
	EXPECT_EQ(text::drop_chars(" \xC2\xA0" "12", 2), "12");
	EXPECT_EQ(text::drop_chars("ab", 2), "");
	EXPECT_EQ(text::drop_chars("a", 5), "");
}

TEST(text, malformed_utf8_is_kept_byte_by_byte)
{
	EXPECT_EQ(text::strip(" \xD0 "), "\xD0");                  // truncated lead byte
	EXPECT_EQ(text::strip("\xC2"), "\xC2");                     // not read as U+00C2 or U+00A0
	EXPECT_EQ(text::split_words("a\xFF b"), std::vector<std::string>({"a\xFF", "b"}));
	EXPECT_EQ(text::drop_chars("\xD0" "ab", 1), "ab");
	EXPECT_EQ(text::drop_chars("\x80\x80" "1", 2), "1");
	EXPECT_EQ(text::drop_chars("\xE2\x80", 1), "\x80");
}
