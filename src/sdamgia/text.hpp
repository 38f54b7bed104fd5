#pragma once

#include <string>
#include <vector>

namespace sdamgia
{
namespace text
{
	/// NFKC composition, typographic minus to '-', soft hyphens removed. Idempotent.
	std::string normalize(std::string const& str);

	/// Trims unicode whitespace (including no-break spaces) from both ends.
	std::string strip(std::string const& str);

	/// Splits on runs of unicode whitespace, dropping empty words.
	std::vector<std::string> split_words(std::string const& str);

	/// Drops the first n utf-8 encoded characters.
	std::string drop_chars(std::string const& str, size_t n);
}
}
