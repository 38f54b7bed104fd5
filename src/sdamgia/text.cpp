#include "text.hpp"

#include <locale>

#include <boost/algorithm/string.hpp>
#include <boost/locale.hpp>
#include <boost/locale/utf.hpp>

namespace sdamgia
{
namespace text
{

static const std::string minus_sign("\xE2\x88\x92");
static const std::string soft_hyphen("\xC2\xAD");

static std::locale const& utf8_locale()
{
	static const std::locale loc(boost::locale::generator()("en_US.UTF-8"));
	return loc;
}

namespace utf = boost::locale::utf;

typedef std::string::const_iterator iterator_t;

// Decodes the character at it and advances past it; a malformed byte is consumed on its own
static utf::code_point next_char(iterator_t& it, iterator_t end)
{
	iterator_t const start = it;
	utf::code_point cp = utf::utf_traits<char>::decode(it, end);
	if(cp == utf::illegal || cp == utf::incomplete)
		it = start + 1;
	return cp;
}

static bool is_space(utf::code_point cp)
{
	return (cp >= 0x09 && cp <= 0x0D)
		|| (cp >= 0x1C && cp <= 0x20)
		|| cp == 0x85
		|| cp == 0xA0
		|| cp == 0x1680
		|| (cp >= 0x2000 && cp <= 0x200A)
		|| cp == 0x2028
		|| cp == 0x2029
		|| cp == 0x202F
		|| cp == 0x205F
		|| cp == 0x3000;
}

std::string normalize(std::string const& str)
{
	std::string result(str);
	boost::algorithm::replace_all(result, minus_sign, "-");
	boost::algorithm::erase_all(result, soft_hyphen);

	result = boost::locale::normalize(result, boost::locale::norm_nfkc, utf8_locale());

	// NFKC maps superscript and subscript minus onto the typographic one
	boost::algorithm::replace_all(result, minus_sign, "-");
	return result;
}

std::string strip(std::string const& str)
{
	iterator_t begin = str.end(), end = str.end();

	for(iterator_t it = str.begin(); it != str.end();)
	{
		iterator_t const pos = it;
		if(is_space(next_char(it, str.end())))
			continue;

		if(begin == str.end())
			begin = pos;
		end = it;
	}

	return begin == str.end() ? std::string() : std::string(begin, end);
}

std::vector<std::string> split_words(std::string const& str)
{
	std::vector<std::string> words;
	std::string current;

	for(iterator_t it = str.begin(); it != str.end();)
	{
		iterator_t const pos = it;
		if(is_space(next_char(it, str.end())))
		{
			if(!current.empty())
				words.push_back(std::move(current));
			current.clear();
		}
		else
			current.append(pos, it);
	}

	if(!current.empty())
		words.push_back(std::move(current));

	return words;
}

std::string drop_chars(std::string const& str, size_t n)
{
	iterator_t it = str.begin();
	for(size_t i = 0; i < n && it != str.end(); ++i)
		next_char(it, str.end());

	return std::string(it, str.end());
}

}
}
