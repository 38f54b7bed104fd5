#include "types.hpp"

#include <stdexcept>
#include <utility>

#include <sdamgia/selectors.hpp>

namespace sdamgia
{

static const std::map<exam_type, std::string> exam_names({
	{exam_type::ege, "ege"},
	{exam_type::oge, "oge"}
});

static const std::map<subject, std::string> subject_names({
	{subject::math, "math"},
	{subject::mathb, "mathb"},
	{subject::phys, "phys"},
	{subject::inf, "inf"},
	{subject::rus, "rus"},
	{subject::bio, "bio"},
	{subject::en, "en"},
	{subject::chem, "chem"},
	{subject::geo, "geo"},
	{subject::soc, "soc"},
	{subject::de, "de"},
	{subject::fr, "fr"},
	{subject::lit, "lit"},
	{subject::sp, "sp"},
	{subject::hist, "hist"}
});

template<typename T>
T reverse_lookup(std::map<T, std::string> const& names, std::string const& str, std::string const& what)
{
	for(auto const& kv : names)
		if(kv.second == str)
			return kv.first;

	throw std::invalid_argument("Unknown " + what + " '" + str + "'");
}

std::string to_string(exam_type e)
{
	return exam_names.at(e);
}

std::string to_string(subject s)
{
	return subject_names.at(s);
}

exam_type parse_exam_type(std::string const& str)
{
	return reverse_lookup(exam_names, str, "exam type");
}

subject parse_subject(std::string const& str)
{
	return reverse_lookup(subject_names, str, "subject");
}

std::string scope::base_url() const
{
	return "https://" + to_string(subj) + "-" + to_string(exam) + "." + selectors::base_domain;
}

test_selection::test_selection(boost::optional<unsigned int> _full_count, counts_t _counts)
	: full_count(_full_count)
	, counts(std::move(_counts))
{}

test_selection test_selection::full(unsigned int n)
{
	return test_selection(n, counts_t());
}

test_selection test_selection::explicit_counts(counts_t counts)
{
	return test_selection(boost::none, std::move(counts));
}

bool test_selection::is_full() const
{
	return static_cast<bool>(full_count);
}

unsigned int test_selection::full_n() const
{
	return full_count.get();
}

test_selection::counts_t const& test_selection::topic_counts() const
{
	return counts;
}

std::string to_param(pdf_variant v)
{
	switch(v)
	{
	case pdf_variant::vertical:
		return "";
	case pdf_variant::wide_margins:
		return "h";
	case pdf_variant::large_font:
		return "z";
	case pdf_variant::landscape:
		return "m";
	}

	throw std::invalid_argument("Unknown pdf variant");
}

}
