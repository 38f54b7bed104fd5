#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <boost/optional.hpp>

namespace sdamgia
{
	enum class exam_type
	{
		ege,
		oge
	};

	enum class subject
	{
		math,
		mathb,
		phys,
		inf,
		rus,
		bio,
		en,
		chem,
		geo,
		soc,
		de,
		fr,
		lit,
		sp,
		hist
	};

	std::string to_string(exam_type e);
	std::string to_string(subject s);

	exam_type parse_exam_type(std::string const& str);
	subject parse_subject(std::string const& str);

	/// Dataset partition every request is made against; selects the base domain.
	struct scope
	{
		exam_type exam;
		subject subj;

		std::string base_url() const;
	};

	typedef uint64_t problem_id_t;
	typedef uint64_t test_id_t;

	struct problem_part
	{
		std::string html;
		std::vector<std::string> image_links;
		std::string text;
	};

	struct problem
	{
		problem_id_t problem_id;
		exam_type exam;
		subject subj;
		boost::optional<problem_part> condition;
		boost::optional<problem_part> solution;
		std::string answer;
		boost::optional<int> topic_id;
		std::vector<problem_id_t> analogs;
	};

	struct category
	{
		std::string category_id;
		std::string category_name;
	};

	struct catalog_entry
	{
		std::string topic_id;
		std::string topic_name;
		std::vector<category> categories;
	};

	/// Either a uniform count for every catalog topic or explicit topic counts.
	class test_selection
	{
	public:
		typedef std::map<unsigned int, unsigned int> counts_t;

	private:
		boost::optional<unsigned int> full_count;
		counts_t counts;

		test_selection(boost::optional<unsigned int> _full_count, counts_t _counts);

	public:
		static test_selection full(unsigned int n);
		static test_selection explicit_counts(counts_t counts);

		bool is_full() const;
		unsigned int full_n() const;
		counts_t const& topic_counts() const;
	};

	enum class pdf_variant
	{
		vertical,
		wide_margins,
		large_font,
		landscape
	};

	std::string to_param(pdf_variant v);

	struct pdf_options
	{
		bool solution = false;
		bool nums = false;
		bool answers = false;
		bool key = false;
		bool crit = false;
		bool instruction = false;
		std::string col;
		std::string title;
		pdf_variant variant = pdf_variant::vertical;
	};

	struct raster_image
	{
		unsigned int width;
		unsigned int height;
		unsigned int channels;
		std::vector<uint8_t> pixels;
	};
}
