#include "client.hpp"

#include <algorithm>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/lexical_cast/try_lexical_convert.hpp>

#include <sdamgia/errors.hpp>
#include <sdamgia/https_downloader.hpp>
#include <sdamgia/paginator.hpp>
#include <sdamgia/selectors.hpp>
#include <sdamgia/text.hpp>

#include <sdamgia/parsers/catalog_parser.hpp>
#include <sdamgia/parsers/listing_parser.hpp>
#include <sdamgia/parsers/problem_parser.hpp>

namespace sdamgia
{

client::client(scope _default_scope, client_config const& config)
	: client(_default_scope, std::unique_ptr<downloader>(new https_downloader(config.user_agent)), config)
{}

client::client(scope _default_scope, std::unique_ptr<downloader> _dl, client_config const& config)
	: default_scope(_default_scope)
	, verbose(config.verbose)
	, dl(std::move(_dl))
	, executor(*dl, config.verbose)
	, resolver(executor, config.rasterizer, config.recognizer_factory, config.workers, config.verbose)
{}

scope const& client::effective(scope_override_t const& s) const
{
	return s ? s.get() : default_scope;
}

static bool parse_id(std::string const& str, uint64_t& id)
{
	if(str.empty() || !std::all_of(str.begin(), str.end(), [](char c) { return c >= '0' && c <= '9'; }))
		return false;

	return boost::conversion::try_lexical_convert(str, id);
}

static boost::optional<int> parse_topic_id(boost::optional<std::string> const& label)
{
	if(!label)
		return boost::none;

	std::vector<std::string> words(text::split_words(label.get()));
	int topic_id;
	if(words.size() < 2 || !boost::conversion::try_lexical_convert(words[1], topic_id))
		return boost::none;

	return topic_id;
}

static std::string parse_answer(std::string const& raw)
{
	std::string answer(text::strip(raw));
	if(boost::algorithm::starts_with(answer, selectors::answer_prefix))
		answer.erase(0, std::string(selectors::answer_prefix).size());

	return text::strip(answer);
}

static std::vector<problem_id_t> parse_analogs(std::vector<std::string> const& links, problem_id_t problem_id)
{
	std::vector<problem_id_t> analogs;

	for(std::string const& href : links)
	{
		std::string::size_type pos = href.find(selectors::problem_link_prefix);
		if(pos == std::string::npos)
			continue;

		std::string id_str(href.substr(pos + std::string(selectors::problem_link_prefix).size()));
		problem_id_t id;
		if(!parse_id(id_str, id) || id == problem_id)
			continue;

		analogs.push_back(id);
	}

	std::sort(analogs.begin(), analogs.end());
	return analogs;
}

problem_part client::make_part(fragment const& f, bool recognize_text)
{
	problem_part part;
	part.html = f.html;

	part.image_links = f.formula_links;
	for(std::string const& link : f.image_links)
		if(std::find(f.formula_links.begin(), f.formula_links.end(), link) == f.formula_links.end())
			part.image_links.push_back(link);

	if(!recognize_text)
		return part;

	formula_resolver::result_t formulas(resolver.resolve(f.formula_links));

	std::string transcript;
	for(fragment::piece const& p : f.pieces)
		transcript += text::strip(p.formula ? formulas.at(p.value) : p.value);

	part.text = text::normalize(transcript);
	return part;
}

problem client::get_problem(problem_id_t problem_id, bool recognize_text, scope_override_t const& s)
{
	scope const& sc = effective(s);

	problem_parser pp(sc.base_url());
	pp.parse(executor.fetch(sc, selectors::problem_path, {
		{"id", boost::lexical_cast<std::string>(problem_id)}
	}));

	problem_parser::result const& r = pp.get_result();
	if(!r.found)
		throw problem_not_found_error(problem_id);

	problem p;
	p.problem_id = problem_id;
	p.exam = sc.exam;
	p.subj = sc.subj;
	p.topic_id = parse_topic_id(r.label);

	if(!r.bodies.empty())
		p.condition = make_part(r.bodies[0], recognize_text);

	if(r.solution)
		p.solution = make_part(r.solution.get(), recognize_text);
	else if(r.bodies.size() > 1)
		p.solution = make_part(r.bodies[1], recognize_text);

	if(r.answer)
		p.answer = parse_answer(r.answer.get());

	p.analogs = parse_analogs(r.related_links, problem_id);

	return p;
}

static std::vector<problem_id_t> extract_ids(std::string const& html)
{
	std::vector<problem_id_t> ids;

	listing_parser lp([&](std::string label) {
		std::vector<std::string> words(text::split_words(label));

		problem_id_t id;
		if(!words.empty() && parse_id(words.back(), id))
			ids.push_back(id);
	}, [](std::string) {});

	lp.parse(html);
	return ids;
}

static std::vector<std::string> extract_link_texts(std::string const& html)
{
	std::vector<std::string> texts;

	listing_parser lp([](std::string) {}, [&](std::string link) {
		texts.push_back(link);
	});

	lp.parse(html);
	return texts;
}

std::vector<problem_id_t> client::search(std::string const& query, scope_override_t const& s)
{
	scope const& sc = effective(s);

	return collect_pages<problem_id_t>([&](size_t page) {
		return executor.fetch(sc, selectors::search_path, {
			{"search", query},
			{"page", boost::lexical_cast<std::string>(page)}
		});
	}, extract_ids, verbose);
}

std::vector<problem_id_t> client::get_test(test_id_t test_id, scope_override_t const& s)
{
	return extract_ids(executor.fetch(effective(s), selectors::test_path, {
		{"id", boost::lexical_cast<std::string>(test_id)}
	}));
}

std::vector<std::string> client::get_theme(uint64_t theme_id, scope_override_t const& s)
{
	scope const& sc = effective(s);

	return collect_pages<std::string>([&](size_t page) {
		return executor.fetch(sc, selectors::test_path, {
			{"theme", boost::lexical_cast<std::string>(theme_id)},
			{"page", boost::lexical_cast<std::string>(page)}
		});
	}, extract_link_texts, verbose);
}

static catalog_entry make_entry(catalog_parser::raw_topic const& topic)
{
	catalog_entry entry;

	std::string label(topic.label ? topic.label.get() : std::string());
	std::string::size_type sep = label.find(". ");
	if(sep == std::string::npos)
		entry.topic_id = label;
	else
	{
		entry.topic_id = label.substr(0, sep);
		entry.topic_name = label.substr(sep + 2);
	}

	if(!entry.topic_id.empty() && entry.topic_id[0] == ' ')
		entry.topic_id = text::drop_chars(entry.topic_id, 2);

	if(boost::algorithm::starts_with(entry.topic_id, selectors::catalog_topic_prefix))
		entry.topic_id.erase(0, std::string(selectors::catalog_topic_prefix).size());

	entry.categories = topic.categories;
	return entry;
}

std::vector<catalog_entry> client::get_catalog(scope_override_t const& s)
{
	catalog_parser cp;
	cp.parse(executor.fetch(effective(s), selectors::catalog_path));

	std::vector<catalog_parser::raw_topic> const& topics = cp.get_topics();

	// The first topic block is the page header, not a topic
	std::vector<catalog_entry> catalog;
	for(size_t i = 1; i < topics.size(); ++i)
		catalog.push_back(make_entry(topics[i]));

	return catalog;
}

test_id_t parse_test_location(std::string const& location)
{
	std::string::size_type begin = location.find("id=");
	if(begin == std::string::npos)
		throw unexpected_redirect_error(location);
	begin += 3;

	std::string::size_type end = location.find("&nt", begin);
	std::string id_str(location.substr(begin, end == std::string::npos ? std::string::npos : end - begin));

	test_id_t id;
	if(!parse_id(id_str, id))
		throw unexpected_redirect_error(location);

	return id;
}

test_id_t client::generate_test(test_selection const& selection, scope_override_t const& s)
{
	scope const& sc = effective(s);

	url::query_t query;
	query.emplace_back("a", "generate");
	if(selection.is_full())
	{
		std::string const n(boost::lexical_cast<std::string>(selection.full_n()));
		size_t const topic_count = get_catalog(sc).size();

		for(size_t i = 1; i <= topic_count; ++i)
			query.emplace_back("prob" + boost::lexical_cast<std::string>(i), n);
	}
	else
	{
		for(auto const& kv : selection.topic_counts())
			query.emplace_back("prob" + boost::lexical_cast<std::string>(kv.first), boost::lexical_cast<std::string>(kv.second));
	}

	return parse_test_location(executor.fetch_redirect_target(sc, selectors::test_path, query));
}

static std::string py_bool(bool b)
{
	return b ? "True" : "False";
}

std::string client::generate_pdf(test_id_t test_id, pdf_options const& options, scope_override_t const& s)
{
	scope const& sc = effective(s);

	std::string const location(executor.fetch_redirect_target(sc, selectors::test_path, {
		{"id", boost::lexical_cast<std::string>(test_id)},
		{"print", "true"},
		{"pdf", to_param(options.variant)},
		{"sol", py_bool(options.solution)},
		{"num", py_bool(options.nums)},
		{"ans", py_bool(options.answers)},
		{"key", py_bool(options.key)},
		{"crit", py_bool(options.crit)},
		{"pre", py_bool(options.instruction)},
		{"dcol", options.col},
		{"tt", options.title}
	}));

	return url::join(sc.base_url(), location);
}

}
