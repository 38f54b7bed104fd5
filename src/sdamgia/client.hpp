#pragma once

#include <memory>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include <sdamgia/downloader.hpp>
#include <sdamgia/formula_resolver.hpp>
#include <sdamgia/request_executor.hpp>
#include <sdamgia/types.hpp>

namespace sdamgia
{
	struct fragment;

	struct client_config
	{
		std::string user_agent = "sdamgia/0.2";
		size_t workers = 4;
		bool verbose = false;
		std::shared_ptr<image_rasterizer> rasterizer;
		recognizer_factory_t recognizer_factory;
	};

	/*
	 * Entry point to one exam/subject dataset of sdamgia.ru. Every operation
	 * takes an optional scope that replaces the default one for that call only.
	 * The transport is owned by the client and released with it.
	 */
	class client
	{
	public:
		typedef boost::optional<scope> scope_override_t;

	private:
		scope default_scope;
		bool verbose;
		std::unique_ptr<downloader> dl;
		request_executor executor;
		formula_resolver resolver;

		scope const& effective(scope_override_t const& s) const;

		problem_part make_part(fragment const& f, bool recognize_text);

	public:
		client(scope _default_scope, client_config const& config = client_config());
		client(scope _default_scope, std::unique_ptr<downloader> _dl, client_config const& config = client_config());
		client(client&) = delete;
		void operator=(client&) = delete;

		problem get_problem(problem_id_t problem_id, bool recognize_text = false, scope_override_t const& s = boost::none);

		std::vector<problem_id_t> search(std::string const& query, scope_override_t const& s = boost::none);
		std::vector<problem_id_t> get_test(test_id_t test_id, scope_override_t const& s = boost::none);
		std::vector<std::string> get_theme(uint64_t theme_id, scope_override_t const& s = boost::none);

		std::vector<catalog_entry> get_catalog(scope_override_t const& s = boost::none);

		test_id_t generate_test(test_selection const& selection = test_selection::full(1), scope_override_t const& s = boost::none);
		std::string generate_pdf(test_id_t test_id, pdf_options const& options = pdf_options(), scope_override_t const& s = boost::none);
	};

	/// Test id carried by a test generation redirect ("...id=<n>&nt=...").
	test_id_t parse_test_location(std::string const& location);
}
