#pragma once

// Markup contract of the sdamgia.ru pages. Everything the parsers match on lives here.

namespace sdamgia
{
namespace selectors
{
	static constexpr char const* base_domain = "sdamgia.ru";

	// problem page
	static constexpr char const* problem_container = "prob_maindiv";
	static constexpr char const* body_block = "pbody";
	static constexpr char const* solution_block = "solution";
	static constexpr char const* answer_block = "answer";
	static constexpr char const* related_block = "minor";
	static constexpr char const* number_label = "prob_nums";
	static constexpr char const* formula_image = "tex";

	static constexpr char const* answer_prefix = "Ответ:";
	static constexpr char const* problem_link_prefix = "/problem?id=";

	// catalog page
	static constexpr char const* catalog_block = "cat_category";
	static constexpr char const* catalog_children = "cat_children";
	static constexpr char const* catalog_name = "cat_name";
	static constexpr char const* catalog_id_attr = "data-id";
	static constexpr char const* catalog_topic_prefix = "Задания ";

	// endpoints
	static constexpr char const* problem_path = "/problem";
	static constexpr char const* search_path = "/search";
	static constexpr char const* test_path = "/test";
	static constexpr char const* catalog_path = "/prob_catalog";
}
}
