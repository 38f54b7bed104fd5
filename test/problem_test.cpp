#include <gtest/gtest.h>

#include <algorithm>

#include <sdamgia/errors.hpp>

#include "fakes.hpp"

using namespace sdamgia;
using namespace sdamgia::test;

static const std::string problem_page =
	"<html><body>"
	"<div class=\"header\"><img src=\"/logo.png\"></div>"
	"<div class=\"prob_maindiv\">"
		"<div class=\"nums\"><span class=\"prob_nums\">Тип 7 № <a href=\"/problem?id=26669\">26669</a></span></div>"
		"<div class=\"pbody\"><p>Найдите <img class=\"tex\" src=\"/formula/ab.svg\"> и <img class=\"tex\" src=\"/formula/cd.svg\">, затем <img class=\"tex\" src=\"/formula/ab.svg\"><img src=\"/get_file?id=1\"></p></div>"
		"<div class=\"solution\"><p>Решение: <img class=\"tex\" src=\"https://math-ege.sdamgia.ru/formula/ef.svg\"> так<span>\xC2\xAD</span>же.</p></div>"
		"<div class=\"answer\"><span>Ответ: 42</span></div>"
		"<div class=\"minor\">"
			"<a href=\"/problem?id=300\">1</a>"
			"<a href=\"/problem?id=26669\">2</a>"
			"<a href=\"/problem?id=20\">3</a>"
			"<a href=\"/test?id=5\">4</a>"
		"</div>"
	"</div>"
	"</body></html>";

static void serve_problem(fake_downloader& dl)
{
	dl.serve(base + "/problem?id=26669", problem_page);
	dl.serve(base + "/formula/ab.svg", "a+b");
	dl.serve(base + "/formula/cd.svg", "c\xE2\x88\x92" "d");
	dl.serve(base + "/formula/ef.svg", "e");
}

TEST(problem, extracts_fields)
{
	fixture f;
	serve_problem(*f.dl);

	problem p = f.c->get_problem(26669);

	EXPECT_EQ(p.problem_id, 26669u);
	EXPECT_EQ(p.exam, exam_type::ege);
	EXPECT_EQ(p.subj, subject::math);
	ASSERT_TRUE(p.topic_id);
	EXPECT_EQ(p.topic_id.get(), 7);
	EXPECT_EQ(p.answer, "42");
	EXPECT_EQ(p.analogs, std::vector<problem_id_t>({20, 300}));

	ASSERT_TRUE(p.condition);
	ASSERT_TRUE(p.solution);
	EXPECT_EQ(p.condition->html.find("<div class=\"pbody\">"), 0u);
	EXPECT_NE(p.solution->html.find("Решение"), std::string::npos);
}

TEST(problem, analogs_are_ascending_and_exclude_self)
{
	fixture f;
	serve_problem(*f.dl);

	problem p = f.c->get_problem(26669);

	EXPECT_TRUE(std::is_sorted(p.analogs.begin(), p.analogs.end()));
	EXPECT_EQ(std::find(p.analogs.begin(), p.analogs.end(), 26669u), p.analogs.end());
}

TEST(problem, image_links_are_absolute_unique_formulas_first)
{
	fixture f;
	serve_problem(*f.dl);

	problem p = f.c->get_problem(26669);

	ASSERT_TRUE(p.condition);
	EXPECT_EQ(p.condition->image_links, std::vector<std::string>({
		base + "/formula/ab.svg",
		base + "/formula/cd.svg",
		base + "/get_file?id=1"
	}));

	EXPECT_NE(p.condition->html.find("src=\"" + base + "/formula/ab.svg\""), std::string::npos);
	EXPECT_EQ(p.condition->html.find("src=\"/formula"), std::string::npos);

	ASSERT_TRUE(p.solution);
	EXPECT_EQ(p.solution->image_links, std::vector<std::string>({base + "/formula/ef.svg"}));
}

TEST(problem, text_is_empty_without_recognition)
{
	fixture f;
	serve_problem(*f.dl);

	problem p = f.c->get_problem(26669, false);

	ASSERT_TRUE(p.condition);
	ASSERT_TRUE(p.solution);
	EXPECT_EQ(p.condition->text, "");
	EXPECT_EQ(p.solution->text, "");
	EXPECT_EQ(f.counter.calls, 0u);
	EXPECT_EQ(f.dl->count(base + "/formula/ab.svg"), 0u);
}

TEST(problem, recognition_replaces_formula_images)
{
	fixture f;
	serve_problem(*f.dl);

	problem p = f.c->get_problem(26669, true);

	ASSERT_TRUE(p.condition);
	EXPECT_EQ(p.condition->text, "Найдите$a+b$и$c-d$, затем$a+b$");
	EXPECT_EQ(f.dl->count(base + "/formula/ab.svg"), 1u);

	ASSERT_TRUE(p.solution);
	EXPECT_EQ(p.solution->text, "Решение:$e$также.");
	EXPECT_EQ(f.counter.calls, 1u);
}

TEST(problem, recognition_without_backend_fails)
{
	fixture f(false);
	serve_problem(*f.dl);

	EXPECT_THROW(f.c->get_problem(26669, true), recognition_unavailable_error);
	EXPECT_NO_THROW(f.c->get_problem(26669, false));
}

TEST(problem, missing_container_is_not_found)
{
	fixture f;
	f.dl->serve(base + "/problem?id=1", "<html><body><div class=\"pbody\">x</div></body></html>");

	try
	{
		f.c->get_problem(1);
		FAIL() << "expected problem_not_found_error";
	}
	catch(problem_not_found_error const& e)
	{
		EXPECT_EQ(e.problem_id, 1u);
	}
}

TEST(problem, optional_fields_degrade)
{
	fixture f;
	f.dl->serve(base + "/problem?id=2",
		"<html><body><div class=\"prob_maindiv\"><span class=\"prob_nums\">Тип</span></div></body></html>");

	problem p = f.c->get_problem(2, true);

	EXPECT_FALSE(p.topic_id);
	EXPECT_FALSE(p.condition);
	EXPECT_FALSE(p.solution);
	EXPECT_EQ(p.answer, "");
	EXPECT_TRUE(p.analogs.empty());
}

TEST(problem, non_numeric_topic_is_null)
{
	fixture f;
	f.dl->serve(base + "/problem?id=3",
		"<html><body><div class=\"prob_maindiv\"><span class=\"prob_nums\">Тип Д12 № 3</span></div></body></html>");

	EXPECT_FALSE(f.c->get_problem(3).topic_id);
}

TEST(problem, solution_falls_back_to_second_body)
{
	fixture f;
	f.dl->serve(base + "/problem?id=4",
		"<html><body><div class=\"prob_maindiv\">"
		"<div class=\"pbody\">first</div>"
		"<div class=\"pbody\">second</div>"
		"</div></body></html>");

	problem p = f.c->get_problem(4, true);

	ASSERT_TRUE(p.condition);
	ASSERT_TRUE(p.solution);
	EXPECT_EQ(p.condition->text, "first");
	EXPECT_EQ(p.solution->text, "second");
	EXPECT_TRUE(p.condition->image_links.empty());
	EXPECT_EQ(f.counter.calls, 0u);
}

TEST(problem, foreign_absolute_images_are_kept)
{
	fixture f;
	f.dl->serve(base + "/problem?id=6",
		"<html><body><div class=\"prob_maindiv\">"
		"<div class=\"pbody\"><img src=\"https://oge.sdamgia.ru/img/x.png\"><img src=\"pics/y.png\"></div>"
		"</div></body></html>");

	problem p = f.c->get_problem(6);

	ASSERT_TRUE(p.condition);
	EXPECT_EQ(p.condition->image_links, std::vector<std::string>({
		"https://oge.sdamgia.ru/img/x.png",
		base + "/pics/y.png"
	}));
}

TEST(problem, scope_override_applies_to_one_call)
{
	fixture f;
	f.dl->serve("https://phys-oge.sdamgia.ru/problem?id=7",
		"<html><body><div class=\"prob_maindiv\"><div class=\"pbody\"><img src=\"/a.png\"></div></div></body></html>");
	f.dl->serve(base + "/problem?id=7",
		"<html><body><div class=\"prob_maindiv\"></div></body></html>");

	problem p = f.c->get_problem(7, false, scope{exam_type::oge, subject::phys});
	EXPECT_EQ(p.exam, exam_type::oge);
	EXPECT_EQ(p.subj, subject::phys);
	ASSERT_TRUE(p.condition);
	EXPECT_EQ(p.condition->image_links, std::vector<std::string>({"https://phys-oge.sdamgia.ru/a.png"}));

	problem q = f.c->get_problem(7);
	EXPECT_EQ(q.exam, exam_type::ege);
	EXPECT_EQ(q.subj, subject::math);
	EXPECT_EQ(f.dl->count(base + "/problem?id=7"), 1u);
}

TEST(problem, http_errors_propagate)
{
	fixture f;
	f.dl->serve(base + "/problem?id=8", "oops", 500);

	try
	{
		f.c->get_problem(8);
		FAIL() << "expected http_status_error";
	}
	catch(http_status_error const& e)
	{
		EXPECT_EQ(e.status, 500u);
		EXPECT_EQ(e.url, base + "/problem?id=8");
	}
}

TEST(problem, inline_and_spaced_image_sources)
{
	fixture f;
	f.dl->serve(base + "/problem?id=9",
		"<html><body><div class=\"prob_maindiv\">"
		"<div class=\"pbody\"><img src=\"data:image/gif;base64,R0lG\"><img src=\"/img/a b.png\"></div>"
		"</div></body></html>");

	problem p = f.c->get_problem(9);

	ASSERT_TRUE(p.condition);
	EXPECT_EQ(p.condition->image_links, std::vector<std::string>({
		"data:image/gif;base64,R0lG",
		base + "/img/a%20b.png"
	}));
}

TEST(problem, transport_errors_propagate_without_retry)
{
	fixture f;
	f.dl->fail(base + "/problem?id=10");

	EXPECT_THROW(f.c->get_problem(10), transport_error);
	EXPECT_EQ(f.dl->count(base + "/problem?id=10"), 1u);
}
