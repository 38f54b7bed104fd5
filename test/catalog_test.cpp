#include <gtest/gtest.h>

#include "fakes.hpp"

using namespace sdamgia;
using namespace sdamgia::test;

static const std::string catalog_page =
	"<html><body>"
	"<div class=\"cat_category\"><b class=\"cat_name\">Каталог заданий. Все темы</b></div>"
	"<div class=\"cat_category\">"
		"<div class=\"cat_header\"><b class=\"cat_name\">1. Алгебраические выражения</b></div>"
		"<div class=\"cat_children\">"
			"<div class=\"cat_category\" data-id=\"101\"><a class=\"cat_name\" href=\"/test?theme=101\">Числа</a></div>"
			"<div class=\"cat_category\" data-id=\"102\"><a class=\"cat_name\" href=\"/test?theme=102\">Степени. Корни</a></div>"
		"</div>"
	"</div>"
	"<div class=\"cat_category\">"
		"<b class=\"cat_name\">Задания 2. Уравнения</b>"
		"<div class=\"cat_children\"></div>"
	"</div>"
	"<div class=\"cat_category\">"
		"<b class=\"cat_name\"> \xC2\xA0" "3. Текстовые задачи</b>"
		"<div class=\"cat_children\">"
			"<div class=\"cat_category\" data-id=\"301\"><a class=\"cat_name\" href=\"/test?theme=301\">На движение</a></div>"
		"</div>"
	"</div>"
	"</body></html>";

TEST(catalog, drops_page_entry_and_parses_topics)
{
	fixture f;
	f.dl->serve(base + "/prob_catalog", catalog_page);

	std::vector<catalog_entry> catalog(f.c->get_catalog());
	ASSERT_EQ(catalog.size(), 3u);

	EXPECT_EQ(catalog[0].topic_id, "1");
	EXPECT_EQ(catalog[0].topic_name, "Алгебраические выражения");
	ASSERT_EQ(catalog[0].categories.size(), 2u);
	EXPECT_EQ(catalog[0].categories[0].category_id, "101");
	EXPECT_EQ(catalog[0].categories[0].category_name, "Числа");
	EXPECT_EQ(catalog[0].categories[1].category_id, "102");
	EXPECT_EQ(catalog[0].categories[1].category_name, "Степени. Корни");

	EXPECT_EQ(catalog[1].topic_id, "2");
	EXPECT_EQ(catalog[1].topic_name, "Уравнения");
	EXPECT_TRUE(catalog[1].categories.empty());

	EXPECT_EQ(catalog[2].topic_id, "3");
	EXPECT_EQ(catalog[2].topic_name, "Текстовые задачи");
	ASSERT_EQ(catalog[2].categories.size(), 1u);
	EXPECT_EQ(catalog[2].categories[0].category_id, "301");
}

TEST(catalog, only_first_block_is_dropped)
{
	fixture f;
	f.dl->serve(base + "/prob_catalog",
		"<html><body>"
		"<div class=\"cat_category\"><b class=\"cat_name\">1. Первая</b></div>"
		"<div class=\"cat_category\"><b class=\"cat_name\">2. Вторая</b></div>"
		"</body></html>");

	std::vector<catalog_entry> catalog(f.c->get_catalog());
	ASSERT_EQ(catalog.size(), 1u);
	EXPECT_EQ(catalog[0].topic_id, "2");
	EXPECT_EQ(catalog[0].topic_name, "Вторая");
}

TEST(catalog, categories_outside_children_are_ignored)
{
	fixture f;
	f.dl->serve(base + "/prob_catalog",
		"<html><body>"
		"<div class=\"cat_category\"></div>"
		"<div class=\"cat_category\"><b class=\"cat_name\">4. Тема</b>"
			"<div class=\"cat_category\" data-id=\"9\"><a class=\"cat_name\">Не категория</a></div>"
		"</div>"
		"</body></html>");

	std::vector<catalog_entry> catalog(f.c->get_catalog());
	ASSERT_EQ(catalog.size(), 1u);
	EXPECT_TRUE(catalog[0].categories.empty());
}

TEST(catalog, empty_page_yields_nothing)
{
	fixture f;
	f.dl->serve(base + "/prob_catalog", "<html><body></body></html>");

	EXPECT_TRUE(f.c->get_catalog().empty());
}
