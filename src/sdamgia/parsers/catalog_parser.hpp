#pragma once

#include <string>
#include <vector>

#include <boost/optional.hpp>

#include <supermarx/scraper/util.hpp>
#include <supermarx/scraper/html_parser.hpp>
#include <supermarx/scraper/html_watcher.hpp>
#include <supermarx/scraper/html_recorder.hpp>

#include <sdamgia/selectors.hpp>
#include <sdamgia/types.hpp>

namespace sdamgia
{
/*
 * Collects the catalog blocks of /prob_catalog in document order. A block
 * without an id attribute is a topic; a block with one is a category of the
 * innermost topic, provided it sits inside that topic's children container.
 */
class catalog_parser : public supermarx::html_parser::default_handler
{
public:
	struct raw_topic
	{
		boost::optional<std::string> label;
		std::vector<category> categories;
	};

private:
	struct frame
	{
		enum kind_e {
			F_TOPIC,
			F_CHILDREN,
			F_CATEGORY
		};

		kind_e kind;
		size_t topic;
		size_t category;
	};

	std::vector<raw_topic> topics;
	std::vector<frame> stack;

	boost::optional<supermarx::html_recorder> rec;
	supermarx::html_watcher_collection wc;

	static bool has_class(AttributesT const& atts, char const* cls)
	{
		return supermarx::util::contains_attr(cls, atts.getValue("class"));
	}

	void push(frame f)
	{
		stack.push_back(f);
		wc.add([&]() {
			stack.pop_back();
		});
	}

	boost::optional<size_t> enclosing_topic() const
	{
		bool in_children = false;
		for(auto it = stack.rbegin(); it != stack.rend(); ++it)
		{
			if(it->kind == frame::F_CHILDREN)
				in_children = true;
			else if(it->kind == frame::F_TOPIC)
				return in_children ? boost::optional<size_t>(it->topic) : boost::none;
		}
		return boost::none;
	}

public:
	catalog_parser()
		: topics()
		, stack()
		, rec()
		, wc()
	{}

	template<typename T>
	void parse(T source)
	{
		supermarx::html_parser::parse(source, *this);
	}

	std::vector<raw_topic> const& get_topics() const
	{
		return topics;
	}

	virtual void startElement(const std::string& /* namespaceURI */, const std::string& /* localName */, const std::string& qName, const AttributesT& atts)
	{
		if(rec) {
			rec.get().startElement();
		}

		wc.startElement();

		if(qName == "div" && has_class(atts, selectors::catalog_block)) {
			std::string id(atts.getValue(selectors::catalog_id_attr));
			if(id.empty()) {
				topics.emplace_back();
				push(frame{frame::F_TOPIC, topics.size() - 1, 0});
			} else if(boost::optional<size_t> t = enclosing_topic()) {
				topics[*t].categories.push_back(category{id, ""});
				push(frame{frame::F_CATEGORY, *t, topics[*t].categories.size() - 1});
			}
		} else if(qName == "div" && has_class(atts, selectors::catalog_children)) {
			if(!stack.empty()) {
				push(frame{frame::F_CHILDREN, stack.back().topic, 0});
			}
		} else if(qName == "b" && !rec && !stack.empty() && stack.back().kind == frame::F_TOPIC && has_class(atts, selectors::catalog_name)) {
			size_t t = stack.back().topic;
			if(!topics[t].label) {
				topics[t].label = std::string();
				rec = supermarx::html_recorder(
							[this, t](std::string ch) { topics[t].label = ch; }
						);
			}
		} else if(qName == "a" && !rec && !stack.empty() && stack.back().kind == frame::F_CATEGORY && has_class(atts, selectors::catalog_name)) {
			frame const& f = stack.back();
			category& c = topics[f.topic].categories[f.category];
			if(c.category_name.empty()) {
				size_t t = f.topic, i = f.category;
				rec = supermarx::html_recorder(
							[this, t, i](std::string ch) { topics[t].categories[i].category_name = ch; }
						);
			}
		}
	}

	virtual void characters(const std::string& ch)
	{
		if(rec) {
			rec->characters(ch);
		}
	}

	virtual void endElement(const std::string& /* namespaceURI */, const std::string& /* localName */, const std::string& /* qName */)
	{
		if(rec && rec.get().endElement()) {
			rec = boost::none;
		}

		wc.endElement();
	}
};
}
