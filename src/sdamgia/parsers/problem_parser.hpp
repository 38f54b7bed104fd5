#pragma once

#include <list>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include <supermarx/scraper/util.hpp>
#include <supermarx/scraper/html_parser.hpp>
#include <supermarx/scraper/html_watcher.hpp>
#include <supermarx/scraper/html_recorder.hpp>

#include <sdamgia/selectors.hpp>
#include <sdamgia/url.hpp>
#include <sdamgia/parsers/fragment_recorder.hpp>

namespace sdamgia
{
/*
 * Picks the pieces of a problem page out of the first problem container:
 * number label, body blocks, solution block, answer block and related links.
 * Image sources inside the container are made absolute against base_url while
 * the page streams through, so recorded fragments already carry them.
 */
class problem_parser : public supermarx::html_parser::default_handler
{
private:
	enum state_e {
		S_INIT,
		S_PROBLEM,
		S_DONE
	};

public:
	struct result
	{
		bool found = false;
		boost::optional<std::string> label;
		std::vector<fragment> bodies;
		boost::optional<fragment> solution;
		boost::optional<std::string> answer;
		std::vector<std::string> related_links;
	};

private:
	std::string base_url;
	result res;

	boost::optional<supermarx::html_recorder> rec;
	supermarx::html_watcher_collection wc;
	std::list<fragment_recorder> fragments;

	state_e state;

	bool label_seen, solution_seen, answer_seen, related_seen, in_related;

	static bool has_class(AttributesT const& atts, char const* cls)
	{
		return supermarx::util::contains_attr(cls, atts.getValue("class"));
	}

	attribute_list_t read_attributes(std::string const& qName, AttributesT const& atts) const
	{
		attribute_list_t list;
		for(int i = 0; i < atts.getLength(); ++i)
		{
			std::string name(atts.getQName(i));
			std::string value(atts.getValue(i));

			if(state == S_PROBLEM && qName == "img" && name == "src" && value.find(selectors::base_domain) == std::string::npos)
			{
				try
				{
					value = url::join(base_url, value);
				}
				catch(std::invalid_argument const&)
				{
					// Unparsable sources are kept as written
				}
			}

			list.emplace_back(std::move(name), std::move(value));
		}
		return list;
	}

	void start_fragment(std::string const& qName, attribute_list_t const& attributes, fragment_recorder::callback_t callback)
	{
		fragments.emplace_back(callback);
		fragments.back().startElement(qName, attributes);
	}

public:
	explicit problem_parser(std::string _base_url)
		: base_url(std::move(_base_url))
		, res()
		, rec()
		, wc()
		, fragments()
		, state(S_INIT)
		, label_seen(false)
		, solution_seen(false)
		, answer_seen(false)
		, related_seen(false)
		, in_related(false)
	{}

	template<typename T>
	void parse(T source)
	{
		supermarx::html_parser::parse(source, *this);
	}

	result const& get_result() const
	{
		return res;
	}

	virtual void startElement(const std::string& /* namespaceURI */, const std::string& /* localName */, const std::string& qName, const AttributesT& atts)
	{
		if(rec) {
			rec.get().startElement();
		}

		wc.startElement();

		attribute_list_t attributes(read_attributes(qName, atts));
		for(auto& f : fragments) {
			f.startElement(qName, attributes);
		}

		switch(state)
		{
		case S_INIT:
			if(qName == "div" && has_class(atts, selectors::problem_container)) {
				state = S_PROBLEM;
				res.found = true;

				wc.add([&]() {
					state = S_DONE;
				});
			}
			break;
		case S_PROBLEM:
			if(qName == "span" && !label_seen && !rec && has_class(atts, selectors::number_label)) {
				label_seen = true;
				rec = supermarx::html_recorder(
							[&](std::string ch) { res.label = ch; }
						);
			} else if(qName == "div" && res.bodies.size() < 2 && has_class(atts, selectors::body_block)) {
				size_t index = res.bodies.size();
				res.bodies.emplace_back();
				start_fragment(qName, attributes, [this, index](fragment f) {
					res.bodies[index] = std::move(f);
				});
			} else if(qName == "div" && !solution_seen && has_class(atts, selectors::solution_block)) {
				solution_seen = true;
				start_fragment(qName, attributes, [this](fragment f) {
					res.solution = std::move(f);
				});
			} else if(qName == "div" && !answer_seen && !rec && has_class(atts, selectors::answer_block)) {
				answer_seen = true;
				rec = supermarx::html_recorder(
							[&](std::string ch) { res.answer = ch; }
						);
			} else if(qName == "div" && !related_seen && has_class(atts, selectors::related_block)) {
				related_seen = true;
				in_related = true;

				wc.add([&]() {
					in_related = false;
				});
			} else if(qName == "a" && in_related) {
				res.related_links.push_back(atts.getValue("href"));
			}
			break;
		case S_DONE:
			// Only the first problem container is read
			break;
		}
	}

	virtual void characters(const std::string& ch)
	{
		if(rec) {
			rec->characters(ch);
		}

		for(auto& f : fragments) {
			f.characters(ch);
		}
	}

	virtual void endElement(const std::string& /* namespaceURI */, const std::string& /* localName */, const std::string& qName)
	{
		if(rec && rec.get().endElement()) {
			rec = boost::none;
		}

		for(auto it = fragments.begin(); it != fragments.end();) {
			if(it->endElement(qName)) {
				it = fragments.erase(it);
			} else {
				++it;
			}
		}

		wc.endElement();
	}
};
}
