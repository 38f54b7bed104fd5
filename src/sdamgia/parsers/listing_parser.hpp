#pragma once

#include <functional>
#include <string>

#include <boost/optional.hpp>

#include <supermarx/scraper/util.hpp>
#include <supermarx/scraper/html_parser.hpp>
#include <supermarx/scraper/html_watcher.hpp>
#include <supermarx/scraper/html_recorder.hpp>

#include <sdamgia/selectors.hpp>

namespace sdamgia
{
/*
 * Reports every numeric label span of a listing page (search results, test
 * contents, theme pages): its whole text, and the text of its first link when
 * it has one.
 */
class listing_parser : public supermarx::html_parser::default_handler
{
private:
	enum state_e {
		S_INIT,
		S_LABEL
	};

public:
	typedef std::function<void(std::string)> label_callback_t;
	typedef std::function<void(std::string)> link_callback_t;

private:
	label_callback_t label_callback;
	link_callback_t link_callback;

	boost::optional<supermarx::html_recorder> rec, link_rec;
	supermarx::html_watcher_collection wc;

	state_e state;
	bool link_seen;

public:
	listing_parser(label_callback_t label_callback_, link_callback_t link_callback_)
		: label_callback(label_callback_)
		, link_callback(link_callback_)
		, rec()
		, link_rec()
		, wc()
		, state(S_INIT)
		, link_seen(false)
	{}

	template<typename T>
	void parse(T source)
	{
		supermarx::html_parser::parse(source, *this);
	}

	virtual void startElement(const std::string& /* namespaceURI */, const std::string& /* localName */, const std::string& qName, const AttributesT& atts)
	{
		if(rec) {
			rec.get().startElement();
		}

		if(link_rec) {
			link_rec.get().startElement();
		}

		wc.startElement();

		switch(state)
		{
		case S_INIT:
			if(qName == "span" && supermarx::util::contains_attr(selectors::number_label, atts.getValue("class"))) {
				state = S_LABEL;
				link_seen = false;

				rec = supermarx::html_recorder(
							[&](std::string ch) { label_callback(ch); }
						);

				wc.add([&]() {
					state = S_INIT;
				});
			}
			break;
		case S_LABEL:
			if(qName == "a" && !link_seen) {
				link_seen = true;
				link_rec = supermarx::html_recorder(
							[&](std::string ch) { link_callback(ch); }
						);
			}
			break;
		}
	}

	virtual void characters(const std::string& ch)
	{
		if(rec) {
			rec->characters(ch);
		}

		if(link_rec) {
			link_rec->characters(ch);
		}
	}

	virtual void endElement(const std::string& /* namespaceURI */, const std::string& /* localName */, const std::string& /* qName */)
	{
		if(link_rec && link_rec.get().endElement()) {
			link_rec = boost::none;
		}

		if(rec && rec.get().endElement()) {
			rec = boost::none;
		}

		wc.endElement();
	}
};
}
