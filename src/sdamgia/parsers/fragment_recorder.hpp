#pragma once

#include <algorithm>
#include <functional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <supermarx/scraper/util.hpp>

#include <sdamgia/selectors.hpp>

namespace sdamgia
{
	typedef std::vector<std::pair<std::string, std::string>> attribute_list_t;

	/// A recorded element: its markup, its images and its text interleaved with
	/// formula image placeholders.
	struct fragment
	{
		struct piece
		{
			bool formula;
			std::string value; // text, or the formula image url
		};

		std::string html;
		std::vector<std::string> formula_links;
		std::vector<std::string> image_links;
		std::vector<piece> pieces;
	};

	/*
	 * Re-serialises one element and its descendants from SAX events. Created on
	 * the element's own start tag; endElement() returns true once that element
	 * closes, after which the callback has received the fragment.
	 */
	class fragment_recorder
	{
	public:
		typedef std::function<void(fragment)> callback_t;

	private:
		callback_t callback;
		fragment frag;
		int depth;
		bool in_text;

		static bool is_void(std::string const& name)
		{
			static const std::set<std::string> void_elements({
				"area", "base", "br", "col", "embed", "hr", "img", "input",
				"link", "meta", "param", "source", "track", "wbr"
			});

			return void_elements.find(name) != void_elements.end();
		}

		static void escape_into(std::string& out, std::string const& str, bool attribute)
		{
			for(char c : str)
			{
				switch(c)
				{
				case '&': out += "&amp;"; break;
				case '<': out += "&lt;"; break;
				case '>': out += "&gt;"; break;
				case '"':
					if(attribute)
						out += "&quot;";
					else
						out.push_back(c);
					break;
				default:
					out.push_back(c);
				}
			}
		}

		static void add_unique(std::vector<std::string>& links, std::string const& link)
		{
			if(std::find(links.begin(), links.end(), link) == links.end())
				links.push_back(link);
		}

		void record_image(attribute_list_t const& atts)
		{
			std::string src, cls;
			bool has_src = false;
			for(auto const& a : atts)
			{
				if(a.first == "src")
				{
					src = a.second;
					has_src = true;
				}
				else if(a.first == "class")
					cls = a.second;
			}

			if(!has_src)
				return;

			if(supermarx::util::contains_attr(selectors::formula_image, cls))
			{
				add_unique(frag.formula_links, src);
				frag.pieces.push_back(fragment::piece{true, src});
			}
			else
				add_unique(frag.image_links, src);
		}

	public:
		explicit fragment_recorder(callback_t _callback)
			: callback(_callback)
			, frag()
			, depth(0)
			, in_text(false)
		{}

		void startElement(std::string const& name, attribute_list_t const& atts)
		{
			depth++;
			in_text = false;

			frag.html.push_back('<');
			frag.html += name;
			for(auto const& a : atts)
			{
				frag.html.push_back(' ');
				frag.html += a.first;
				frag.html += "=\"";
				escape_into(frag.html, a.second, true);
				frag.html.push_back('"');
			}
			frag.html.push_back('>');

			if(name == "img")
				record_image(atts);
		}

		void characters(std::string const& ch)
		{
			escape_into(frag.html, ch, false);

			if(in_text)
				frag.pieces.back().value += ch;
			else
			{
				frag.pieces.push_back(fragment::piece{false, ch});
				in_text = true;
			}
		}

		bool endElement(std::string const& name)
		{
			depth--;
			in_text = false;

			if(!is_void(name))
			{
				frag.html += "</";
				frag.html += name;
				frag.html.push_back('>');
			}

			if(depth > 0)
				return false;

			callback(std::move(frag));
			return true;
		}
	};
}
