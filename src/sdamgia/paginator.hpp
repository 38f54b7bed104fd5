#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <vector>

namespace sdamgia
{
	/// Fetches page 1, 2, ... until a page yields no items; returns the concatenation.
	template<typename T>
	std::vector<T> collect_pages(
		std::function<std::string(size_t)> const& fetch_page,
		std::function<std::vector<T>(std::string const&)> const& extract,
		bool verbose = false
	)
	{
		std::vector<T> items;

		for(size_t page = 1;; ++page)
		{
			std::vector<T> page_items(extract(fetch_page(page)));
			if(page_items.empty())
				break;

			if(verbose)
				std::cerr << "Page " << page << ": " << page_items.size() << " items" << std::endl;

			items.insert(items.end(), page_items.begin(), page_items.end());
		}

		if(verbose)
			std::cerr << "Total: " << items.size() << std::endl;

		return items;
	}
}
