#include "request_executor.hpp"

#include <iostream>

#include <sdamgia/errors.hpp>

namespace sdamgia
{

request_executor::request_executor(downloader& _dl, bool _verbose)
	: dl(_dl)
	, verbose(_verbose)
{}

std::string request_executor::make_url(scope const& s, std::string const& path_or_url, url::query_t const& query)
{
	return url::with_query(url::join(s.base_url(), path_or_url), query);
}

downloader::response request_executor::get(std::string const& uri, bool follow_redirects)
{
	downloader::response res(dl.get(uri, follow_redirects));

	if(verbose)
		std::cerr << "GET " << res.status << " " << uri << std::endl;

	return res;
}

std::string request_executor::fetch(scope const& s, std::string const& path_or_url, url::query_t const& query)
{
	return fetch_bytes(make_url(s, path_or_url, query));
}

std::string request_executor::fetch_bytes(std::string const& uri)
{
	downloader::response res(get(uri, true));
	if(res.status < 200 || res.status >= 300)
		throw http_status_error(res.status, uri);

	return std::move(res.body);
}

std::string request_executor::fetch_redirect_target(scope const& s, std::string const& path, url::query_t const& query)
{
	std::string const uri(make_url(s, path, query));

	downloader::response res(get(uri, false));
	if(res.status >= 400)
		throw http_status_error(res.status, uri);

	if(res.location.empty())
		throw missing_redirect_error(uri);

	return res.location;
}

}
