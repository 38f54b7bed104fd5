#pragma once

#include <string>

#include <sdamgia/downloader.hpp>
#include <sdamgia/types.hpp>
#include <sdamgia/url.hpp>

namespace sdamgia
{
	/// Scope-aware GET requests. Non-2xx statuses raise http_status_error, nothing
	/// is retried.
	class request_executor
	{
	private:
		downloader& dl;
		bool verbose;

		downloader::response get(std::string const& uri, bool follow_redirects);

	public:
		request_executor(downloader& _dl, bool _verbose);
		request_executor(request_executor&) = delete;
		void operator=(request_executor&) = delete;

		static std::string make_url(scope const& s, std::string const& path_or_url, url::query_t const& query);

		std::string fetch(scope const& s, std::string const& path_or_url, url::query_t const& query = url::query_t());
		std::string fetch_bytes(std::string const& uri);

		/// Requests without following redirects and returns the raw Location header.
		std::string fetch_redirect_target(scope const& s, std::string const& path, url::query_t const& query);
	};
}
