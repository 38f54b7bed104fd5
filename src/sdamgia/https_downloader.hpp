#pragma once

#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include <sdamgia/downloader.hpp>
#include <sdamgia/url.hpp>

namespace sdamgia
{
	/// Boost.Beast transport. Owns the io_context and TLS context shared by every
	/// request; each request uses its own connection, so get() may be called from
	/// several threads at once.
	class https_downloader : public downloader
	{
	private:
		static constexpr unsigned int max_redirects = 5;

		std::string agent;
		boost::asio::io_context ioc;
		boost::asio::ssl::context ctx;

		response fetch_once(url::parts const& p);

	public:
		explicit https_downloader(std::string _agent);
		https_downloader(https_downloader&) = delete;
		void operator=(https_downloader&) = delete;

		response get(std::string const& uri, bool follow_redirects = true) override;
	};
}
