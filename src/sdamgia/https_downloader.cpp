#include "https_downloader.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>

#include <sdamgia/errors.hpp>

namespace sdamgia
{

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

static void check(beast::error_code const& ec, std::string const& what, url::parts const& p)
{
	if(ec)
		throw transport_error(what + " " + p.host + p.target + ": " + ec.message());
}

template<typename Stream>
static downloader::response exchange(Stream& stream, url::parts const& p, std::string const& agent)
{
	beast::error_code ec;

	http::request<http::empty_body> req(http::verb::get, p.target, 11);
	req.set(http::field::host, p.host);
	req.set(http::field::user_agent, agent);
	req.set(http::field::accept, "*/*");

	http::write(stream, req, ec);
	check(ec, "Could not send request to", p);

	beast::flat_buffer buffer;
	http::response_parser<http::string_body> parser;
	parser.body_limit(64 * 1024 * 1024);

	http::read(stream, buffer, parser, ec);
	check(ec, "Could not read response from", p);

	http::response<http::string_body> res(parser.release());

	downloader::response result;
	result.status = res.result_int();
	result.body = std::move(res.body());
	auto const location = res[http::field::location];
	result.location.assign(location.data(), location.size());
	return result;
}

https_downloader::https_downloader(std::string _agent)
	: agent(std::move(_agent))
	, ioc()
	, ctx(ssl::context::tls_client)
{
	ctx.set_default_verify_paths();
	ctx.set_verify_mode(ssl::verify_peer);
}

downloader::response https_downloader::fetch_once(url::parts const& p)
{
	beast::error_code ec;

	tcp::resolver resolver(ioc);
	auto const results = resolver.resolve(p.host, p.port, ec);
	check(ec, "Could not resolve", p);

	if(p.scheme == "http")
	{
		beast::tcp_stream stream(ioc);
		stream.connect(results, ec);
		check(ec, "Could not connect to", p);

		response res(exchange(stream, p, agent));

		stream.socket().shutdown(tcp::socket::shutdown_both, ec);
		if(ec && ec != beast::errc::not_connected)
			check(ec, "Could not close connection to", p);

		return res;
	}

	ssl::stream<beast::tcp_stream> stream(ioc, ctx);
	if(!SSL_set_tlsext_host_name(stream.native_handle(), p.host.c_str()))
	{
		ec.assign(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
		check(ec, "Could not set SNI for", p);
	}
	stream.set_verify_callback(ssl::host_name_verification(p.host));

	beast::get_lowest_layer(stream).connect(results, ec);
	check(ec, "Could not connect to", p);

	stream.handshake(ssl::stream_base::client, ec);
	check(ec, "TLS handshake failed with", p);

	response res(exchange(stream, p, agent));

	stream.shutdown(ec);
	if(ec == net::error::eof || ec == ssl::error::stream_truncated)
		ec = {};
	check(ec, "Could not close connection to", p);

	return res;
}

downloader::response https_downloader::get(std::string const& uri, bool follow_redirects)
{
	std::string current(uri);

	for(unsigned int hops = 0;; ++hops)
	{
		url::parts p;
		try
		{
			p = url::split(current);
		}
		catch(std::invalid_argument const& e)
		{
			throw transport_error(e.what());
		}

		response res(fetch_once(p));

		bool redirect = res.status == 301 || res.status == 302 || res.status == 303 || res.status == 307 || res.status == 308;
		if(!follow_redirects || !redirect || res.location.empty())
			return res;

		if(hops >= max_redirects)
			throw transport_error("Too many redirects for " + uri);

		current = url::join(current, res.location);
	}
}

}
