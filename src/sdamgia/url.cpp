#include "url.hpp"

#include <stdexcept>

#include <boost/url.hpp>

namespace urls = boost::urls;

namespace sdamgia
{
namespace url
{

// Every character that may appear in a uri reference, '%' included so existing escapes survive
static constexpr urls::grammar::lut_chars uri_chars
	= urls::unreserved_chars
	+ urls::sub_delim_chars
	+ urls::grammar::lut_chars(":/?#[]@%");

template<typename S>
static std::string to_string(S const& s)
{
	return std::string(s.data(), s.size());
}

static urls::url parse_absolute(std::string const& uri)
{
	std::string const encoded(urls::encode(uri, uri_chars));
	auto r = urls::parse_uri(encoded);
	if(r.has_error())
		throw std::invalid_argument("Not an absolute url: '" + uri + "'");

	return urls::url(r.value());
}

parts split(std::string const& uri)
{
	urls::url const u(parse_absolute(uri));

	parts p;
	if(u.scheme_id() == urls::scheme::https)
		p.scheme = "https";
	else if(u.scheme_id() == urls::scheme::http)
		p.scheme = "http";
	else
		throw std::invalid_argument("Unsupported scheme in '" + uri + "'");

	p.host = to_string(u.encoded_host());
	if(p.host.empty())
		throw std::invalid_argument("No host in '" + uri + "'");

	p.port = u.has_port() ? to_string(u.port()) : (p.scheme == "https" ? "443" : "80");

	p.target = to_string(u.encoded_target());
	if(p.target.empty() || p.target[0] == '?')
		p.target.insert(0, "/");

	return p;
}

std::string with_query(std::string const& uri, query_t const& query)
{
	if(query.empty())
		return uri;

	urls::url u(parse_absolute(uri));

	urls::encoding_opts opt;
	opt.space_as_plus = true;
	urls::params_ref params(u.params(opt));
	for(auto const& kv : query)
		params.append(urls::param_view(kv.first, kv.second));

	return to_string(u.buffer());
}

std::string join(std::string const& base, std::string const& ref)
{
	urls::url const b(parse_absolute(base));

	std::string const encoded(urls::encode(ref, uri_chars));
	auto r = urls::parse_uri_reference(encoded);
	if(r.has_error())
		throw std::invalid_argument("Invalid url reference: '" + ref + "'");

	urls::url dest;
	auto resolved = urls::resolve(b, r.value(), dest);
	if(resolved.has_error())
		throw std::invalid_argument("Cannot resolve '" + ref + "' against '" + base + "'");

	return to_string(dest.buffer());
}

}
}
