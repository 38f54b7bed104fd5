#pragma once

#include <string>
#include <utility>
#include <vector>

namespace sdamgia
{
namespace url
{
	typedef std::vector<std::pair<std::string, std::string>> query_t;

	struct parts
	{
		std::string scheme;
		std::string host;
		std::string port;
		std::string target;
	};

	/// Splits an absolute http(s) url; throws std::invalid_argument otherwise.
	parts split(std::string const& uri);

	/// Appends form-encoded parameters, spaces as '+'.
	std::string with_query(std::string const& uri, query_t const& query);

	/// Resolves a reference against a base url (RFC 3986, section 5.2).
	/// Characters that may not appear in a url are percent-encoded first.
	std::string join(std::string const& base, std::string const& ref);
}
}
