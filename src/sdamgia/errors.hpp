#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include <boost/lexical_cast.hpp>

namespace sdamgia
{
	class error : public std::runtime_error
	{
	public:
		explicit error(std::string const& what)
			: std::runtime_error(what)
		{}
	};

	/// Network-level failure: resolve, connect, handshake, read or write.
	class transport_error : public error
	{
	public:
		explicit transport_error(std::string const& what)
			: error(what)
		{}
	};

	class http_status_error : public error
	{
	public:
		unsigned int const status;
		std::string const url;

		http_status_error(unsigned int _status, std::string const& _url)
			: error("HTTP status " + boost::lexical_cast<std::string>(_status) + " for " + _url)
			, status(_status)
			, url(_url)
		{}
	};

	class problem_not_found_error : public error
	{
	public:
		uint64_t const problem_id;

		explicit problem_not_found_error(uint64_t _problem_id)
			: error("Problem block not found for problem " + boost::lexical_cast<std::string>(_problem_id))
			, problem_id(_problem_id)
		{}
	};

	class missing_redirect_error : public error
	{
	public:
		explicit missing_redirect_error(std::string const& url)
			: error("No Location header in response for " + url)
		{}
	};

	/// A Location header was returned but does not carry what the endpoint promises.
	class unexpected_redirect_error : public error
	{
	public:
		explicit unexpected_redirect_error(std::string const& location)
			: error("Unexpected Location header '" + location + "'")
		{}
	};

	class recognition_unavailable_error : public error
	{
	public:
		explicit recognition_unavailable_error(std::string const& reason)
			: error("Formula recognition unavailable: " + reason)
		{}
	};
}
