#pragma once

#include <string>

namespace sdamgia
{
	/// Transport seam. Implementations throw transport_error for network failures
	/// and hand every HTTP status back to the caller.
	class downloader
	{
	public:
		struct response
		{
			unsigned int status;
			std::string body;
			std::string location;
		};

		virtual ~downloader() {}

		virtual response get(std::string const& url, bool follow_redirects = true) = 0;
	};
}
