#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include <sdamgia/request_executor.hpp>
#include <sdamgia/types.hpp>

namespace sdamgia
{
	class image_rasterizer
	{
	public:
		virtual ~image_rasterizer() {}

		virtual raster_image rasterize(std::string const& svg) = 0;
	};

	class formula_recognizer
	{
	public:
		virtual ~formula_recognizer() {}

		virtual std::string recognize(raster_image const& image) = 0;
	};

	typedef std::function<std::unique_ptr<formula_recognizer>()> recognizer_factory_t;

	/*
	 * Turns formula image urls into recognised text. Every url is fetched,
	 * rasterised and recognised as one job on a bounded worker pool; recognition
	 * itself is serialised. The recogniser is built on first use and kept, and
	 * a failure to build it is remembered.
	 */
	class formula_resolver
	{
	public:
		typedef std::map<std::string, std::string> result_t;

	private:
		request_executor& executor;
		std::shared_ptr<image_rasterizer> rasterizer;
		recognizer_factory_t factory;
		size_t workers;
		bool verbose;

		std::mutex recognizer_mutex;
		std::unique_ptr<formula_recognizer> recognizer;
		boost::optional<std::string> unavailable;

		formula_recognizer& acquire_recognizer();
		std::string resolve_one(std::string const& uri, formula_recognizer& rec);

	public:
		formula_resolver(request_executor& _executor, std::shared_ptr<image_rasterizer> _rasterizer, recognizer_factory_t _factory, size_t _workers, bool _verbose);
		formula_resolver(formula_resolver&) = delete;
		void operator=(formula_resolver&) = delete;

		result_t resolve(std::vector<std::string> const& urls);
	};
}
