#include "formula_resolver.hpp"

#include <algorithm>
#include <future>
#include <iostream>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <sdamgia/errors.hpp>

namespace sdamgia
{

formula_resolver::formula_resolver(request_executor& _executor, std::shared_ptr<image_rasterizer> _rasterizer, recognizer_factory_t _factory, size_t _workers, bool _verbose)
	: executor(_executor)
	, rasterizer(std::move(_rasterizer))
	, factory(std::move(_factory))
	, workers(_workers < 1 ? 1 : _workers)
	, verbose(_verbose)
	, recognizer_mutex()
	, recognizer()
	, unavailable()
{}

formula_recognizer& formula_resolver::acquire_recognizer()
{
	std::lock_guard<std::mutex> lock(recognizer_mutex);

	if(recognizer)
		return *recognizer;

	if(unavailable)
		throw recognition_unavailable_error(unavailable.get());

	if(!rasterizer)
		unavailable = std::string("no image rasterizer configured");
	else if(!factory)
		unavailable = std::string("no recognizer backend configured");
	else
	{
		try
		{
			recognizer = factory();
			if(!recognizer)
				unavailable = std::string("recognizer backend could not be constructed");
		}
		catch(std::exception const& e)
		{
			unavailable = std::string(e.what());
		}
	}

	if(unavailable)
		throw recognition_unavailable_error(unavailable.get());

	return *recognizer;
}

std::string formula_resolver::resolve_one(std::string const& uri, formula_recognizer& rec)
{
	raster_image image(rasterizer->rasterize(executor.fetch_bytes(uri)));

	std::lock_guard<std::mutex> lock(recognizer_mutex);
	return "$" + rec.recognize(image) + "$";
}

formula_resolver::result_t formula_resolver::resolve(std::vector<std::string> const& urls)
{
	result_t result;
	if(urls.empty())
		return result;

	formula_recognizer& rec = acquire_recognizer();

	std::vector<std::future<std::string>> futures;
	futures.reserve(urls.size());

	{
		boost::asio::thread_pool pool(std::min(workers, urls.size()));

		for(auto const& uri : urls)
		{
			auto task = std::make_shared<std::packaged_task<std::string()>>([this, &uri, &rec]() {
				return resolve_one(uri, rec);
			});
			futures.push_back(task->get_future());

			boost::asio::post(pool, [task]() {
				(*task)();
			});
		}

		pool.join();
	}

	for(size_t i = 0; i < urls.size(); ++i)
		result[urls[i]] = futures[i].get();

	if(verbose)
		std::cerr << "Recognised " << result.size() << " formula images" << std::endl;

	return result;
}

}
