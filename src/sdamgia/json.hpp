#pragma once

#include <string>
#include <vector>

#include <jsoncpp/json/json.h>

#include <sdamgia/types.hpp>

namespace sdamgia
{
	Json::Value to_json(problem_part const& part);
	Json::Value to_json(problem const& p);
	Json::Value to_json(catalog_entry const& entry);
	Json::Value to_json(std::vector<catalog_entry> const& catalog);
	Json::Value to_json(std::vector<uint64_t> const& ids);
	Json::Value to_json(std::vector<std::string> const& labels);
}
