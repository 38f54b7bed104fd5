#include "json.hpp"

namespace sdamgia
{

Json::Value to_json(problem_part const& part)
{
	Json::Value v(Json::objectValue);
	v["text"] = part.text;
	v["html"] = part.html;

	v["image_links"] = Json::Value(Json::arrayValue);
	for(std::string const& link : part.image_links)
		v["image_links"].append(link);

	return v;
}

Json::Value to_json(problem const& p)
{
	Json::Value v(Json::objectValue);
	v["problem_id"] = Json::UInt64(p.problem_id);
	v["exam_type"] = to_string(p.exam);
	v["subject"] = to_string(p.subj);
	v["condition"] = p.condition ? to_json(p.condition.get()) : Json::Value(Json::nullValue);
	v["solution"] = p.solution ? to_json(p.solution.get()) : Json::Value(Json::nullValue);
	v["answer"] = p.answer;
	v["topic_id"] = p.topic_id ? Json::Value(p.topic_id.get()) : Json::Value(Json::nullValue);
	v["analogs"] = to_json(p.analogs);
	return v;
}

Json::Value to_json(catalog_entry const& entry)
{
	Json::Value v(Json::objectValue);
	v["topic_id"] = entry.topic_id;
	v["topic_name"] = entry.topic_name;

	v["categories"] = Json::Value(Json::arrayValue);
	for(category const& c : entry.categories)
	{
		Json::Value cv(Json::objectValue);
		cv["category_id"] = c.category_id;
		cv["category_name"] = c.category_name;
		v["categories"].append(cv);
	}

	return v;
}

Json::Value to_json(std::vector<catalog_entry> const& catalog)
{
	Json::Value v(Json::arrayValue);
	for(catalog_entry const& entry : catalog)
		v.append(to_json(entry));
	return v;
}

Json::Value to_json(std::vector<uint64_t> const& ids)
{
	Json::Value v(Json::arrayValue);
	for(uint64_t id : ids)
		v.append(Json::UInt64(id));
	return v;
}

Json::Value to_json(std::vector<std::string> const& labels)
{
	Json::Value v(Json::arrayValue);
	for(std::string const& label : labels)
		v.append(label);
	return v;
}

}
