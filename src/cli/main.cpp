#include <iostream>
#include <string>
#include <vector>

#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>

#include <jsoncpp/json/json.h>

#include <sdamgia/client.hpp>
#include <sdamgia/errors.hpp>
#include <sdamgia/json.hpp>

namespace po = boost::program_options;

static sdamgia::test_selection parse_selection(po::variables_map const& vm)
{
	if(!vm.count("topic"))
		return sdamgia::test_selection::full(vm["full"].as<unsigned int>());

	sdamgia::test_selection::counts_t counts;
	for(std::string const& spec : vm["topic"].as<std::vector<std::string>>())
	{
		std::string::size_type eq = spec.find('=');
		if(eq == std::string::npos)
			throw po::error("--topic expects TOPIC=COUNT, got '" + spec + "'");

		counts[boost::lexical_cast<unsigned int>(spec.substr(0, eq))] = boost::lexical_cast<unsigned int>(spec.substr(eq + 1));
	}

	return sdamgia::test_selection::explicit_counts(counts);
}

static sdamgia::pdf_variant parse_variant(std::string const& v)
{
	if(v.empty())
		return sdamgia::pdf_variant::vertical;
	else if(v == "h")
		return sdamgia::pdf_variant::wide_margins;
	else if(v == "z")
		return sdamgia::pdf_variant::large_font;
	else if(v == "m")
		return sdamgia::pdf_variant::landscape;

	throw po::error("--variant must be one of '', h, z, m");
}

static std::string const& argument(std::vector<std::string> const& args, std::string const& command)
{
	if(args.empty())
		throw po::error("'" + command + "' needs an argument");

	return args.front();
}

int main(int argc, char** argv)
{
	po::options_description desc("Options");
	desc.add_options()
		("help,h", "show this help")
		("exam", po::value<std::string>()->default_value("ege"), "exam type: ege or oge")
		("subject", po::value<std::string>()->default_value("math"), "subject, e.g. math, phys, inf")
		("verbose,v", po::bool_switch(), "log requests to stderr")
		("workers", po::value<size_t>()->default_value(4), "formula recognition workers")
		("recognize", po::bool_switch(), "problem: recognise formula images into text")
		("full", po::value<unsigned int>()->default_value(1), "generate: problems per catalog topic")
		("topic", po::value<std::vector<std::string>>(), "generate: TOPIC=COUNT, repeatable")
		("solution", po::bool_switch(), "pdf: include solutions")
		("nums", po::bool_switch(), "pdf: include problem numbers")
		("answers", po::bool_switch(), "pdf: include answers")
		("key", po::bool_switch(), "pdf: include answer key")
		("crit", po::bool_switch(), "pdf: include grading criteria")
		("instruction", po::bool_switch(), "pdf: include instruction")
		("col", po::value<std::string>()->default_value(""), "pdf: footer text")
		("title", po::value<std::string>()->default_value(""), "pdf: title")
		("variant", po::value<std::string>()->default_value(""), "pdf: layout, '' h z or m");

	po::options_description hidden;
	hidden.add_options()
		("command", po::value<std::string>(), "command")
		("args", po::value<std::vector<std::string>>()->default_value(std::vector<std::string>(), ""), "arguments");

	po::options_description all;
	all.add(desc).add(hidden);

	po::positional_options_description pos;
	pos.add("command", 1).add("args", -1);

	try
	{
		po::variables_map vm;
		po::store(po::command_line_parser(argc, argv).options(all).positional(pos).run(), vm);
		po::notify(vm);

		if(vm.count("help") || !vm.count("command"))
		{
			std::cerr << "Usage: sdamgia-cli [options] {problem ID|search QUERY|test ID|theme ID|catalog|generate|pdf TEST_ID}" << std::endl
					  << desc << std::endl;
			return vm.count("help") ? 0 : 1;
		}

		sdamgia::scope s{
			sdamgia::parse_exam_type(vm["exam"].as<std::string>()),
			sdamgia::parse_subject(vm["subject"].as<std::string>())
		};

		sdamgia::client_config config;
		config.verbose = vm["verbose"].as<bool>();
		config.workers = vm["workers"].as<size_t>();

		sdamgia::client c(s, config);

		std::string const command(vm["command"].as<std::string>());
		std::vector<std::string> const args(vm["args"].as<std::vector<std::string>>());

		Json::Value result;
		if(command == "problem")
			result = sdamgia::to_json(c.get_problem(boost::lexical_cast<sdamgia::problem_id_t>(argument(args, command)), vm["recognize"].as<bool>()));
		else if(command == "search")
			result = sdamgia::to_json(c.search(argument(args, command)));
		else if(command == "test")
			result = sdamgia::to_json(c.get_test(boost::lexical_cast<sdamgia::test_id_t>(argument(args, command))));
		else if(command == "theme")
			result = sdamgia::to_json(c.get_theme(boost::lexical_cast<uint64_t>(argument(args, command))));
		else if(command == "catalog")
			result = sdamgia::to_json(c.get_catalog());
		else if(command == "generate")
			result = Json::UInt64(c.generate_test(parse_selection(vm)));
		else if(command == "pdf")
		{
			sdamgia::pdf_options options;
			options.solution = vm["solution"].as<bool>();
			options.nums = vm["nums"].as<bool>();
			options.answers = vm["answers"].as<bool>();
			options.key = vm["key"].as<bool>();
			options.crit = vm["crit"].as<bool>();
			options.instruction = vm["instruction"].as<bool>();
			options.col = vm["col"].as<std::string>();
			options.title = vm["title"].as<std::string>();
			options.variant = parse_variant(vm["variant"].as<std::string>());

			result = c.generate_pdf(boost::lexical_cast<sdamgia::test_id_t>(argument(args, command)), options);
		}
		else
			throw po::error("Unknown command '" + command + "'");

		Json::StyledWriter writer;
		std::cout << writer.write(result);
	}
	catch(po::error const& e)
	{
		std::cerr << "Error: " << e.what() << std::endl;
		return 1;
	}
	catch(boost::bad_lexical_cast const& e)
	{
		std::cerr << "Error: invalid number: " << e.what() << std::endl;
		return 1;
	}
	catch(std::exception const& e)
	{
		std::cerr << "Error: " << e.what() << std::endl;
		return 1;
	}

	return 0;
}
