#include <iostream>

#include <boost/program_options.hpp>

#include <patchwork/config.hpp>
#include <patchwork/core.hpp>
#include <patchwork/encodings/json.hpp>
#include <patchwork/fs/file_io.hpp>

using namespace patchwork;

// Compare two JSON documents and print the patch that transforms the first
// into the second.
//
// The exit code is 0 if the documents are equal, 1 if they differ, and 2 if
// something goes wrong.
int
main(int argc, char const* const* argv)
{
    namespace po = boost::program_options;

    po::options_description desc("Supported options");
    desc.add_options()
        ("help", "show help message")
        ("config-file", po::value<string>(), "specify the configuration file to use")
        ("encoding", po::value<string>(), "encoding for values in the patch (json or msgpack)")
        ("log-level", po::value<string>(), "logging level (e.g., debug, info, warning)")
    ;

    po::options_description hidden;
    hidden.add_options()
        ("old", po::value<string>(), "original JSON file")
        ("new", po::value<string>(), "updated JSON file")
    ;

    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description positional;
    positional.add("old", 1).add("new", 1);

    try
    {
        po::variables_map vm;
        po::store(
            po::command_line_parser(argc, argv)
                .options(all)
                .positional(positional)
                .run(),
            vm);
        po::notify(vm);

        if (vm.count("help"))
        {
            std::cout << "usage: patchwork-diff [options] OLD.json NEW.json\n";
            std::cout << desc;
            return 0;
        }

        if (!vm.count("old") || !vm.count("new"))
        {
            std::cerr << "patchwork-diff: two JSON files are required\n";
            std::cerr << desc;
            return 2;
        }

        patchwork_config config;
        if (vm.count("config-file"))
            config = read_config_file(vm["config-file"].as<string>());
        if (vm.count("encoding"))
            config.encoding = vm["encoding"].as<string>();
        if (vm.count("log-level"))
            config.log_level = vm["log-level"].as<string>();
        apply_config(config);

        auto old_value = parse_json_value(
            read_file_contents(vm["old"].as<string>()));
        auto new_value = parse_json_value(
            read_file_contents(vm["new"].as<string>()));

        auto p = diff(old_value, new_value);
        std::cout << p << "\n";
        return p.empty() ? 0 : 1;
    }
    catch (po::error& e)
    {
        std::cerr << "patchwork-diff: " << e.what() << "\n";
        return 2;
    }
    catch (std::exception& e)
    {
        get_logger()->error(e.what());
        return 2;
    }
}
