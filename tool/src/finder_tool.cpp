/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <string>
#include <vector>
#include <memory>

#include <args.hxx>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/ostream_sink.h>

#include <schema_finder/schema_finder.h>
#include <schema_finder/config/finder_config.h>
#include <schema_finder/observer/console_resolution_observer.h>
#include <schema_finder/tool/finder_tool.h>

using namespace schema_finder::tool;

namespace
{
    bool override_separator(
        const args::ValueFlag<std::string>& flag, schema_finder::path_separator& separator, std::ostream& diagnostics)
    {
        if (!flag)
            return true;
        if (!schema_finder::parse_path_separator(args::get(flag), separator))
        {
            diagnostics << "unknown separator '" << args::get(flag) << "', expected '.', '/' or 'none'\n";
            return false;
        }
        return true;
    }

    int print_contents(const schema_finder::resolver& finder,
        const schema_finder::resolution& resolved,
        std::ostream& out,
        std::ostream& diagnostics)
    {
        std::string contents;
        auto err = finder.read(resolved, contents);
        if (err != schema_finder::error::OK())
        {
            diagnostics << schema_finder::error::to_string(err) << ": " << resolved.path.string() << '\n';
            return exit_failure;
        }
        try
        {
            out << nlohmann::json::parse(contents).dump(2) << '\n';
        }
        catch (const nlohmann::json::exception& e)
        {
            // not ours to validate, hand the bytes over as they are
            spdlog::warn("{} is not valid json: {}", resolved.path.string(), e.what());
            out << contents << '\n';
        }
        return exit_resolved;
    }
}

int schema_finder::tool::run(int argc, const char* const* argv, std::ostream& out, std::ostream& diagnostics)
{
    try
    {
        args::ArgumentParser args_parser("Find the schema file documenting a function or method");
        args::HelpFlag h(args_parser, "help", "help", {"help"});

        args::ValueFlag<std::string> object_arg(
            args_parser, "identifier", "dotted identifier of the documented object", {'o', "object"}, args::Options::Required);
        args::ValueFlag<std::string> schema_dir_arg(args_parser, "path", "the schema directory", {'d', "schema_dir"});
        args::ValueFlag<std::string> config_arg(args_parser, "path", "json configuration file", {'c', "config"});
        args::ValueFlag<std::string> variant_arg(
            args_parser, "name", "named schema variant inserted before the extension", {'v', "variant"});
        args::ValueFlag<int> package_depth_arg(
            args_parser, "count", "number of leading tokens forming the package", {"package_depth"});
        args::Flag method_arg(
            args_parser, "method", "with package_depth, the token before the member is a class", {"method"});
        args::Flag include_package_name_arg(
            args_parser, "include_package_name", "include the package in path candidates", {"include_package_name"});
        args::Flag exclude_path_to_file_arg(
            args_parser, "exclude_path_to_file", "skip the path context candidates", {"exclude_path_to_file"});
        args::ValueFlag<std::string> path_to_file_separator_arg(
            args_parser, "separator", "'.', '/' or 'none' between path segments", {"path_to_file_separator"});
        args::ValueFlag<std::string> path_to_class_separator_arg(
            args_parser, "separator", "'.', '/' or 'none' between class and member", {"path_to_class_separator"});
        args::ValueFlagList<std::string> patterns_arg(
            args_parser, "pattern", "custom pattern, replaces the configured ones", {'P', "pattern"});
        args::Flag list_arg(args_parser, "list", "print the candidates and exit", {'l', "list"});
        args::Flag debug_arg(args_parser, "debug", "print every probe", {'D', "debug"});
        args::Flag print_arg(args_parser, "print", "print the resolved file", {'p', "print"});
        args::Flag verbose_arg(args_parser, "verbose", "verbose library logging", {"verbose"});

        try
        {
            args_parser.ParseCLI(argc, argv);
        }
        catch (const args::Help&)
        {
            out << args_parser;
            return exit_resolved;
        }
        catch (const args::ParseError& e)
        {
            diagnostics << e.what() << std::endl;
            diagnostics << args_parser;
            return exit_failure;
        }
        catch (const args::ValidationError& e)
        {
            diagnostics << e.what() << std::endl;
            diagnostics << args_parser;
            return exit_failure;
        }

        // results go to out, library logging to stderr
        auto logger = spdlog::get("schema_finder");
        if (!logger)
            logger = spdlog::stderr_color_mt("schema_finder");
        logger->set_level(args::get(verbose_arg) ? spdlog::level::trace : spdlog::level::warn);
        spdlog::set_default_logger(logger);

        schema_finder::config::finder_config config;
        if (config_arg)
        {
            auto err = schema_finder::config::load_config(args::get(config_arg), config);
            if (err != schema_finder::error::OK())
            {
                diagnostics << "unable to load " << args::get(config_arg) << ": "
                            << schema_finder::error::to_string(err) << '\n';
                return exit_failure;
            }
        }
        if (schema_dir_arg)
            config.schema_dir = args::get(schema_dir_arg);
        if (config.schema_dir.empty() && !list_arg)
        {
            diagnostics << "no schema directory, pass --schema_dir or a configuration naming one\n";
            return exit_failure;
        }

        const auto& configured = config.policy;
        auto path_to_file_separator = configured.get_path_to_file_separator();
        auto path_to_class_separator = configured.get_path_to_class_separator();
        if (!override_separator(path_to_file_separator_arg, path_to_file_separator, diagnostics)
            || !override_separator(path_to_class_separator_arg, path_to_class_separator, diagnostics))
        {
            return exit_failure;
        }
        std::vector<std::string> patterns = configured.get_custom_patterns();
        if (patterns_arg)
            patterns = args::get(patterns_arg);

        schema_finder::search_policy policy(configured.get_include_package_name() || args::get(include_package_name_arg),
            configured.get_include_path_to_file() && !args::get(exclude_path_to_file_arg),
            path_to_file_separator,
            path_to_class_separator,
            patterns);
        auto err = policy.validate();
        if (err != schema_finder::error::OK())
        {
            diagnostics << schema_finder::error::to_string(err) << '\n';
            return exit_failure;
        }

        std::string identifier = args::get(object_arg);
        schema_finder::object_path path;
        if (package_depth_arg)
        {
            if (args::get(package_depth_arg) < 0)
            {
                diagnostics << "package_depth cannot be negative\n";
                return exit_failure;
            }
            err = schema_finder::object_path::split(
                identifier, static_cast<size_t>(args::get(package_depth_arg)), args::get(method_arg), path);
        }
        else
        {
            err = schema_finder::object_path::parse(identifier, path);
        }
        if (err != schema_finder::error::OK())
        {
            diagnostics << schema_finder::error::to_string(err) << ": '" << identifier << "'\n";
            return exit_failure;
        }

        schema_finder::generation_options options;
        if (variant_arg)
            options.requested_variant = args::get(variant_arg);

        if (list_arg)
        {
            std::vector<schema_finder::candidate> candidates;
            err = schema_finder::generate_candidates(path, policy, options, candidates);
            if (err != schema_finder::error::OK())
            {
                diagnostics << schema_finder::error::to_string(err) << '\n';
                return exit_failure;
            }
            for (auto& item : candidates)
            {
                out << item.file_name << '\n';
            }
            return exit_resolved;
        }

        std::shared_ptr<schema_finder::i_resolution_observer> observer;
        if (args::get(debug_arg) || config.debug)
        {
            // the probe trail is written with the other diagnostics
            auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(diagnostics);
            auto trail = std::make_shared<spdlog::logger>("schema_finder_trail", sink);
            trail->set_pattern("%v");
            schema_finder::console_resolution_observer::create(observer, trail);
        }

        schema_finder::resolver finder(config.schema_dir, observer);
        schema_finder::resolution resolved;
        err = finder.resolve(path, policy, options, resolved);
        if (err == schema_finder::error::NOT_FOUND())
        {
            diagnostics << "no schema for " << identifier << " in " << config.schema_dir.string() << ", tried:\n";
            for (auto& item : resolved.attempted)
            {
                diagnostics << "  " << item.file_name << '\n';
            }
            return config.fail_on_missing ? exit_missing : exit_resolved;
        }
        if (err != schema_finder::error::OK())
        {
            diagnostics << schema_finder::error::to_string(err) << " while resolving " << identifier << '\n';
            return exit_failure;
        }

        out << resolved.path.string() << '\t' << schema_finder::to_string(resolved.get_kind()) << '\n';
        if (print_arg)
            return print_contents(finder, resolved, out, diagnostics);
        return exit_resolved;
    }
    catch (const spdlog::spdlog_ex& e)
    {
        diagnostics << "logging error: " << e.what() << '\n';
        return exit_failure;
    }
}
