#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory_resource>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#define ARGS_NOEXCEPT
#include "args.hxx"

#include "plume/util/ansi.hpp"
#include "plume/util/io.hpp"
#include "plume/util/result.hpp"
#include "plume/util/severity.hpp"
#include "plume/util/strings.hpp"

#include "plume/diagnostic.hpp"
#include "plume/format.hpp"
#include "plume/fwd.hpp"
#include "plume/output_accumulator.hpp"
#include "plume/output_language.hpp"
#include "plume/plume.h"
#include "plume/render.hpp"
#include "plume/services.hpp"
#include "plume/text_error.hpp"
#include "plume/value.hpp"

namespace plume {
namespace {

enum struct Action : Default_Underlying {
    render,
    escape,
};

[[nodiscard]]
std::u8string_view severity_highlight(Severity severity)
{
    const auto s = Default_Underlying(severity);
    return s <= PLUME_SEVERITY_TRACE       ? ansi::black
        : s <= PLUME_SEVERITY_DEBUG        ? ansi::h_black
        : s <= PLUME_SEVERITY_INFO         ? ansi::blue
        : s <= PLUME_SEVERITY_SOFT_WARNING ? ansi::green
        : s <= PLUME_SEVERITY_WARNING      ? ansi::h_yellow
        : s <= PLUME_SEVERITY_ERROR        ? ansi::h_red
        : s <= PLUME_SEVERITY_FATAL        ? ansi::red
                                           : ansi::magenta;
}

struct Stderr_Logger final : Logger {
    const std::u8string_view file_name;
    std::pmr::u8string out;
    bool any_errors = false;

    [[nodiscard]]
    Stderr_Logger(
        Severity min_severity,
        std::u8string_view file_name,
        std::pmr::memory_resource* memory
    )
        : Logger { min_severity }
        , file_name { file_name }
        , out { memory }
    {
    }

    void operator()(Diagnostic diagnostic) final
    {
        any_errors |= diagnostic.severity >= Severity::error;
        if (!can_log(diagnostic.severity)) {
            return;
        }

        out.append(severity_highlight(diagnostic.severity));
        out.append(severity_tag(diagnostic.severity));
        out.append(ansi::reset);
        out.append(u8": ");
        out.append(file_name);
        out.append(u8": ");
        out.append(diagnostic.message);
        out.append(ansi::h_black);
        out.append(u8" [");
        out.append(diagnostic.id);
        out.push_back(u8']');
        out.append(ansi::reset);
        out.push_back(u8'\n');
        std::fwrite(out.data(), 1, out.size(), stderr);
        out.clear();
    }
};

/// @brief Splits `-D name=value` definitions into variables.
/// Later definitions of the same name replace earlier ones.
[[nodiscard]]
bool parse_variables(
    std::vector<Template_Variable>& out,
    const std::vector<std::string>& definitions,
    Logger& logger
)
{
    bool success = true;
    for (const std::string& definition : definitions) {
        const std::u8string_view text = as_u8string_view(definition);
        const std::size_t equals = text.find(u8'=');
        if (equals == std::u8string_view::npos || equals == 0) {
            std::u8string message = u8"Variable definition \"";
            message += text;
            message += u8"\" is not of the form name=value.";
            logger(Diagnostic { Severity::error, diagnostic::variable_invalid, message });
            success = false;
            continue;
        }
        const std::u8string_view name = text.substr(0, equals);
        const std::u8string_view value = text.substr(equals + 1);

        const auto existing = std::ranges::find(out, name, [](const auto& v) -> std::u8string_view {
            return v.first;
        });
        if (existing != out.end()) {
            std::u8string message = u8"Variable \"";
            message += name;
            message += u8"\" was defined more than once; the last definition is used.";
            logger(Diagnostic { Severity::warning, diagnostic::variable_duplicate, message });
            existing->second = Value::string(value);
            continue;
        }
        out.emplace_back(std::u8string { name }, Value::string(value));
    }
    return success;
}

int main(int argc, const char* const* const argv)
{
    static const std::unordered_map<std::string, Severity> severity_arg_map {
        { "min", Severity::min },
        { "trace", Severity::trace },
        { "debug", Severity::debug },
        { "info", Severity::info },
        { "soft_warning", Severity::soft_warning },
        { "warning", Severity::warning },
        { "error", Severity::error },
        { "fatal", Severity::fatal },
        { "none", Severity::none },
    };
    static const std::unordered_map<std::string, Action> action_arg_map {
        { "render", Action::render },
        { "escape", Action::escape },
    };
    static const std::unordered_map<std::string, Format_Syntax> syntax_arg_map {
        { "percent", Format_Syntax::percent },
        { "brace", Format_Syntax::brace },
    };
    static const std::unordered_map<std::string, Output_Language> mode_arg_map {
        { "html", Output_Language::html },
        { "text", Output_Language::text },
    };

    args::ArgumentParser parser { "Renders templates with HTML escaping." };
    parser.helpParams.width = 100;
    parser.helpParams.addChoices = true;
    args::Positional<std::string> input_arg {
        parser,
        "input",
        "Input template file",
        args::Options::Required,
    };
    args::Positional<std::string> output_arg {
        parser,
        "output",
        "Output file",
        args::Options::Required,
    };
    args::MapFlag<std::string, Action> action_arg {
        parser, "action", "What to do with the input", { 'a', "action" },
        action_arg_map, Action::render,
    };
    args::MapFlag<std::string, Format_Syntax> syntax_arg {
        parser, "syntax", "Syntax of replacement fields", { 's', "syntax" },
        syntax_arg_map, Format_Syntax::percent,
    };
    args::MapFlag<std::string, Output_Language> mode_arg {
        parser, "mode", "Output language", { 'm', "mode" },
        mode_arg_map, Output_Language::html,
    };
    args::ValueFlagList<std::string> define_arg {
        parser,
        "name=value",
        "Defines a variable for substitution",
        { 'D', "define" },
    };
    args::MapFlag<std::string, Severity> severity_arg {
        parser,
        "severity",
        "Minimum (>=) severity for log messages",
        { 'l', "severity" },
        severity_arg_map,
        Severity::info,
    };
    args::HelpFlag help_arg {
        parser, "help", "Display this help menu", { 'h', "help" }, args::Options::Global
    };

    if (argc <= 1) {
        parser.Help(std::cout);
        return EXIT_FAILURE;
    }
    if (!parser.ParseCLI(argc, argv) || parser.GetError() != args::Error::None) {
        std::cerr << parser.GetErrorMsg() << '\n';
        return EXIT_FAILURE;
    }
    if (help_arg.Matched()) {
        parser.Help(std::cout);
        return EXIT_SUCCESS;
    }

    const std::string in_path = input_arg.Get();
    const std::string out_path = output_arg.Get();
    const std::u8string_view in_path_u8 = as_u8string_view(in_path);
    const std::u8string_view out_path_u8 = as_u8string_view(out_path);

    std::pmr::unsynchronized_pool_resource memory;
    Stderr_Logger logger { severity_arg.Get(), in_path_u8, &memory };

    const Result<std::pmr::vector<char8_t>, IO_Error_Code> in_text
        = load_utf8_file(in_path_u8, &memory);
    if (!in_text) {
        logger(Diagnostic { Severity::error, diagnostic::file_read,
                            io_error_message(in_text.error()) });
        return EXIT_FAILURE;
    }
    const std::u8string_view in_source = as_u8string_view(*in_text);

    std::vector<Template_Variable> variables;
    if (!parse_variables(variables, define_arg.Get(), logger)) {
        return EXIT_FAILURE;
    }

    Output_Accumulator out { action_arg.Get() == Action::escape ? Output_Language::html
                                                                : mode_arg.Get(),
                             &memory, logger };
    if (action_arg.Get() == Action::escape) {
        out.append(in_source);
    }
    else if (const Result<void, Text_Error> r
             = render_template(out, in_source, variables, syntax_arg.Get());
             !r) {
        std::u8string message = u8"Failed to render template: ";
        message += text_error_message(r.error());
        message += u8" (";
        message += text_error_id(r.error());
        message += u8')';
        logger(Diagnostic { Severity::error, diagnostic::render_failed, message });
        return EXIT_FAILURE;
    }

    const std::u8string out_text = out.get_text();
    if (const Result<void, IO_Error_Code> r = write_file(out_path_u8, out_text); !r) {
        Stderr_Logger out_logger { severity_arg.Get(), out_path_u8, &memory };
        out_logger(Diagnostic { Severity::error, diagnostic::file_write,
                                io_error_message(r.error()) });
        return EXIT_FAILURE;
    }

    return logger.any_errors ? EXIT_FAILURE : EXIT_SUCCESS;
}

} // namespace
} // namespace plume

// NOLINTNEXTLINE(bugprone-exception-escape)
int main(int argc, const char* const* argv)
{
    return plume::main(argc, argv);
}
