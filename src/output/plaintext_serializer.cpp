#include "output/plaintext_serializer.hpp"

#include "common/terminal_checks.hpp"
#include "user/program_options.hpp"

#include <autograder/compare/text.hpp>
#include <autograder/exceptions.hpp>
#include <autograder/grading_session.hpp>
#include <autograder/logging.hpp>
#include <autograder/output/serializer.hpp>
#include <autograder/output/sink.hpp>
#include <autograder/output/verbosity.hpp>

#include <boost/describe/enum.hpp>
#include <boost/mp11/algorithm.hpp>
#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace autograder {

PlainTextSerializer::PlainTextSerializer(Sink& sink, Sink& status_sink, ProgramOptions::ColorizeOpt colorize_option,
                                         VerbosityLevel verbosity, bool status_bar)
    : Serializer{sink, verbosity}
    , status_sink_{status_sink}
    , do_colorize_{process_colorize_opt(colorize_option)}
    , status_bar_{status_bar} {}

void PlainTextSerializer::clear_bar() {
    if (!bar_visible_) {
        return;
    }

    status_sink_.write(fmt::format("\r{:{}}\r", "", BAR_WIDTH));
    status_sink_.flush();
    bar_visible_ = false;
}

void PlainTextSerializer::on_run_metadata(const RunMetadata& data) {
    clear_bar();

    sink_.write(fmt::format("{} Auto-grader, Release {}\n", data.assignment_name, data.release));
}

void PlainTextSerializer::on_message(std::string_view msg) {
    clear_bar();

    sink_.write(fmt::format("\n{}\n", msg));
}

void PlainTextSerializer::on_status(std::string_view status) {
    if (!status_bar_) {
        sink_.write(fmt::format("{}\n", status));
        return;
    }

    status_sink_.write(fmt::format("\r{:<{}}", status, BAR_WIDTH));
    status_sink_.flush();
    bar_visible_ = true;
}

void PlainTextSerializer::on_test_begin(std::string_view group, const RunTally& tally) {
    LOG_TRACE("Beginning test in {}", group);

    if (!status_bar_) {
        return;
    }

    std::string msg = fmt::format("Completed {} of {}. Failures {}.", tally.completed, tally.requested, tally.failures);

    if (tally.errors > 0) {
        msg += fmt::format(" Errors {}.", tally.errors);
    }

    on_status(msg);
}

std::string PlainTextSerializer::format_command(const std::vector<std::string>& command) {
    std::vector<std::string> quoted;
    quoted.reserve(command.size());

    for (const auto& arg : command) {
        quoted.push_back(quote(arg));
    }

    return fmt::format("[{}]", fmt::join(quoted, ", "));
}

void PlainTextSerializer::on_test_result(const TestResult& data) {
    std::string summary = data.summary;

    if (data.success) {
        if (!should_output_successes(verbosity_)) {
            return;
        }
        summary = "correct";
    }

    clear_bar();

    const auto header_style = data.success ? SUCCESS_STYLE : ERROR_STYLE;

    std::string out = fmt::format("\n{}\n", style_str(fmt::format("{}: {}", data.group, summary), header_style));
    out += fmt::format("   arguments {}\n", format_command(data.command));

    if (should_output_comments(verbosity_)) {
        out += "\n";
        for (const auto& line : data.comments) {
            out += fmt::format("   {}\n", line);
        }
    }

    if (should_output_input_and_output(verbosity_)) {
        if (data.input) {
            out += fmt::format("\ninput\n-----\n{}\n-----\n", *data.input);
        }

        out += "\noutput\n---\n";
        out += data.output;
        if (!data.output.empty() && data.output.back() != '\n') {
            out += '\n';
        }
        out += "---\n";
    }

    sink_.write(out);
}

void PlainTextSerializer::on_warning(std::string_view what) {
    clear_bar();

    sink_.write(fmt::format("\n{}\n", style_str(what, WARNING_STYLE)));
}

void PlainTextSerializer::on_error(std::string_view context, const GraderError& error) {
    clear_bar();

    auto lines = error.report(context);

    std::string out = "\n";
    for (std::size_t i = 0; i < lines.size(); ++i) {
        out += i == 0 ? style_str(lines[i], ERROR_STYLE) : lines[i];
        out += '\n';
    }

    sink_.write(out);
}

std::string PlainTextSerializer::format_category(Category category, const ScoreTable& scores) {
    const auto& groups = scores.groups(category);

    std::size_t width = MIN_GROUP_WIDTH;
    for (const auto& entry : groups) {
        width = std::max(width, entry.group.size());
    }

    std::string out = fmt::format("{}\n-----\n", display_name(category));
    out += fmt::format("  {:{}} Points Failed Score\n", "", width);

    for (const auto& entry : groups) {
        const std::string failed = entry.failures == 0 ? "" : fmt::format("{}", entry.failures);

        out += fmt::format("  {:<{}} {:6.1f} {:>6} {:5.1f}\n", entry.group, width, entry.points, failed, entry.score);
    }

    if (groups.size() > 1) {
        const GroupScore total = scores.total(category);

        out += fmt::format("  {:{}} ------        -----\n", "", width);
        out += fmt::format("  {:{}} {:6.1f}        {:5.1f}\n", "", width, total.points, total.score);
    }

    return out;
}

void PlainTextSerializer::on_summary(const RunSummary& data) {
    clear_bar();

    const RunTally& tally = data.tally;

    std::string out = "\n";
    out += fmt::format("Tests performed: {} of {}\n", tally.completed, tally.requested);
    out += fmt::format("Tests failed:    {}\n", tally.failures);

    if (tally.errors > 0) {
        out += fmt::format("Errors:          {}\n", tally.errors);
    }

    boost::mp11::mp_for_each<boost::describe::describe_enumerators<Category>>([&](auto descriptor) {
        if (data.scores.empty(descriptor.value)) {
            return;
        }

        out += "\n";
        out += format_category(descriptor.value, data.scores);
    });

    sink_.write(out);
}

void PlainTextSerializer::finalize() {
    clear_bar();
    sink_.flush();
}

bool PlainTextSerializer::process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option) {
    using enum ProgramOptions::ColorizeOpt;

    if (colorize_option == Never) {
        return false;
    }
    if (colorize_option == Always) {
        return true;
    }

    // Colorize if output is going to a color-supporting terminal, otherwise do not
    LOG_DEBUG("In terminal: {} & Color Supporting Terminal: {}", in_terminal(stdout), is_color_terminal());

    return in_terminal(stdout) && is_color_terminal();
}

std::string PlainTextSerializer::style_str(std::string_view str, fmt::text_style style) const {
    if (!do_colorize_) {
        return std::string{str};
    }

    return fmt::format(style, "{}", str);
}

} // namespace autograder
