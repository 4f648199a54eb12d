#pragma once

#include "user/program_options.hpp"

#include <autograder/exceptions.hpp>
#include <autograder/grading_session.hpp>
#include <autograder/output/serializer.hpp>
#include <autograder/output/sink.hpp>
#include <autograder/output/verbosity.hpp>

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace autograder {

/// Human-readable report on `sink`, with a progress line on `status_sink`.
///
/// In bar mode the progress line is redrawn in place and erased before anything else is written.
/// Otherwise status messages are written to `sink` as ordinary lines and test progress is not shown.
class PlainTextSerializer : public Serializer
{
public:
    PlainTextSerializer(Sink& sink, Sink& status_sink, ProgramOptions::ColorizeOpt colorize_option,
                        VerbosityLevel verbosity, bool status_bar);

    void on_run_metadata(const RunMetadata& data) override;
    void on_message(std::string_view msg) override;
    void on_status(std::string_view status) override;
    void on_test_begin(std::string_view group, const RunTally& tally) override;
    void on_test_result(const TestResult& data) override;
    void on_warning(std::string_view what) override;
    void on_error(std::string_view context, const GraderError& error) override;
    void on_summary(const RunSummary& data) override;

    void finalize() override;

    /// Score table for one category, without color
    static std::string format_category(Category category, const ScoreTable& scores);

private:
    void clear_bar();

    /// Python-style list of quoted arguments
    static std::string format_command(const std::vector<std::string>& command);

    static bool process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option);

    std::string style_str(std::string_view str, fmt::text_style style) const;

    static constexpr auto ERROR_STYLE = fmt::fg(fmt::color::red) | fmt::emphasis::bold;
    static constexpr auto WARNING_STYLE = fmt::fg(fmt::color::yellow) | fmt::emphasis::bold;
    static constexpr auto SUCCESS_STYLE = fmt::fg(fmt::color::lime_green);
    static constexpr auto HEADER_STYLE = fmt::emphasis::bold;

    static constexpr std::size_t BAR_WIDTH = 80;

    /// Minimum width of the group column of a score table
    static constexpr std::size_t MIN_GROUP_WIDTH = 5;

    Sink& status_sink_;
    bool do_colorize_;
    bool status_bar_;
    bool bar_visible_ = false;
};

} // namespace autograder
