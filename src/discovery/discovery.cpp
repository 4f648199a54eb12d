#include <autograder/discovery/discovery.hpp>

#include <autograder/compare/fixture_file.hpp>
#include <autograder/compare/output_verifier.hpp>
#include <autograder/compare/text.hpp>
#include <autograder/discovery/test_group.hpp>
#include <autograder/exceptions.hpp>
#include <autograder/logging.hpp>
#include <autograder/test/input_delivery.hpp>
#include <autograder/test/staging.hpp>
#include <autograder/test/test_case.hpp>
#include <autograder/test/test_spec.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/sort.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

namespace autograder {

namespace {

std::string with_group_id(const std::string& prefix, const std::string& id) {
    if (id.empty()) {
        return prefix;
    }

    return fmt::format("{}{}.", prefix, id);
}

std::string program_path(const DiscoveryContext& ctx) {
    return fmt::format("./{}", ctx.program);
}

std::vector<TestCase> discover(const TranscriptScheme& scheme, const TestGroup& group,
                               const DiscoveryContext& ctx) {
    const auto test_file = ctx.data_dir / fmt::format("{}{}{}", scheme.prefix, group.id, scheme.suffix);

    if (!std::filesystem::exists(test_file)) {
        LOG_WARN("Test file not found: {}", quote(test_file.string()));
        return {};
    }

    LOG_DEBUG("Opening tests file: {}", quote(test_file.string()));
    const std::string contents = read_fixture_file(test_file, "open tests file");

    auto lines = split_lines(contents);

    // A final newline terminates the last line rather than starting another
    if (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }

    std::vector<TestCase> tests;

    // An unpaired trailing line is ignored
    for (std::size_t i = 0; i + 1 < lines.size(); i += 2) {
        std::string arg{rstrip(lines[i])};
        std::string ref{rstrip(lines[i + 1])};

        tests.emplace_back(group.report_name(ctx.project), group.weight, group.category,
                           TestSpec{{program_path(ctx), std::move(arg)}, ctx.build_dir, group.limits},
                           std::make_unique<NoInput>(), std::make_unique<LiteralLineVerifier>(std::move(ref)));
    }

    return tests;
}

std::vector<TestCase> discover(const PairedFileScheme& scheme, const TestGroup& group, const DiscoveryContext& ctx) {
    const std::string arg_prefix = with_group_id(scheme.arg_prefix, group.id);
    const std::string ref_prefix = with_group_id(scheme.ref_prefix, group.id);

    std::vector<TestCase> tests;

    for (const auto& ref_name : list_fixtures(ctx.data_dir, ref_prefix, scheme.suffix)) {
        const auto arg_name = arg_prefix + ref_name.substr(ref_prefix.size());
        const auto arg = ctx.data_dir / arg_name;

        if (!std::filesystem::exists(arg)) {
            LOG_WARN("Unmatched reference file: {}", quote(ref_name));
            continue;
        }

        std::vector<std::string> command{program_path(ctx)};
        std::unique_ptr<InputDelivery> input;

        switch (scheme.input_mode) {
        case InputMode::Argument:
            command.push_back(arg.string());
            input = std::make_unique<ArgumentFileInput>(arg);
            break;
        case InputMode::Stdin:
            input = std::make_unique<StdinFileInput>(arg);
            break;
        }

        tests.emplace_back(group.report_name(ctx.project), group.weight, group.category,
                           TestSpec{std::move(command), ctx.build_dir, group.limits}, std::move(input),
                           std::make_unique<FileLineVerifier>(ctx.data_dir / ref_name, group.limits.error_limit));
    }

    return tests;
}

std::vector<TestCase> discover(const StagedFileScheme& scheme, const TestGroup& group, const DiscoveryContext& ctx) {
    const std::string ref_prefix = with_group_id(scheme.ref_prefix, group.id);
    const std::string train_prefix = with_group_id(scheme.train_prefix, group.id);
    const std::string data_prefix = with_group_id(scheme.data_prefix, group.id);

    std::vector<TestCase> tests;

    for (const auto& ref_name : list_fixtures(ctx.data_dir, ref_prefix, scheme.suffix)) {
        const auto test_id = ref_name.substr(ref_prefix.size());

        const auto data_name = data_prefix + test_id;
        if (!std::filesystem::exists(ctx.data_dir / data_name)) {
            LOG_WARN("Missing data file {}", quote(data_name));
            continue;
        }

        const auto train_name = train_prefix + test_id;
        if (!std::filesystem::exists(ctx.data_dir / train_name)) {
            LOG_WARN("Missing training file {}", quote(train_name));
            continue;
        }

        std::vector<StagedFile> staged{
            {.source = ctx.data_dir / train_name, .name = scheme.train_name, .label = "training file: "},
            {.source = ctx.data_dir / data_name, .name = scheme.data_name, .label = "data file:     "},
        };

        tests.emplace_back(group.report_name(ctx.project), group.weight, group.category,
                           TestSpec{{program_path(ctx), scheme.train_name, scheme.data_name}, ctx.build_dir,
                                    group.limits},
                           std::make_unique<NoInput>(),
                           std::make_unique<FileLineVerifier>(ctx.data_dir / ref_name, group.limits.error_limit),
                           std::move(staged));
    }

    return tests;
}

} // namespace

std::vector<std::string> list_fixtures(const std::filesystem::path& dir, std::string_view prefix,
                                       std::string_view suffix) {
    std::error_code err;
    std::filesystem::directory_iterator iter{dir, err};

    if (err) {
        throw ConfigurationError{fmt::format("Unable to list {}: {}", quote(dir.string()), err.message())};
    }

    std::vector<std::string> names;

    for (const auto& entry : iter) {
        std::string name = entry.path().filename().string();

        if (name.size() >= prefix.size() + suffix.size() && name.starts_with(prefix) && name.ends_with(suffix)) {
            names.push_back(std::move(name));
        }
    }

    ranges::sort(names);
    return names;
}

std::vector<TestCase> discover_tests(const TestGroup& group, const DiscoveryContext& ctx) {
    auto tests = std::visit([&](const auto& scheme) { return discover(scheme, group, ctx); }, group.scheme);

    LOG_DEBUG("Group {}: {} tests", group.report_name(ctx.project), tests.size());

    return tests;
}

} // namespace autograder
