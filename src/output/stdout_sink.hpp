#pragma once

#include <autograder/output/sink.hpp>

#include <string_view>

namespace autograder {

/// The report
class StdoutSink : public Sink
{
public:
    void write(std::string_view str) override;
    void flush() override;

    ~StdoutSink() override = default;
};

/// The progress line, kept out of redirected reports
class StderrSink : public Sink
{
public:
    void write(std::string_view str) override;
    void flush() override;

    ~StderrSink() override = default;
};

} // namespace autograder
