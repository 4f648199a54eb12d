#pragma once

#include "app/app.hpp"
#include "output/stdout_sink.hpp"
#include "user/program_options.hpp"

#include <autograder/output/serializer.hpp>
#include <autograder/project/assignment.hpp>
#include <autograder/registrars/global_registrar.hpp>

#include <filesystem>
#include <memory>

namespace autograder {

/// Grades a working copy (or a submitted archive) against one compiled-in assignment
class GraderApp : public App
{
public:
    explicit GraderApp(ProgramOptions opts);

    /// Directory holding the running grader executable
    static std::filesystem::path get_exe_dir();

protected:
    int run_impl() override;

private:
    RegisteredAssignment& select_assignment() const;

    /// Grade sources at `src_dir`, building in `build_dir`
    void grade(RegisteredAssignment& entry, const std::filesystem::path& src_dir,
               const std::filesystem::path& build_dir);

    /// Extract the archive to a temporary directory and grade its `src`
    void grade_archive(RegisteredAssignment& entry, const std::filesystem::path& archive);

    StdoutSink output_sink_;
    StderrSink status_sink_;
    std::shared_ptr<Serializer> serializer_;
};

} // namespace autograder
