#pragma once

#include <autograder/project/assignment.hpp>

#include <range/v3/algorithm/find_if.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace autograder {

/// An assignment compiled into the grader, constructed on first use
class RegisteredAssignment
{
public:
    using Factory = std::function<std::unique_ptr<Assignment>()>;

    RegisteredAssignment(std::string name, std::string release, Factory factory)
        : name_{std::move(name)}
        , release_{std::move(release)}
        , factory_{std::move(factory)} {}

    const std::string& get_name() const { return name_; }

    const std::string& get_release() const { return release_; }

    /// Throws ConfigurationError if the assignment definition is invalid
    Assignment& get() {
        if (!instance_) {
            instance_ = factory_();
        }

        return *instance_;
    }

private:
    std::string name_;
    std::string release_;
    Factory factory_;
    std::unique_ptr<Assignment> instance_;
};

/// A global singleton registrar of assignments.
///
/// Assignments are added during static initialization by `AUTOGRADER_ASSIGNMENT`, and
/// selected by name at the CLI level.
class GlobalRegistrar
{
public:
    /// Safe global singleton pattern (first intro. by Scott Meyers for C++, I think)
    static GlobalRegistrar& get() noexcept;

    void add(RegisteredAssignment assignment);

    template <typename Func>
    auto for_each_assignment(Func&& fun);

    std::optional<std::reference_wrapper<RegisteredAssignment>> get_assignment(std::string_view name) {
        auto name_matcher = [name](const RegisteredAssignment& assignment) { return assignment.get_name() == name; };

        if (auto iter = ranges::find_if(registered_assignments_, name_matcher); iter != registered_assignments_.end()) {
            return *iter;
        }

        return std::nullopt;
    }

    /// Obtain a list of all assignment names
    std::vector<std::string> get_assignment_names();

    std::size_t get_num_registered() const;

private:
    GlobalRegistrar() = default;

    std::vector<RegisteredAssignment> registered_assignments_;
};

template <typename Func>
auto GlobalRegistrar::for_each_assignment(Func&& fun) {
    using Result = std::invoke_result_t<Func, RegisteredAssignment&>;

    if constexpr (std::is_void_v<Result>) {
        for (auto& assignment : registered_assignments_) {
            fun(assignment);
        }
    } else {
        std::vector<Result> result;
        result.reserve(registered_assignments_.size());

        for (auto& assignment : registered_assignments_) {
            result.push_back(fun(assignment));
        }

        return result;
    }
}

/// Helper class that, when constructed, registers an assignment with the global registrar
class AssignmentAutoRegistrar
{
public:
    AssignmentAutoRegistrar(std::string name, std::string release, RegisteredAssignment::Factory factory) noexcept {
        GlobalRegistrar::get().add({std::move(name), std::move(release), std::move(factory)});
    }
};

} // namespace autograder

/// Register an assignment. `...` is an expression yielding a Project or MultiProject, evaluated on first use.
///
/// Example:
///   AUTOGRADER_ASSIGNMENT(pa1, "PA1", "1", Project{"roman", {TestGroup{.scheme = TranscriptScheme{}}}});
#define AUTOGRADER_ASSIGNMENT(ident, name, release, ...)                                                              \
    static const ::autograder::AssignmentAutoRegistrar ident##_autograder_registrar {                                 \
        name, release, []() -> std::unique_ptr<::autograder::Assignment> {                                             \
            return std::make_unique<std::decay_t<decltype(__VA_ARGS__)>>(__VA_ARGS__);                                 \
        }                                                                                                              \
    }
