#include <autograder/registrars/global_registrar.hpp>

#include <autograder/logging.hpp>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace autograder {

GlobalRegistrar& GlobalRegistrar::get() noexcept {
    // thread-safe singleton initialization pattern
    static GlobalRegistrar local_instance{};

    return local_instance;
}

void GlobalRegistrar::add(RegisteredAssignment assignment) {
    registered_assignments_.push_back(std::move(assignment));
}

std::vector<std::string> GlobalRegistrar::get_assignment_names() {
    return for_each_assignment([](const RegisteredAssignment& assignment) { return assignment.get_name(); });
}

std::size_t GlobalRegistrar::get_num_registered() const {
    return registered_assignments_.size();
}

} // namespace autograder
