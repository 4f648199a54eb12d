#include <autograder/autograder.hpp>

using namespace autograder;

// Naive Bayes estimator: each test stages a training file and a data file beside the program
AUTOGRADER_ASSIGNMENT(pa2, "PA2", "2",
                      Project{"estimate", {TestGroup{.scheme = StagedFileScheme{}, .weight = 5}}});
