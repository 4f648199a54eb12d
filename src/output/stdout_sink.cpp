#include "output/stdout_sink.hpp"

#include <iostream>
#include <string_view>

namespace autograder {

void StdoutSink::write(std::string_view str) {
    std::cout << str;
}

void StdoutSink::flush() {
    std::cout.flush();
}

void StderrSink::write(std::string_view str) {
    std::cerr << str;
}

void StderrSink::flush() {
    std::cerr.flush();
}

} // namespace autograder
