#ifndef SPIROB_COMMON_VALIDATION_HPP
#define SPIROB_COMMON_VALIDATION_HPP

#include <string>
#include <vector>

namespace spirob {

// Outcome of checking a parameter set before it enters the pipeline
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;

    void add_warning(const std::string& msg) {
        warnings.push_back(msg);
    }

    void add_error(const std::string& msg) {
        errors.push_back(msg);
        valid = false;
    }
};

}  // namespace spirob

#endif // SPIROB_COMMON_VALIDATION_HPP
