#include "core/types/InputSpec.hpp"

#include <algorithm>
#include <regex>

namespace hostkeeper::core {

bool InputSpec::accepts(const std::string& value) const {
    if (!choices.empty() && std::find(choices.begin(), choices.end(), value) == choices.end()) {
        return false;
    }
    if (validator.empty()) {
        return true;
    }
    try {
        return std::regex_match(value, std::regex(validator));
    } catch (const std::regex_error&) {
        return false;
    }
}

bool InputSpec::isValidPattern(const std::string& pattern) {
    try {
        std::regex compiled(pattern);
        return true;
    } catch (const std::regex_error&) {
        return false;
    }
}

} // namespace hostkeeper::core
