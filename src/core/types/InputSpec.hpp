/**
 * @file InputSpec.hpp
 * @brief Description of one operator-supplied input field of a command.
 */

#pragma once

#include <string>
#include <vector>

namespace hostkeeper::core {

/**
 * @brief Input field a command asks for before it can be executed.
 */
struct InputSpec {
    std::string label;                ///< Prompt shown to the operator
    std::string defaultValue;         ///< Prefilled value
    std::string validator;            ///< ECMAScript regex the whole value must match, empty accepts all
    std::vector<std::string> choices; ///< Enumerated values, empty means free text
    std::string units;

    /**
     * @brief Checks a value against the choices and the validator pattern.
     * @return True if the value is acceptable.
     */
    [[nodiscard]] bool accepts(const std::string& value) const;

    /**
     * @brief Checks that a validator pattern compiles.
     */
    [[nodiscard]] static bool isValidPattern(const std::string& pattern);

    bool operator==(const InputSpec& other) const = default;
};

} // namespace hostkeeper::core
