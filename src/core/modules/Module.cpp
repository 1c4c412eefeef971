#include "core/modules/Module.hpp"

#include "core/types/Errors.hpp"

#include <algorithm>
#include <sstream>

namespace hostkeeper::core {

std::string displayStyleToString(DisplayStyle style) {
    switch (style) {
    case DisplayStyle::Text:
        return "Text";
    case DisplayStyle::CriticalityLevel:
        return "CriticalityLevel";
    case DisplayStyle::Icon:
        return "Icon";
    case DisplayStyle::ProgressBar:
        return "ProgressBar";
    }
    return "Text";
}

bool DisplayOptions::acceptsTags(const std::vector<std::string>& tags) const {
    auto hasTag = [&tags](const std::string& tag) {
        return std::find(tags.begin(), tags.end(), tag) != tags.end();
    };
    if (!dependsOnTags.empty() && std::none_of(dependsOnTags.begin(), dependsOnTags.end(), hasTag)) {
        return false;
    }
    return std::none_of(dependsOnNoTags.begin(), dependsOnNoTags.end(), hasTag);
}

ModuleCapabilities ModuleDescriptor::capabilities() const {
    ModuleCapabilities caps;
    caps.requiresConfirmation = !confirmationText.empty();
    caps.requiresInput = !inputs.empty();
    return caps;
}

bool ModuleContext::useSudo() const {
    return std::find(hostSettings.begin(), hostSettings.end(), "use_sudo") != hostSettings.end();
}

std::string ModuleContext::param(size_t index, const std::string& fallback) const {
    return index < params.size() ? params[index] : fallback;
}

double ModuleContext::numericSetting(const std::string& key, double fallback) const {
    auto value = config.setting(key);
    if (value.empty()) {
        return fallback;
    }
    try {
        size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw ValidationError("Setting " + key + " is not a number: " + value);
        }
        return parsed;
    } catch (const std::invalid_argument&) {
        throw ValidationError("Setting " + key + " is not a number: " + value);
    } catch (const std::out_of_range&) {
        throw ValidationError("Setting " + key + " is out of range: " + value);
    }
}

Module::Module(ModuleDescriptor descriptor) : descriptor_(std::move(descriptor)) {}

bool Module::appliesTo(const HostFacts& facts) const {
    if (!facts.isKnown()) {
        return true;
    }
    if (!facts.isLinux()) {
        return false;
    }
    if (descriptor_.requiredSubsystems.empty()) {
        return true;
    }
    return std::any_of(descriptor_.requiredSubsystems.begin(), descriptor_.requiredSubsystems.end(),
                       [&facts](const std::string& subsystem) { return facts.hasSubsystem(subsystem); });
}

std::optional<HostFacts> MonitorModule::discoverFacts(const ExecutionOutput& /*output*/) const {
    return std::nullopt;
}

CommandResult CommandModule::parse(const ExecutionOutput& output, const ModuleContext& /*context*/) const {
    return CommandResult::success(trimmed(output.stdoutText));
}

std::vector<InputSpec> CommandModule::effectiveInputs(const ModuleConfig& config) const {
    auto inputs = descriptor_.inputs;
    auto validator = config.setting("validator");
    if (!inputs.empty() && !validator.empty()) {
        inputs.front().validator = validator;
    }
    return inputs;
}

size_t CommandModule::validateInput(const std::vector<std::string>& params,
                                    const ModuleConfig& config) const {
    const auto inputs = effectiveInputs(config);
    const size_t offset = descriptor_.inputOffset;

    size_t missing = 0;
    for (size_t i = 0; i < inputs.size(); ++i) {
        const size_t index = offset + i;
        if (index >= params.size()) {
            ++missing;
            continue;
        }
        if (!inputs[i].accepts(params[index])) {
            throw ValidationError("Invalid value for \"" + inputs[i].label + "\": " + params[index]);
        }
    }
    return missing;
}

std::string trimmed(const std::string& text) {
    const auto* whitespace = " \t\r\n";
    auto start = text.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return {};
    }
    auto end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

std::vector<std::string> splitFields(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream stream(line);
    std::string field;
    while (stream >> field) {
        fields.push_back(field);
    }
    return fields;
}

} // namespace hostkeeper::core
