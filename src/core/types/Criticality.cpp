#include "core/types/Criticality.hpp"

namespace hostkeeper::core {

std::string criticalityToString(Criticality criticality) {
    switch (criticality) {
    case Criticality::NoData:
        return "NoData";
    case Criticality::Normal:
        return "Normal";
    case Criticality::Info:
        return "Info";
    case Criticality::Warning:
        return "Warning";
    case Criticality::Error:
        return "Error";
    case Criticality::Critical:
        return "Critical";
    case Criticality::Ignore:
        return "Ignore";
    }
    return "NoData";
}

Criticality criticalityFromString(const std::string& str) {
    if (str == "Normal")
        return Criticality::Normal;
    if (str == "Info")
        return Criticality::Info;
    if (str == "Warning")
        return Criticality::Warning;
    if (str == "Error")
        return Criticality::Error;
    if (str == "Critical")
        return Criticality::Critical;
    if (str == "Ignore")
        return Criticality::Ignore;
    return Criticality::NoData;
}

int severityRank(Criticality criticality) {
    if (criticality == Criticality::Ignore) {
        return -1;
    }
    return static_cast<int>(criticality);
}

Criticality mostSevere(Criticality a, Criticality b) {
    if (a == Criticality::Ignore && b == Criticality::Ignore) {
        return Criticality::NoData;
    }
    return severityRank(a) >= severityRank(b) ? a : b;
}

} // namespace hostkeeper::core
