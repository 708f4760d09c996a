#include "hint_config.hpp"

#include "errors.hpp"

PermuteType parse_permute_type(std::string const& name) {
    if (name == "none") return PermuteType::none;
    if (name == "lower") return PermuteType::lower;
    if (name == "both") return PermuteType::both;
    if (name == "full") return PermuteType::full;
    throw ConfigurationError("Unknown permutation type: " + name);
}

std::string to_string(PermuteType permute) {
    switch (permute) {
        case PermuteType::none: return "none";
        case PermuteType::lower: return "lower";
        case PermuteType::both: return "both";
        case PermuteType::full: return "full";
    }
    return "unknown";
}
