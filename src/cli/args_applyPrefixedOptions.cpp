#include "cli/ParseArgsInternals.h"

#include <iostream>
#include <string>

namespace pyspect::cli::detail {
    /***
     * Name: pyspect::cli::detail::applyPrefixedOptions
     * Purpose: Parse and apply --key=value options like mode/output/color/log-path.
     */
    ArgResult applyPrefixedOptions(std::string_view arg, Options &out) {
        if (constexpr std::string_view modePrefix{"--mode="}; arg.rfind(modePrefix, 0) == 0) {
            return parseModeValue(arg.substr(modePrefix.size()), out) ? ArgResult::Handled : ArgResult::Error;
        }

        if (constexpr std::string_view outputPrefix{"--output="}; arg.rfind(outputPrefix, 0) == 0) {
            const auto value = arg.substr(outputPrefix.size());
            if (value.empty()) {
                std::cerr << "pyspect: missing value for '--output'\n";
                return ArgResult::Error;
            }
            out.outputPath = std::string(value);
            return ArgResult::Handled;
        }

        if (constexpr std::string_view logPathPrefix{"--log-path="}; arg.rfind(logPathPrefix, 0) == 0) {
            out.logPath = std::string(arg.substr(logPathPrefix.size()));
            return ArgResult::Handled;
        }

        if (constexpr std::string_view colorPrefix{"--color="}; arg.rfind(colorPrefix, 0) == 0) {
            out.color = parseColorValue(arg.substr(colorPrefix.size()));
            return ArgResult::Handled;
        }
        return ArgResult::NotHandled;
    }
} // namespace pyspect::cli::detail
