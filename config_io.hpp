#pragma once
#include <string>

#include <yaml-cpp/yaml.h>

#include "config.hpp"

namespace wayfinder {

    /**
     * @brief Read an AnalyzerConfig from a YAML file.
     *
     * Every key is optional; absent keys keep their defaults. Parse errors and
     * out-of-domain values throw AnalysisError{InvalidConfig}.
     */
    AnalyzerConfig loadConfig(const std::string& path);

    /** Same as loadConfig() for an already parsed document. */
    AnalyzerConfig parseConfig(const YAML::Node& root);

    /** Throws AnalysisError{InvalidConfig} naming the first offending key. */
    void validate(const AnalyzerConfig& cfg);

} // namespace wayfinder
