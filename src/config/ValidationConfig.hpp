#pragma once

#include "../processing/ValidationPipeline.hpp"

#include <cstddef>
#include <string>

class ConfigManager;

// [validation] and [diagnostics] sections of config.toml
struct ValidationConfig
{
    std::string converter_name;
    processing::ValidationOptions options;
    bool verbose_diagnostics = false;
    std::size_t max_preview = 80;

    void applyDefaults()
    {
        applyValidationDefaults();
        applyDiagnosticsDefaults();
    }

    void applyValidationDefaults();
    void applyDiagnosticsDefaults();

    // Hooks this config into the manager; values are reset and refreshed on every load().
    bool registerWith(ConfigManager& manager);

    // Pushes the diagnostics settings into processing::Diagnostics.
    void applyDiagnostics() const;

    // Pipeline over converter_name with the configured options. The default
    // converter shares DefaultShiftJisOracle(); any other gets an oracle owned by
    // the pipeline. A converter ICU cannot open is reported and replaced by the default.
    [[nodiscard]] processing::ValidationPipeline createPipeline() const;
};
