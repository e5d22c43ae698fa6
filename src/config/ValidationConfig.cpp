#include "ValidationConfig.hpp"
#include "ConfigManager.hpp"
#include "../processing/Diagnostics.hpp"
#include "../processing/IcuShiftJisOracle.hpp"
#include "../utils/ErrorReporter.hpp"

#include <limits>
#include <memory>
#include <stdexcept>
#include <utility>

#include <plog/Log.h>
#include <toml++/toml.h>

namespace
{

void loadValidationSection(ValidationConfig& cfg, const toml::table& section)
{
    if (auto converter = section["converter"].value<std::string>())
    {
        if (!converter->empty())
            cfg.converter_name = *converter;
    }

    if (auto strictness = section["strictness"].value<int64_t>())
    {
        if (*strictness < std::numeric_limits<int>::min() || *strictness > std::numeric_limits<int>::max())
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "Invalid strictness in configuration, keeping default",
                                                "validation.strictness = " + std::to_string(*strictness));
        }
        else
        {
            try
            {
                cfg.options.mode = processing::StrictnessModeFromLegacy(static_cast<int>(*strictness));
            }
            catch (const std::invalid_argument& ex)
            {
                utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                    "Invalid strictness in configuration, keeping default",
                                                    ex.what());
            }
        }
    }

    if (auto table = section["table"].value<std::string>())
    {
        if (auto variant = processing::ParseTableVariant(*table))
        {
            cfg.options.variant = *variant;
        }
        else
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "Invalid table in configuration, keeping default",
                                                "validation.table = " + *table);
        }
    }

    if (auto normalize = section["normalize"].value<bool>())
        cfg.options.normalize = *normalize;

    if (auto check_symbols = section["check_symbols"].value<bool>())
        cfg.options.check_symbols = *check_symbols;
}

void loadDiagnosticsSection(ValidationConfig& cfg, const toml::table& section)
{
    if (auto verbose = section["verbose"].value<bool>())
        cfg.verbose_diagnostics = *verbose;

    if (auto preview = section["max_preview"].value<int64_t>())
    {
        if (*preview > 0)
        {
            cfg.max_preview = static_cast<std::size_t>(*preview);
        }
        else
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "Invalid preview length in configuration, keeping default",
                                                "diagnostics.max_preview = " + std::to_string(*preview));
        }
    }
}

} // namespace

void ValidationConfig::applyValidationDefaults()
{
    converter_name = processing::kDefaultShiftJisConverter;
    options = processing::ValidationOptions{};
}

void ValidationConfig::applyDiagnosticsDefaults()
{
    verbose_diagnostics = false;
    max_preview = 80;
}

bool ValidationConfig::registerWith(ConfigManager& manager)
{
    bool ok = manager.registerTable(
        "validation",
        TableCallbacks{ [this](const toml::table& section) { loadValidationSection(*this, section); },
                        [this]() { applyValidationDefaults(); } },
        { "converter", "strictness", "table", "normalize", "check_symbols" });

    ok = manager.registerTable(
             "diagnostics",
             TableCallbacks{ [this](const toml::table& section) { loadDiagnosticsSection(*this, section); },
                             [this]() { applyDiagnosticsDefaults(); } },
             { "verbose", "max_preview" }) &&
         ok;

    return ok;
}

void ValidationConfig::applyDiagnostics() const
{
    processing::Diagnostics::SetVerbose(verbose_diagnostics);
    processing::Diagnostics::SetMaxPreview(max_preview);
    PLOG_DEBUG << "Diagnostics verbose=" << verbose_diagnostics << " max_preview=" << max_preview;
}

processing::ValidationPipeline ValidationConfig::createPipeline() const
{
    if (converter_name.empty() || converter_name == processing::kDefaultShiftJisConverter)
        return processing::ValidationPipeline(processing::DefaultShiftJisOracle(), options);

    try
    {
        std::shared_ptr<const processing::IByteOracle> oracle =
            std::make_shared<processing::IcuShiftJisOracle>(converter_name);
        PLOG_INFO << "Validation pipeline uses converter '" << converter_name << "'";
        return processing::ValidationPipeline(std::move(oracle), options);
    }
    catch (const std::runtime_error& ex)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization,
                                          "Unknown converter in configuration, using default",
                                          "validation.converter = " + converter_name + ": " + ex.what());
        return processing::ValidationPipeline(processing::DefaultShiftJisOracle(), options);
    }
}
