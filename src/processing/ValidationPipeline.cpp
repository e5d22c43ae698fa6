#include "ValidationPipeline.hpp"
#include "DashTildeNormalizer.hpp"
#include "DenyPattern.hpp"
#include "Diagnostics.hpp"
#include "EncodingClassifier.hpp"
#include "StageRunner.hpp"
#include "../utils/Profile.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>
#include <plog/Log.h>

namespace processing
{

namespace
{

template<typename T>
void logStage(const text_processing::StageResult<T>& stage)
{
    if (!Diagnostics::IsVerbose())
        return;

    std::ostringstream oss;
    oss << "[ValidationPipeline] stage=" << stage.stage_name << " duration=" << stage.duration.count() << "us";
    if (stage.succeeded)
        oss << " status=ok";
    else
        oss << " status=error reason=" << stage.error.value_or("unknown");
    PLOG_INFO_(Diagnostics::kLogInstance) << oss.str();
}

const IByteOracle& requireOracle(const std::shared_ptr<const IByteOracle>& oracle)
{
    if (!oracle)
        throw std::invalid_argument("ValidationPipeline requires a byte oracle");
    return *oracle;
}

} // anonymous namespace

ValidationPipeline::ValidationPipeline(const IByteOracle& oracle, ValidationOptions options)
    : oracle_(oracle)
    , options_(options)
{
}

ValidationPipeline::ValidationPipeline(std::shared_ptr<const IByteOracle> oracle, ValidationOptions options)
    : owned_oracle_(std::move(oracle))
    , oracle_(requireOracle(owned_oracle_))
    , options_(options)
{
}

ValidationResult ValidationPipeline::validate(const std::string& input) const
{
    PROFILE_SCOPE_CUSTOM("ValidationPipeline::validate");

    if (Diagnostics::IsVerbose())
    {
        PLOG_INFO_(Diagnostics::kLogInstance)
            << "[ValidationPipeline] input=" << Diagnostics::Preview(input) << " mode=" << ToString(options_.mode)
            << " table=" << ToString(options_.variant);
    }

    ValidationResult result;
    result.text = options_.normalize ? NormalizeDashesAndTildes(input) : input;

    if (options_.check_symbols)
    {
        auto deny_stage = run_stage<bool>("deny_list",
                                          [&]()
                                          {
                                              return ContainsForbiddenSymbol(result.text);
                                          });
        logStage(deny_stage);
        result.forbidden_symbol = deny_stage.succeeded && deny_stage.result;
    }

    auto encoding_stage = run_stage<bool>("encoding",
                                          [&]()
                                          {
                                              EncodingClassifier classifier(oracle_, RangeTablesFor(options_.variant));
                                              return classifier.isForbidden(result.text, options_.mode);
                                          });
    logStage(encoding_stage);
    if (encoding_stage.succeeded)
    {
        result.unencodable = encoding_stage.result;
    }
    else
    {
        result.unencodable = true;
        result.error = encoding_stage.error;
    }

    if (Diagnostics::IsVerbose())
    {
        PLOG_INFO_(Diagnostics::kLogInstance)
            << "[ValidationPipeline] accepted=" << (result.accepted() ? "true" : "false")
            << " forbidden_symbol=" << result.forbidden_symbol << " unencodable=" << result.unencodable;
    }
    return result;
}

} // namespace processing
