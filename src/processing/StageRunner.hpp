#pragma once

#include "TextProcessingTypes.hpp"
#include "Diagnostics.hpp"
#include "EncodingError.hpp"
#include <chrono>
#include <string>
#include <plog/Log.h>
#include <utility>
#include <exception>

#include "../utils/Profile.hpp"
#include "../utils/ErrorReporter.hpp"

namespace processing {

// Runs a stage (callable returning T) and wraps the outcome in a StageResult<T>.
// Exceptions become failed results; encoding failures are expected input
// problems and are only logged, anything else is also reported.
template<typename T, typename Fn>
text_processing::StageResult<T> run_stage(const std::string& stage_name, Fn&& fn)
{
    PROFILE_SCOPE_CUSTOM(stage_name);

    using namespace std::chrono;
    auto start = high_resolution_clock::now();
    try
    {
        T res = fn();
        auto dur = duration_cast<microseconds>(high_resolution_clock::now() - start);
        if (Diagnostics::IsVerbose()) {
            PLOG_DEBUG_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' succeeded in " << dur.count() << "us";
        }
        return text_processing::StageResult<T>::success(std::move(res), dur, stage_name);
    }
    catch (const EncodingError& ex)
    {
        auto dur = duration_cast<microseconds>(high_resolution_clock::now() - start);
        PLOG_WARNING_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' rejected input in " << dur.count()
                                                 << "us: " << ex.what();
        return text_processing::StageResult<T>::failure(ex.what(), dur, stage_name);
    }
    catch (const std::exception& ex)
    {
        auto dur = duration_cast<microseconds>(high_resolution_clock::now() - start);
        PLOG_ERROR_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' failed in " << dur.count() << "us: " << ex.what();
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Encoding,
            "Validation stage failed",
            stage_name + ": " + ex.what());
        return text_processing::StageResult<T>::failure(ex.what(), dur, stage_name);
    }
}

} // namespace processing
