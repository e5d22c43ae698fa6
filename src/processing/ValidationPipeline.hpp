#pragma once

#include "IByteOracle.hpp"
#include "StrictnessMode.hpp"

#include <memory>
#include <optional>
#include <string>

namespace processing
{

struct ValidationOptions
{
    bool normalize = true;      // rewrite dash/tilde variants before checking
    bool check_symbols = true;  // run the policy deny list
    StrictnessMode mode = StrictnessMode::NoExtraAllowances;
    TableVariant variant = TableVariant::Kanji;
};

struct ValidationResult
{
    std::string text;                   // input after normalization (or unchanged)
    bool forbidden_symbol = false;      // deny list hit
    bool unencodable = false;           // classifier rejected, or could not classify
    std::optional<std::string> error;   // classifier failure reason

    [[nodiscard]] bool accepted() const noexcept { return !forbidden_symbol && !unencodable; }
};

// normalize -> deny list -> encoding classifier, each stage timed and traced.
// A classifier failure counts as a rejection, matching how callers have always
// treated it.
class ValidationPipeline
{
public:
    explicit ValidationPipeline(const IByteOracle& oracle, ValidationOptions options = {});

    // Keeps the oracle alive for the lifetime of the pipeline.
    // Throws std::invalid_argument on a null oracle.
    explicit ValidationPipeline(std::shared_ptr<const IByteOracle> oracle, ValidationOptions options = {});

    [[nodiscard]] ValidationResult validate(const std::string& input) const;

    [[nodiscard]] const ValidationOptions& options() const noexcept { return options_; }
    [[nodiscard]] const IByteOracle& oracle() const noexcept { return oracle_; }

private:
    std::shared_ptr<const IByteOracle> owned_oracle_;
    const IByteOracle& oracle_;
    ValidationOptions options_;
};

} // namespace processing
