#pragma once

#include <string>

#include "md_types.hpp"

enum class NormalizationErrorCode {
    UnknownSymbolFormat,
    MissingField,
    FeatureDisabled,
};

constexpr std::size_t kNormalizationErrorCodeCount = 3;

// Why one raw event could not become a canonical event.
// `detail` is the offending symbol, field name or kind.
struct NormalizationError {
    NormalizationErrorCode code;
    std::string detail;

    static NormalizationError unknown_symbol(std::string symbol) {
        return {NormalizationErrorCode::UnknownSymbolFormat, std::move(symbol)};
    }
    static NormalizationError missing_field(std::string field) {
        return {NormalizationErrorCode::MissingField, std::move(field)};
    }
    static NormalizationError feature_disabled(EventKind kind) {
        return {NormalizationErrorCode::FeatureDisabled, kind_name(kind)};
    }

    std::string message() const {
        switch (code) {
            case NormalizationErrorCode::UnknownSymbolFormat:
                return "unknown symbol format '" + detail + "'";
            case NormalizationErrorCode::MissingField:
                return "missing or ill-typed field '" + detail + "'";
            case NormalizationErrorCode::FeatureDisabled:
                return "feature disabled: " + detail;
        }
        return detail;
    }
};

inline const char* to_string(NormalizationErrorCode code) noexcept {
    switch (code) {
        case NormalizationErrorCode::UnknownSymbolFormat: return "unknown_symbol";
        case NormalizationErrorCode::MissingField:        return "missing_field";
        case NormalizationErrorCode::FeatureDisabled:     return "feature_disabled";
    }
    return "unknown";
}
