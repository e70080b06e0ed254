#pragma once

#include <functional>
#include <optional>
#include <string>
#include <variant>

#include "canonical_event.hpp"
#include "md_types.hpp"
#include "normalization_error.hpp"
#include "symbol_codec.hpp"

// Pure transform RawEvent -> CanonicalEvent.
// Owns the symbol table and reads fields through the (venue, kind) field map.
// canonicalize() is const and deterministic: the same raw event always yields
// the same canonical event.
class Canonicalizer {
public:
    // Returns a rejection reason, or nullopt to accept the event.
    using Validator = std::function<std::optional<std::string>(const CanonicalEvent&)>;

    Canonicalizer(FeatureSet features, SymbolCodec codec)
        : features_(features), codec_(std::move(codec)) {}

    std::variant<CanonicalEvent, NormalizationError> canonicalize(const RawEvent& raw) const;

    // Set before the pipeline starts; not synchronized.
    void set_validator(Validator fn) { validator_ = std::move(fn); }
    bool has_validator() const noexcept { return static_cast<bool>(validator_); }

    // nullopt when accepted (or no validator is attached).
    std::optional<std::string> validate(const CanonicalEvent& ev) const {
        if (!validator_) return std::nullopt;
        return validator_(ev);
    }

    const FeatureSet& features() const noexcept { return features_; }
    const SymbolCodec& codec() const noexcept { return codec_; }

private:
    FeatureSet features_;
    SymbolCodec codec_;
    Validator validator_;
};
