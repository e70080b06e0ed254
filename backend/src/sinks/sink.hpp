#pragma once

#include <string>

#include "analytics/spread_event.hpp"
#include "md/canonical_event.hpp"

// Output destination for canonical and spread events.
// send() returns false (or throws) on failure; the dispatcher logs and counts
// it and keeps going. Each sink is driven by a single dispatcher worker.
class ISink {
public:
    virtual ~ISink() = default;
    virtual const std::string& name() const = 0;
    virtual bool send(const CanonicalEvent& ev) = 0;
    virtual bool send(const SpreadEvent& ev) = 0;
};
