#pragma once

#include <string>
#include <unordered_map>

#include "md_types.hpp"

// Canonical field key -> dotted source path in the venue payload ("k.o").
// Keys absent from a map (or kinds with no map) are read under their canonical name.
using FieldMap = std::unordered_map<std::string, std::string>;

// nullptr when (venue, kind) has no mapping entry.
const FieldMap *find_field_map(Venue venue, EventKind kind);
