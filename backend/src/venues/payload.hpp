#pragma once

#include <string>

#include <nlohmann/json.hpp>
#include <simdjson.h>

// Decodes one frame with simdjson on-demand into an owned JSON tree.
// Numbers keep their exact source text and are stored as strings, so no
// venue price or quantity ever passes through a double.
// Throws ProtocolError when the frame is not valid JSON.
nlohmann::json decode_frame(simdjson::ondemand::parser& parser, const std::string& frame);
