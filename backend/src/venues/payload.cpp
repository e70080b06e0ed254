#include "venues/payload.hpp"

#include <utility>

#include "venues/agent.hpp"

namespace {

[[noreturn]] void fail(const char* what, simdjson::error_code err) {
    throw ProtocolError(std::string(what) + ": " + simdjson::error_message(err));
}

std::string_view trim_token(std::string_view tok) {
    while (!tok.empty() && (tok.back() == ' ' || tok.back() == '\t' || tok.back() == '\n' || tok.back() == '\r')) {
        tok.remove_suffix(1);
    }
    return tok;
}

nlohmann::json to_payload(simdjson::ondemand::value value) {
    simdjson::ondemand::json_type type;
    if (auto err = value.type().get(type)) fail("type", err);

    switch (type) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            simdjson::ondemand::object o;
            if (auto err = value.get_object().get(o)) fail("object", err);
            for (auto field_res : o) {
                simdjson::ondemand::field field;
                if (auto err = std::move(field_res).get(field)) fail("field", err);
                std::string_view key;
                if (auto err = field.unescaped_key().get(key)) fail("key", err);
                obj[std::string(key)] = to_payload(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            simdjson::ondemand::array a;
            if (auto err = value.get_array().get(a)) fail("array", err);
            for (auto el_res : a) {
                simdjson::ondemand::value el;
                if (auto err = std::move(el_res).get(el)) fail("element", err);
                arr.push_back(to_payload(el));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::number:
            return std::string(trim_token(value.raw_json_token()));
        case simdjson::ondemand::json_type::string: {
            std::string_view s;
            if (auto err = value.get_string().get(s)) fail("string", err);
            return std::string(s);
        }
        case simdjson::ondemand::json_type::boolean: {
            bool b = false;
            if (auto err = value.get_bool().get(b)) fail("bool", err);
            return b;
        }
        case simdjson::ondemand::json_type::null:
            return nullptr;
        default:
            break;
    }
    throw ProtocolError("unsupported json value");
}

} // namespace

nlohmann::json decode_frame(simdjson::ondemand::parser& parser, const std::string& frame) {
    // Make a safely padded copy for simdjson ondemand
    simdjson::padded_string pj(frame);
    simdjson::ondemand::document doc;
    if (auto err = parser.iterate(pj).get(doc)) fail("iterate", err);
    simdjson::ondemand::value root;
    if (auto err = doc.get_value().get(root)) fail("root", err);
    return to_payload(root);
}
