// identifier.cpp - extract_id

#include <json_ivm/identifier.h>

namespace json_ivm {

std::optional<std::string> extract_id(const Value& doc, const std::string& key)
{
    const Value* id = doc.find(key);
    if (!id) {
        return std::nullopt;
    }
    if (auto* s = id->get_if<std::string>()) {
        return *s;
    }
    if (id->is_number()) {
        return number_to_string(*id);
    }
    return std::nullopt;
}

} // namespace json_ivm
