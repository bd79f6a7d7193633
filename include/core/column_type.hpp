#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace joinscout {

/**
 * @brief Coarse classification of a declared column type
 *
 * Drives truncation decisions when row data is fetched:
 * textual values are cut by characters, binary values by bytes
 * and rendered as hex, anything else passes through.
 */
enum class TypeClass : uint8_t {
    OTHER = 0,
    TEXTUAL,
    BINARY,
};

/**
 * @brief Classify a PostgreSQL type name by substring match
 *
 * "text" / "varchar" -> TEXTUAL, "bytea" -> BINARY, else OTHER.
 * information_schema reports varchar as "character varying", which
 * does not contain "varchar" and therefore classifies as OTHER.
 */
[[nodiscard]] inline TypeClass classify_type(std::string_view type_name) noexcept {
    if (type_name.find("text") != std::string_view::npos ||
        type_name.find("varchar") != std::string_view::npos) {
        return TypeClass::TEXTUAL;
    }
    if (type_name.find("bytea") != std::string_view::npos) {
        return TypeClass::BINARY;
    }
    return TypeClass::OTHER;
}

inline const char* type_class_to_string(TypeClass tc) {
    switch (tc) {
        case TypeClass::TEXTUAL: return "textual";
        case TypeClass::BINARY: return "binary";
        case TypeClass::OTHER: return "other";
        default: return "unknown";
    }
}

} // namespace joinscout
