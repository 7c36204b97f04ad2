#pragma once

#include "export.h"
#include <string>

namespace uldas {

/**
 * @brief Canonicalize a language identifier
 *
 * - Empty or undefined synonyms ("und", "unknown", "undefined",
 *   "undetermined") -> "und"
 * - "zxx" passes through
 * - Known 3-letter codes (ISO 639-2/B and the common /T spellings) map to
 *   their 2-letter equivalent
 * - Everything else is returned lower-cased and trimmed
 *
 * Total and idempotent.
 */
ULDAS_API std::string normalize_language_code(const std::string& code);

/**
 * @brief True for empty tags and the undefined-synonym set
 */
ULDAS_API bool is_undefined_language(const std::string& tag);

/**
 * @brief Map an English language name ("french", "Mandarin") to its
 *        ISO 639-2/B code ("fre", "chi")
 * @return Empty string if the name is unknown
 */
ULDAS_API std::string language_name_to_code(const std::string& name);

/**
 * @brief Convert a 2-letter ISO 639-1 code to ISO 639-2/B
 *
 * Region suffixes ("zh-cn", "pt_BR") are ignored. Unknown codes are
 * returned unchanged.
 */
ULDAS_API std::string iso639_1_to_2(const std::string& code);

/**
 * @brief Human readable name for a language code ("fre" -> "French")
 *
 * Accepts 2- or 3-letter codes. Unknown codes come back upper-cased.
 */
ULDAS_API std::string language_display_name(const std::string& code);

} // namespace uldas
