#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace tdma::agent {

/**
 * @brief Returns the first balanced {...} substring of @p text.
 *
 * Braces inside double-quoted string literals are ignored. When an opening
 * brace never closes, scanning resumes at the next opening brace.
 */
std::optional<std::string> extractBalancedObject(const std::string& text);

/**
 * @brief Rewrites common near-JSON into strict JSON.
 *
 * - curly, full-width and single-quoted string literals become '"'-quoted
 * - full-width comma, colon and brackets become their ASCII forms
 * - bare object keys are quoted
 * - trailing commas before '}' or ']' and stray ';' are removed
 *
 * String contents are copied unchanged. A quote closes a literal only when
 * ',', ':', '}', ']' or the end of the text follows it, so apostrophes inside
 * single-quoted text stay in the string.
 */
std::string normalizeJsonText(const std::string& text);

/**
 * @brief Extracts the raw slot list from an unreliable decision-source reply.
 *
 * The first balanced object is parsed strictly and, on failure, once more
 * after normalizeJsonText(). The list is taken from "channels", then "slots",
 * then the first array holding a number or numeric string. Entries are
 * returned unconverted so the validator can coerce them.
 *
 * Returns std::nullopt when no usable structure exists. Never throws.
 */
std::optional<std::vector<nlohmann::json>> parseProposal(const std::string& text);

}  // namespace tdma::agent
