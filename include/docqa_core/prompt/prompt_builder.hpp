#pragma once

#include <string>

namespace docqa_core {

extern const char *const DEFAULT_SYSTEM_PROMPT;
extern const char *const RETRIEVAL_INSTRUCTION;

/**
 * @brief Renders the instruction template sent to the answer model.
 *
 * Plain textual substitution: system_prompt, context and question are
 * inserted as-is, so content that looks like template markup passes through
 * unchanged.
 */
std::string build_prompt(const std::string &system_prompt,
                         const std::string &context,
                         const std::string &question);

}  // namespace docqa_core
