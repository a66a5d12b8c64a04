#include "docqa_core/prompt/prompt_builder.hpp"

namespace docqa_core {

const char *const DEFAULT_SYSTEM_PROMPT =
    "You are a helpful, respectful, and honest assistant. Always answer as helpfully as possible, "
    "while being safe. Your answers should not include any harmful, unethical, racist, sexist, "
    "toxic, dangerous, or illegal content. Please ensure that your responses are socially "
    "unbiased and positive in nature.\n"
    "\n"
    "If a question does not make any sense, or is not factually coherent, explain why instead of "
    "answering something not correct. If you don't know the answer to a question, please don't "
    "share false information.";

const char *const RETRIEVAL_INSTRUCTION =
    "Use the following pieces of context to answer the question at the end. If you don't know "
    "the answer, just say that you don't know; don't try to make up an answer.";

std::string build_prompt(const std::string &system_prompt,
                         const std::string &context,
                         const std::string &question) {
  std::string prompt;
  prompt.reserve(system_prompt.size() + context.size() + question.size() + 256);
  prompt += "[INST] <<SYS>>\n";
  prompt += system_prompt;
  prompt += "\n<</SYS>>\n\n";
  prompt += RETRIEVAL_INSTRUCTION;
  prompt += "\n\n";
  prompt += context;
  prompt += "\n\nQuestion : ";
  prompt += question;
  prompt += " [/INST]";
  return prompt;
}

}  // namespace docqa_core
