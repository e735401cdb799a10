#pragma once

#include <functional>
#include <string>

namespace rag_core {

struct GenerationOptions {
  float temperature = 0.7f;
  int max_tokens = 1000;
};

// Receives each generated fragment. Returning false cancels the generation.
using FragmentCallback = std::function<bool(const std::string&)>;

class TextGenerator {
 public:
  virtual ~TextGenerator() = default;

  /**
   * @brief Streams the completion of a prompt fragment by fragment.
   * @return false if the callback cancelled the stream, true if it ran to completion.
   * @throw GenerationError if the backend fails.
   */
  virtual bool generate_stream(const std::string& prompt,
                               const GenerationOptions& options,
                               const FragmentCallback& on_fragment) = 0;
};

}  // namespace rag_core
