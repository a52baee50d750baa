// docgraph/annotate/command_generator.hpp - Generator backed by an external command
#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "docgraph/annotate/annotation_generator.hpp"

namespace docgraph
{

/// Exit status a command uses to ask for a retry (sysexits EX_TEMPFAIL).
inline constexpr int k_transient_exit_status = 75;

/**
 * Runs `argv` once per request: the request JSON is written to the command's
 * stdin, and its stdout must be a single JSON response.
 *
 * Exit status mapping:
 *   0 with parseable JSON      -> Ok
 *   k_transient_exit_status    -> Transient
 *   timeout                    -> Transient (the process is killed)
 *   anything else              -> Terminal, with stderr in the message
 *
 * SIGPIPE is ignored process-wide once the first generator is constructed.
 */
class CommandGenerator : public AnnotationGenerator
{
public:
  explicit CommandGenerator(
    std::vector<std::string> argv,
    std::chrono::milliseconds timeout = std::chrono::milliseconds(120000));

  [[nodiscard]] GenerationResult generate(const nlohmann::json & request) override;

  [[nodiscard]] const std::vector<std::string> & argv() const noexcept { return argv_; }

private:
  std::vector<std::string> argv_;
  std::chrono::milliseconds timeout_;
};

}  // namespace docgraph
