#pragma once

#include "photo_triage/core/types.hpp"

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace photo_triage::escalation {

using json = nlohmann::json;

// Remote vision-language model. Returns the model's raw message content.
// Throws EscalationTimeout or EscalationUnavailable (and
// EscalationMalformedResponse when the transport envelope is unusable).
class VisionLanguageClient {
public:
  virtual ~VisionLanguageClient() = default;

  virtual std::string analyze(const std::vector<uint8_t> &image_bytes,
                              const std::string &instruction) = 0;
  virtual std::string describe() const = 0;
};

struct OllamaOptions {
  std::string endpoint = "http://localhost:11434";
  std::string model = "openbmb/minicpm-v2.6:q4_K_M";
  int timeout_seconds = 60;
};

// POST <endpoint>/api/chat via libcurl, non-streaming, JSON-schema output.
class OllamaVisionClient : public VisionLanguageClient {
public:
  explicit OllamaVisionClient(const OllamaOptions &opt);

  std::string analyze(const std::vector<uint8_t> &image_bytes,
                      const std::string &instruction) override;
  std::string describe() const override;

  std::string chat_url() const;
  json build_request(const std::string &image_base64,
                     const std::string &instruction) const;

  // message.content of a /api/chat response body.
  static std::string extract_content(const std::string &body);

private:
  OllamaOptions opt_;
};

std::string build_consolidated_instruction();
json verdict_json_schema();

// {decision: keep|reject, label: non-empty, critique: string|null|absent}.
// Throws EscalationMalformedResponse otherwise. The label is slugified.
StructuredVerdict parse_structured_verdict(const std::string &content);

struct EscalationContext {
  std::string fingerprint;
  fs::path path;
  std::vector<uint8_t> image_bytes;
  double stage1_score = 0.0;
};

struct EscalationOutcome {
  std::optional<StructuredVerdict> verdict;
  int attempts = 0;
  std::string error_kind;      // empty on success
  std::string error_message;

  bool ok() const { return verdict.has_value(); }
};

// One call plus at most one immediate retry with the identical payload.
// Stage-2 failures end up in the outcome, escalate() never throws them.
class EscalationCascade {
public:
  explicit EscalationCascade(std::shared_ptr<VisionLanguageClient> client,
                             int max_attempts = 2);

  EscalationOutcome escalate(const EscalationContext &ctx);

  const std::string &instruction() const { return instruction_; }

private:
  std::shared_ptr<VisionLanguageClient> client_;
  int max_attempts_;
  std::string instruction_;
};

} // namespace photo_triage::escalation
