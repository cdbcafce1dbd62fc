#pragma once
#include <cstddef>
#include <span>
#include <string>
#include <string_view>

#include "vsim/analysis_service.hpp"

namespace vsim {

struct HttpServiceConfig {
  // Scheme, host, optional port and path prefix; requests go to
  // <base_url>/chat/completions.
  std::string base_url{"http://127.0.0.1:8000/v1"};
  std::string model{"meta/llama-3.1-8b-instruct"};
  std::string api_key{};         // sent as a bearer token when non-empty
  float temperature{0.2f};
  int max_tokens{2048};
};

// Chat-completions request for one batch. The items travel as a JSON document
// in the user message; the model is asked to answer with one result per item.
std::string encode_batch_request(std::span<const AnalysisItem> batch, const HttpServiceConfig& cfg);

// Parses a chat-completions response body. ok is false (with error set) on a
// malformed body, a missing results array, or a result count other than
// `expected`; values are clamped into their documented ranges.
ServiceReply parse_batch_response(std::string_view body, std::size_t expected);

// External analysis over HTTP. One blocking POST per batch, bounded by the
// deadline passed to analyze().
class HttpAnalysisService final : public AnalysisService {
public:
  explicit HttpAnalysisService(HttpServiceConfig cfg);

  ServiceReply analyze(std::span<const AnalysisItem> batch, Millis deadline) override;
  std::string_view name() const noexcept override { return "http"; }

  const HttpServiceConfig& config() const noexcept { return cfg_; }

private:
  HttpServiceConfig cfg_;
  std::string origin_;   // scheme://host[:port]
  std::string path_;     // prefix + /chat/completions
};

} // namespace vsim
