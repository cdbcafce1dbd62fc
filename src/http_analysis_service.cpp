#include "vsim/http_analysis_service.hpp"

#include <cmath>
#include <ctime>
#include <utility>

#include <nlohmann/json.hpp>

#include "httplib.h"

#include "vsim/invariants.hpp"

namespace vsim {

using json = nlohmann::json;

namespace {

constexpr const char* kSystemPrompt =
  "You analyse voters for a political simulation. The user message is a JSON object "
  "with an \"items\" array. Reply with only a JSON object {\"results\": [...]} holding "
  "one entry per item, in the same order, each with \"target_axes\" (four numbers in "
  "[-100, 100]: economic, social, immigration, environmental), \"confidence\", "
  "\"engagement\" and \"salience\" (numbers in [0, 1]).";

json features_json(const FeatureSnapshot& f) {
  return json{
    {"age", f.age},
    {"education", f.education},
    {"income", f.income},
    {"urban", f.urban},
    {"axes", {f.axes[0], f.axes[1], f.axes[2], f.axes[3]}},
    {"confidence", f.confidence},
    {"volatility", f.volatility},
    {"satisfaction", f.satisfaction},
  };
}

float number_or(const json& j, const char* key, float def) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number()) return def;
  const float v = it->get<float>();
  return std::isfinite(v) ? v : def;
}

ServiceReply failed(std::string msg) {
  ServiceReply r;
  r.error = std::move(msg);
  return r;
}

} // namespace

std::string encode_batch_request(std::span<const AnalysisItem> batch, const HttpServiceConfig& cfg) {
  json items = json::array();
  for (const auto& it : batch) {
    items.push_back(json{
      {"kind", std::string(to_string(it.kind))},
      {"features", features_json(it.features)},
    });
  }
  const json user{{"items", std::move(items)}};

  const json req{
    {"model", cfg.model},
    {"temperature", cfg.temperature},
    {"max_tokens", cfg.max_tokens},
    {"messages", json::array({
      json{{"role", "system"}, {"content", kSystemPrompt}},
      json{{"role", "user"}, {"content", user.dump()}},
    })},
  };
  return req.dump();
}

ServiceReply parse_batch_response(std::string_view body, std::size_t expected) {
  json content;
  try {
    const json outer = json::parse(body);
    const json& choices = outer.at("choices");
    if (!choices.is_array() || choices.empty()) return failed("response has no choices");
    const json& text = choices.at(0).at("message").at("content");
    if (!text.is_string()) return failed("message content is not a string");
    content = json::parse(text.get<std::string>());
  } catch (const json::exception& e) {
    return failed(std::string("malformed response: ") + e.what());
  }

  auto results = content.find("results");
  if (results == content.end() || !results->is_array()) return failed("missing results array");
  if (results->size() != expected) {
    return failed("expected " + std::to_string(expected) + " results, got " + std::to_string(results->size()));
  }

  ServiceReply reply;
  reply.results.reserve(expected);
  for (const auto& r : *results) {
    if (!r.is_object()) return failed("result is not an object");
    auto axes = r.find("target_axes");
    if (axes == r.end() || !axes->is_array() || axes->size() != kAxisCount) {
      return failed("result without four target axes");
    }
    AnalysisResult out{};
    for (std::size_t i = 0; i < kAxisCount; ++i) {
      const json& v = (*axes)[i];
      if (!v.is_number()) return failed("non-numeric axis value");
      const float f = v.get<float>();
      if (!std::isfinite(f)) return failed("non-finite axis value");
      out.target_axes[i] = clamp_axis(f);
    }
    out.confidence = clamp_unit(number_or(r, "confidence", 0.5f));
    out.engagement = clamp_unit(number_or(r, "engagement", 0.5f));
    out.salience = clamp_unit(number_or(r, "salience", 0.0f));
    reply.results.push_back(out);
  }
  reply.ok = true;
  return reply;
}

HttpAnalysisService::HttpAnalysisService(HttpServiceConfig cfg) : cfg_(std::move(cfg)) {
  const auto scheme = cfg_.base_url.find("://");
  const auto host_begin = scheme == std::string::npos ? 0 : scheme + 3;
  const auto slash = cfg_.base_url.find('/', host_begin);
  if (slash == std::string::npos) {
    origin_ = cfg_.base_url;
    path_.clear();
  } else {
    origin_ = cfg_.base_url.substr(0, slash);
    path_ = cfg_.base_url.substr(slash);
  }
  while (!path_.empty() && path_.back() == '/') path_.pop_back();
  path_ += "/chat/completions";
}

ServiceReply HttpAnalysisService::analyze(std::span<const AnalysisItem> batch, Millis deadline) {
  if (batch.empty()) {
    ServiceReply r;
    r.ok = true;
    return r;
  }

  httplib::Client cli(origin_);
  const auto ms = deadline.count() > 0 ? deadline.count() : 1;
  const auto sec = static_cast<time_t>(ms / 1000);
  const auto usec = static_cast<time_t>((ms % 1000) * 1000);
  cli.set_connection_timeout(sec, usec);
  cli.set_read_timeout(sec, usec);
  cli.set_write_timeout(sec, usec);
  if (!cfg_.api_key.empty()) cli.set_bearer_token_auth(cfg_.api_key);

  const std::string body = encode_batch_request(batch, cfg_);
  auto res = cli.Post(path_, body, "application/json");
  if (!res) return failed("request failed: " + httplib::to_string(res.error()));
  if (res->status != 200) return failed("http status " + std::to_string(res->status));

  return parse_batch_response(res->body, batch.size());
}

} // namespace vsim
