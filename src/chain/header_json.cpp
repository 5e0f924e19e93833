// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/header_json.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"

namespace headerchain {
namespace chain {

using json = nlohmann::json;

namespace {
// Non-negative integer regardless of whether it was parsed or built in code
std::optional<uint64_t> AsUnsigned(const json &value) {
  if (value.is_number_unsigned()) {
    return value.get<uint64_t>();
  }
  if (value.is_number_integer() && value.get<int64_t>() >= 0) {
    return static_cast<uint64_t>(value.get<int64_t>());
  }
  return std::nullopt;
}
} // namespace

json HeaderToJson(const BlockHeader &header) {
  json j;
  j["parent"] = header.hashParent.GetHex();
  j["height"] = header.nHeight;
  j["hash"] = header.GetHash().GetHex();
  return j;
}

std::optional<BlockHeader> HeaderFromJson(const json &j) {
  if (!j.is_object() || !j.contains("parent") || !j.contains("height")) {
    return std::nullopt;
  }

  const json &parent = j["parent"];
  auto height = AsUnsigned(j["height"]);
  if (!parent.is_string() || !height) {
    return std::nullopt;
  }

  auto hash = util::SafeParseHash(parent.get<std::string>());
  if (!hash) {
    return std::nullopt;
  }

  BlockHeader header;
  header.hashParent = *hash;
  header.nHeight = *height;
  return header;
}

json ChainToJson(std::span<const BlockHeader> chain) {
  json root;
  root["version"] = CHAIN_DOCUMENT_VERSION;
  root["count"] = chain.size();

  json headers = json::array();
  for (const auto &header : chain) {
    headers.push_back(HeaderToJson(header));
  }
  root["headers"] = headers;
  return root;
}

std::optional<std::vector<BlockHeader>> ParseChainDocument(const std::string &text) {
  json root;
  try {
    root = json::parse(text);
  } catch (const json::parse_error &e) {
    LOG_CHAIN_WARN("ParseChainDocument: invalid JSON: {}", e.what());
    return std::nullopt;
  }

  if (!root.is_object()) {
    LOG_CHAIN_WARN("ParseChainDocument: document is not an object");
    return std::nullopt;
  }

  if (!root.contains("version") || !root["version"].is_number_integer() ||
      root["version"].get<int64_t>() != CHAIN_DOCUMENT_VERSION) {
    LOG_CHAIN_WARN("ParseChainDocument: unsupported document version");
    return std::nullopt;
  }

  if (!root.contains("headers") || !root["headers"].is_array()) {
    LOG_CHAIN_WARN("ParseChainDocument: missing headers array");
    return std::nullopt;
  }

  const json &headers_array = root["headers"];
  std::vector<BlockHeader> headers;
  headers.reserve(headers_array.size());

  for (size_t i = 0; i < headers_array.size(); ++i) {
    auto header = HeaderFromJson(headers_array[i]);
    if (!header) {
      // One bad entry rejects the whole document
      LOG_CHAIN_WARN("ParseChainDocument: malformed header at index {}", i);
      return std::nullopt;
    }
    headers.push_back(*header);
  }

  if (root.contains("count")) {
    auto count = AsUnsigned(root["count"]);
    if (!count || *count != headers.size()) {
      LOG_CHAIN_WARN("ParseChainDocument: count does not match {} headers",
                     headers.size());
      return std::nullopt;
    }
  }

  LOG_CHAIN_DEBUG("ParseChainDocument: parsed {} headers", headers.size());
  return headers;
}

} // namespace chain
} // namespace headerchain
