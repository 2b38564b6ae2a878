// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#include "network/signaling_message.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace signalhub {
namespace network {

namespace {

constexpr std::array<const char*, 5> kPeerJsRelayedTypes = {"OFFER", "ANSWER", "CANDIDATE", "LEAVE", "EXPIRE"};

constexpr size_t npos = std::string_view::npos;

// One top-level member of a JSON object, as slices of the frame text.
struct Member {
  std::string key;
  std::string_view text;  // "key":value
  std::string_view value;
};

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

size_t SkipSpace(std::string_view text, size_t pos) {
  while (pos < text.size() && IsSpace(text[pos])) {
    ++pos;
  }
  return pos;
}

// One past the closing quote of the string opening at pos.
size_t SkipString(std::string_view text, size_t pos) {
  for (++pos; pos < text.size(); ++pos) {
    if (text[pos] == '\\') {
      ++pos;
    } else if (text[pos] == '"') {
      return pos + 1;
    }
  }
  return npos;
}

// One past the end of the value starting at pos.
size_t SkipValue(std::string_view text, size_t pos) {
  if (pos >= text.size()) {
    return npos;
  }
  const char first = text[pos];
  if (first == '"') {
    return SkipString(text, pos);
  }
  if (first == '{' || first == '[') {
    int depth = 0;
    while (pos < text.size()) {
      const char c = text[pos];
      if (c == '"') {
        pos = SkipString(text, pos);
        if (pos == npos) {
          return npos;
        }
        continue;
      }
      if (c == '{' || c == '[') {
        ++depth;
      } else if ((c == '}' || c == ']') && --depth == 0) {
        return pos + 1;
      }
      ++pos;
    }
    return npos;
  }
  while (pos < text.size() && !IsSpace(text[pos]) && text[pos] != ',' && text[pos] != '}' && text[pos] != ']') {
    ++pos;
  }
  return pos;
}

// Splits a top-level object into its members. text must already be valid JSON.
std::optional<std::vector<Member>> SplitMembers(std::string_view text) {
  std::vector<Member> members;
  size_t pos = SkipSpace(text, 0);
  if (pos >= text.size() || text[pos] != '{') {
    return std::nullopt;
  }
  pos = SkipSpace(text, pos + 1);
  if (pos < text.size() && text[pos] == '}') {
    return members;
  }

  while (pos < text.size() && text[pos] == '"') {
    const size_t key_end = SkipString(text, pos);
    if (key_end == npos) {
      return std::nullopt;
    }
    // Keys may contain escapes; decode them so lookups see the real name
    const std::string_view key_text = text.substr(pos, key_end - pos);
    json key = json::parse(key_text.begin(), key_text.end(), nullptr, /*allow_exceptions=*/false);
    if (!key.is_string()) {
      return std::nullopt;
    }

    const size_t colon = SkipSpace(text, key_end);
    if (colon >= text.size() || text[colon] != ':') {
      return std::nullopt;
    }
    const size_t value_begin = SkipSpace(text, colon + 1);
    const size_t value_end = SkipValue(text, value_begin);
    if (value_end == npos) {
      return std::nullopt;
    }
    members.push_back(Member{key.get<std::string>(), text.substr(pos, value_end - pos),
                             text.substr(value_begin, value_end - value_begin)});

    pos = SkipSpace(text, value_end);
    if (pos < text.size() && text[pos] == '}') {
      return members;
    }
    if (pos >= text.size() || text[pos] != ',') {
      return std::nullopt;
    }
    pos = SkipSpace(text, pos + 1);
  }
  return std::nullopt;
}

// Last occurrence wins, as in a decoded object.
const Member* FindMember(const std::vector<Member>& members, std::string_view key) {
  const Member* found = nullptr;
  for (const auto& m : members) {
    if (m.key == key) {
      found = &m;
    }
  }
  return found;
}

std::optional<std::string> StringValue(const Member* member) {
  if (member == nullptr || member->value.empty() || member->value.front() != '"') {
    return std::nullopt;
  }
  json value = json::parse(member->value.begin(), member->value.end(), nullptr, /*allow_exceptions=*/false);
  if (!value.is_string()) {
    return std::nullopt;
  }
  return value.get<std::string>();
}

ParseResult Fail(std::string error) {
  ParseResult result;
  result.error = std::move(error);
  return result;
}

ParseResult ParseNative(const std::vector<Member>& members) {
  auto type = StringValue(FindMember(members, "type"));
  if (!type) {
    return Fail("missing 'type'");
  }

  Envelope env;
  env.type = std::move(*type);

  const Member* payload = FindMember(members, "payload");

  if (env.type == "signal") {
    auto target = StringValue(FindMember(members, "target"));
    if (!target || target->empty()) {
      return Fail("signal frame requires a 'target'");
    }
    if (payload == nullptr) {
      return Fail("signal frame requires a 'payload'");
    }
    env.kind = FrameKind::Signal;
    env.target = std::move(*target);
    env.raw = std::string(payload->value);
    return ParseResult{std::move(env), {}};
  }

  if (env.type == "control") {
    // Control payloads are addressed to the relay, so they are decoded
    json body;
    if (payload != nullptr) {
      body = json::parse(payload->value.begin(), payload->value.end(), nullptr, /*allow_exceptions=*/false);
    }
    if (!body.is_object()) {
      return Fail("control frame requires a 'payload' object");
    }
    auto action_it = body.find("action");
    if (action_it == body.end() || !action_it->is_string()) {
      return Fail("control frame requires 'payload.action'");
    }
    const auto& action = action_it->get_ref<const std::string&>();
    if (action == "heartbeat") {
      env.action = ControlAction::Heartbeat;
    } else if (action == "discover") {
      env.action = ControlAction::Discover;
    } else if (action == "leave") {
      env.action = ControlAction::Leave;
    } else {
      return Fail("unknown control action '" + action + "'");
    }
    env.kind = FrameKind::Control;
    return ParseResult{std::move(env), {}};
  }

  return Fail("unknown frame type '" + env.type + "'");
}

ParseResult ParsePeerJs(const std::vector<Member>& members) {
  auto type = StringValue(FindMember(members, "type"));
  if (!type) {
    return Fail("missing 'type'");
  }

  Envelope env;
  env.type = std::move(*type);

  if (env.type == "HEARTBEAT") {
    env.kind = FrameKind::Control;
    env.action = ControlAction::Heartbeat;
    return ParseResult{std::move(env), {}};
  }

  bool relayed = false;
  for (const char* t : kPeerJsRelayedTypes) {
    if (env.type == t) {
      relayed = true;
      break;
    }
  }
  if (!relayed) {
    return Fail("unsupported message type '" + env.type + "'");
  }

  auto dst = StringValue(FindMember(members, "dst"));
  if (!dst || dst->empty()) {
    return Fail(env.type + " requires a 'dst'");
  }
  env.kind = FrameKind::Signal;
  env.target = std::move(*dst);

  // The relay stamps src itself; a client-supplied one is dropped
  for (const auto& m : members) {
    if (m.key == "src") {
      continue;
    }
    if (!env.raw.empty()) {
      env.raw += ',';
    }
    env.raw.append(m.text);
  }
  return ParseResult{std::move(env), {}};
}

json ControlFrame(json payload) {
  return json{{"type", "control"}, {"payload", std::move(payload)}};
}

}  // namespace

ParseResult ParseFrame(std::string_view text, Dialect dialect) {
  if (!json::accept(text.begin(), text.end())) {
    return Fail("invalid JSON");
  }
  auto members = SplitMembers(text);
  if (!members) {
    return Fail("frame must be a JSON object");
  }
  return dialect == Dialect::PeerJs ? ParsePeerJs(*members) : ParseNative(*members);
}

const char* SignalErrorCode(SignalError error) {
  switch (error) {
  case SignalError::DuplicateIdentity:
    return "duplicate-identity";
  case SignalError::InvalidId:
    return "invalid-id";
  case SignalError::ServerFull:
    return "server-full";
  case SignalError::MalformedFrame:
    return "malformed-frame";
  case SignalError::DiscoveryDisabled:
    return "discovery-disabled";
  case SignalError::InvalidKey:
    return "invalid-key";
  }
  return "unknown";
}

namespace frames {

std::string Open(Dialect dialect, const PeerId& id) {
  if (dialect == Dialect::PeerJs) {
    return json{{"type", "OPEN"}}.dump();
  }
  return ControlFrame({{"event", "open"}, {"id", id}}).dump();
}

std::string Relayed(Dialect dialect, const PeerId& source, const Envelope& envelope) {
  const std::string quoted_source = json(source).dump();
  if (dialect == Dialect::PeerJs) {
    return "{\"src\":" + quoted_source + "," + envelope.raw + "}";
  }
  return "{\"type\":\"signal\",\"source\":" + quoted_source + ",\"payload\":" + envelope.raw + "}";
}

std::string PeerUnavailable(Dialect dialect, const PeerId& source, const PeerId& target) {
  if (dialect == Dialect::PeerJs) {
    // peerjs-server's expiry notice: src is the unreachable peer.
    return json{{"type", "EXPIRE"}, {"src", target}, {"dst", source}}.dump();
  }
  return ControlFrame({{"event", "peer-unavailable"}, {"target", target}}).dump();
}

std::string Error(Dialect dialect, SignalError error, std::string_view message) {
  if (dialect == Dialect::PeerJs) {
    if (error == SignalError::DuplicateIdentity) {
      return json{{"type", "ID-TAKEN"}, {"payload", {{"msg", "ID is taken"}}}}.dump();
    }
    return json{{"type", "ERROR"}, {"payload", {{"msg", std::string(message)}}}}.dump();
  }
  return ControlFrame({{"event", "error"}, {"code", SignalErrorCode(error)}, {"message", std::string(message)}})
      .dump();
}

std::string PeerList(const std::vector<PeerId>& ids) {
  return ControlFrame({{"event", "peers"}, {"count", ids.size()}, {"ids", ids}}).dump();
}

}  // namespace frames

}  // namespace network
}  // namespace signalhub
