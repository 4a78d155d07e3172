#include "io.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <initializer_list>
#include <iostream>
#include <limits>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "router.hpp"

namespace {
std::atomic<bool> g_log_enabled{true};

const char* kNumber = R"(([-+]?\d*\.?\d+(?:[eE][-+]?\d+)?))";

std::string key_prefix(const std::string& key) { return "\\\"" + key + "\\\"\\s*:\\s*"; }

void append_utf8(std::string& out, unsigned cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

bool read_hex4(const std::string& s, size_t pos, unsigned& cp) {
  if (pos + 4 > s.size()) return false;
  cp = 0;
  for (size_t k = pos; k < pos + 4; ++k) {
    const char c = s[k];
    cp <<= 4;
    if (c >= '0' && c <= '9') {
      cp |= static_cast<unsigned>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      cp |= static_cast<unsigned>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      cp |= static_cast<unsigned>(c - 'A' + 10);
    } else {
      return false;
    }
  }
  return true;
}

std::string unescape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] != '\\' || i + 1 == s.size()) {
      out += s[i];
      continue;
    }
    const char c = s[++i];
    switch (c) {
      case 'n':
        out += '\n';
        break;
      case 't':
        out += '\t';
        break;
      case 'r':
        out += '\r';
        break;
      case 'b':
        out += '\b';
        break;
      case 'f':
        out += '\f';
        break;
      case 'u': {
        unsigned cp = 0;
        if (!read_hex4(s, i + 1, cp)) {
          out += c;
          break;
        }
        i += 4;
        unsigned low = 0;
        // surrogate pair
        if (cp >= 0xD800 && cp <= 0xDBFF && i + 2 < s.size() && s[i + 1] == '\\' && s[i + 2] == 'u' &&
            read_hex4(s, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
          i += 6;
          const unsigned full = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
          out += static_cast<char>(0xF0 | (full >> 18));
          out += static_cast<char>(0x80 | ((full >> 12) & 0x3F));
          out += static_cast<char>(0x80 | ((full >> 6) & 0x3F));
          out += static_cast<char>(0x80 | (full & 0x3F));
        } else {
          append_utf8(out, cp);
        }
        break;
      }
      default:
        out += c;
    }
  }
  return out;
}

std::string escape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  for (const char c : s) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\t':
        out += "\\t";
        break;
      case '\r':
        out += "\\r";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out += c;
        }
    }
  }
  return out;
}

std::string quoted_or_null(const std::optional<std::string>& s) {
  return s ? "\"" + escape(*s) + "\"" : "null";
}

// Top-level {...} spans; braces inside string values do not count.
std::vector<std::string> split_objects(const std::string& json) {
  std::vector<std::string> objects;
  int depth = 0;
  bool in_string = false;
  bool escaped = false;
  size_t start = 0;
  for (size_t i = 0; i < json.size(); ++i) {
    const char c = json[i];
    if (in_string) {
      if (escaped) {
        escaped = false;
      } else if (c == '\\') {
        escaped = true;
      } else if (c == '"') {
        in_string = false;
      }
      continue;
    }
    if (c == '"') {
      in_string = true;
    } else if (c == '{') {
      if (depth++ == 0) start = i;
    } else if (c == '}' && depth > 0) {
      if (--depth == 0) objects.push_back(json.substr(start, i - start + 1));
    }
  }
  return objects;
}

bool is_demand_type(const std::string& message_type) {
  return message_type == "supply_request" || message_type == "sos";
}

template <typename T>
std::optional<T> integral_in_range(double v) {
  // -min is 2^N exactly, so the upper bound is exclusive
  const double lo = static_cast<double>(std::numeric_limits<T>::min());
  if (!std::isfinite(v) || v < lo || v >= -lo) {
    return std::nullopt;
  }
  return static_cast<T>(v);
}

std::string trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return "";
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

bool contains_any(const std::string& upper, std::initializer_list<const char*> words) {
  for (const char* w : words) {
    if (upper.find(w) != std::string::npos) return true;
  }
  return false;
}
}

std::string read_text_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

std::optional<std::string> json_find_string(const std::string& json, const std::string& key) {
  std::regex re(key_prefix(key) + R"(\"((?:[^\"\\]|\\.)*)\")");
  std::smatch m;
  if (std::regex_search(json, m, re)) return unescape(m[1].str());
  return std::nullopt;
}

std::optional<double> json_find_number(const std::string& json, const std::string& key) {
  std::regex re(key_prefix(key) + kNumber);
  std::smatch m;
  // strtod saturates to +-HUGE_VAL instead of throwing on overflow
  if (std::regex_search(json, m, re)) return std::strtod(m[1].str().c_str(), nullptr);
  return std::nullopt;
}

std::string json_get_string(const std::string& json, const std::string& key, const std::string& default_value) {
  return json_find_string(json, key).value_or(default_value);
}

int json_get_int(const std::string& json, const std::string& key, int default_value) {
  const auto v = json_find_number(json, key);
  if (!v) return default_value;
  const auto i = integral_in_range<int>(*v);
  if (!i) throw std::runtime_error("Value of \"" + key + "\" is out of range");
  return *i;
}

double json_get_double(const std::string& json, const std::string& key, double default_value) {
  return json_find_number(json, key).value_or(default_value);
}

std::string json_get_topic(const std::string& json, const std::string& topic_key, const std::string& default_value) {
  // crude nested lookup: "topics": { "messages": "..." }
  std::regex re("\\\"topics\\\"\\s*:\\s*\\{[^}]*\\\"" + topic_key + "\\\"\\s*:\\s*\\\"([^\\\"]+)\\\"");
  std::smatch m;
  if (std::regex_search(json, m, re)) return m[1].str();
  return default_value;
}

bool is_known_message_type(const std::string& message_type) {
  return message_type == "sos" || message_type == "supply_request" || message_type == "status_update" ||
         message_type == "broadcast";
}

std::optional<std::string> message_problem(const MeshMessage& msg) {
  if (msg.node_id.empty()) return std::string("empty node_id");
  if (!is_known_message_type(msg.message_type)) return "unknown message_type " + msg.message_type;
  if (msg.urgency < 1 || msg.urgency > 3) return "urgency " + std::to_string(msg.urgency) + " outside 1..3";
  if (msg.lat && (*msg.lat < -90.0 || *msg.lat > 90.0)) return std::string("lat outside [-90, 90]");
  if (msg.lon && (*msg.lon < -180.0 || *msg.lon > 180.0)) return std::string("lon outside [-180, 180]");
  if (msg.payload.size() > kMaxPayloadBytes) {
    return "payload of " + std::to_string(msg.payload.size()) + " bytes exceeds " + std::to_string(kMaxPayloadBytes);
  }
  return std::nullopt;
}

std::optional<MeshMessage> parse_message_json(const std::string& json) {
  const auto node_id = json_find_string(json, "node_id");
  const auto timestamp = json_find_number(json, "timestamp");
  const auto message_type = json_find_string(json, "message_type");
  const auto urgency = json_find_number(json, "urgency");
  if (!node_id || !timestamp || !message_type || !urgency) {
    log_line("io", "rejecting message: missing required field");
    return std::nullopt;
  }

  const auto ts = integral_in_range<long long>(*timestamp);
  const auto urg = integral_in_range<int>(*urgency);
  const auto id = integral_in_range<long long>(json_find_number(json, "id").value_or(0.0));
  if (!ts || !urg || !id) {
    log_line("io", "rejecting message from " + *node_id + ": integer field out of range");
    return std::nullopt;
  }

  MeshMessage msg;
  msg.id = *id;
  msg.node_id = *node_id;
  msg.timestamp = *ts;
  msg.message_type = *message_type;
  msg.urgency = *urg;
  msg.lat = json_find_number(json, "lat");
  msg.lon = json_find_number(json, "lon");
  msg.resource_type = json_find_string(json, "resource_type");
  if (const auto qty = json_find_number(json, "quantity")) {
    const auto q = integral_in_range<int>(*qty);
    if (!q) {
      log_line("io", "rejecting message from " + msg.node_id + ": quantity out of range");
      return std::nullopt;
    }
    msg.quantity = *q;
  }
  msg.payload = json_get_string(json, "payload", "");

  if (const auto problem = message_problem(msg)) {
    log_line("io", "rejecting message from " + msg.node_id + ": " + *problem);
    return std::nullopt;
  }
  return msg;
}

std::string truncate_utf8(const std::string& s, size_t max_bytes) {
  if (s.size() <= max_bytes) return s;
  size_t n = max_bytes;
  // back off to the first byte of the character straddling the limit
  while (n > 0 && (static_cast<unsigned char>(s[n]) & 0xC0) == 0x80) --n;
  return s.substr(0, n);
}

MeshMessage classify_text_message(const std::string& node_id, long long timestamp, const std::string& text) {
  std::string upper = text;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  MeshMessage msg;
  msg.node_id = node_id;
  msg.timestamp = timestamp;
  if (contains_any(upper, {"SOS", "HELP", "EMERGENCY"})) {
    msg.message_type = "sos";
    msg.urgency = 3;
  } else if (contains_any(upper, {"SUPPLY", "WATER", "FOOD", "MEDICAL"})) {
    msg.message_type = "supply_request";
    msg.urgency = 2;
  } else {
    msg.message_type = "broadcast";
    msg.urgency = 1;
  }
  msg.payload = truncate_utf8(text, kMaxPayloadBytes);
  return msg;
}

std::optional<MeshMessage> parse_incoming_message(const std::string& payload, const std::string& node_id,
                                                  long long now_s) {
  const std::string text = trim(payload);
  if (text.empty()) return std::nullopt;
  if (text.front() == '{' && text.back() == '}') {
    if (auto msg = parse_message_json(text)) return msg;
    // not our schema: keep it as text
  }
  return classify_text_message(node_id, now_s, text);
}

std::vector<MeshMessage> parse_messages_json(const std::string& json) {
  std::vector<MeshMessage> messages;
  const auto objects = split_objects(json);
  for (size_t i = 0; i < objects.size(); ++i) {
    auto msg = parse_message_json(objects[i]);
    if (!msg) {
      log_line("io", "skipping message " + std::to_string(i + 1));
      continue;
    }
    if (msg->id == 0) msg->id = static_cast<long long>(i + 1);
    messages.push_back(std::move(*msg));
  }
  if (messages.empty()) {
    throw std::runtime_error("No messages parsed from JSON payload");
  }
  return messages;
}

std::vector<MeshMessage> parse_messages_file(const std::string& path) {
  return parse_messages_json(read_text_file(path));
}

std::vector<DemandPoint> select_active_demands(const std::vector<MeshMessage>& messages, long long now_s,
                                               int since_hours) {
  const long long cutoff = now_s - static_cast<long long>(since_hours) * 3600;
  std::vector<DemandPoint> demands;
  for (const auto& msg : messages) {
    if (!is_demand_type(msg.message_type) || !msg.lat || !msg.lon || msg.timestamp < cutoff) continue;

    DemandPoint d;
    d.id = msg.id;
    d.node_id = msg.node_id;
    d.location = {*msg.lat, *msg.lon};
    d.urgency = msg.urgency;
    d.resource_type = msg.resource_type;
    // absent or zero quantity counts as one unit
    d.quantity = msg.quantity.value_or(0) != 0 ? *msg.quantity : 1;
    d.timestamp = msg.timestamp;
    demands.push_back(std::move(d));
  }
  std::stable_sort(demands.begin(), demands.end(), [](const DemandPoint& a, const DemandPoint& b) {
    if (a.urgency != b.urgency) return a.urgency > b.urgency;
    return a.timestamp > b.timestamp;
  });
  return demands;
}

RouteRequest parse_route_request_json(const std::string& json, const std::optional<RouteRequest>& defaults) {
  const auto depot_lat = json_find_number(json, "depot_lat");
  const auto depot_lon = json_find_number(json, "depot_lon");
  if ((!depot_lat || !depot_lon) && !defaults) {
    throw std::runtime_error("Route request needs depot_lat and depot_lon");
  }

  const RouteRequest base = defaults.value_or(RouteRequest{});
  RouteRequest req;
  req.depot_lat = depot_lat.value_or(base.depot_lat);
  req.depot_lon = depot_lon.value_or(base.depot_lon);
  req.vehicle_capacity = json_get_int(json, "vehicle_capacity", base.vehicle_capacity);
  req.since_hours = json_get_int(json, "since_hours", base.since_hours);
  req.urgency_weight = json_get_double(json, "urgency_weight", base.urgency_weight);
  req.distance_weight = json_get_double(json, "distance_weight", base.distance_weight);
  return req;
}

RouterConfig parse_router_config_file(const std::string& path) {
  const std::string json = read_text_file(path);
  RouterConfig cfg;
  cfg.defaults = parse_route_request_json(json);
  cfg.max_message_age_hours = json_get_int(json, "max_message_age_hours", cfg.max_message_age_hours);
  return cfg;
}

std::string message_to_json(const MeshMessage& msg) {
  std::ostringstream ss;
  ss << std::setprecision(10);
  ss << "{\"id\": " << msg.id << ", \"node_id\": \"" << escape(msg.node_id) << "\", \"timestamp\": " << msg.timestamp
     << ", \"message_type\": \"" << escape(msg.message_type) << "\", \"urgency\": " << msg.urgency;
  if (msg.lat) ss << ", \"lat\": " << *msg.lat;
  if (msg.lon) ss << ", \"lon\": " << *msg.lon;
  ss << ", \"resource_type\": " << quoted_or_null(msg.resource_type);
  if (msg.quantity) ss << ", \"quantity\": " << *msg.quantity;
  ss << ", \"payload\": \"" << escape(msg.payload) << "\"}";
  return ss.str();
}

std::string route_plan_to_json(const RoutePlan& plan) {
  std::ostringstream ss;
  ss << std::setprecision(10);
  ss << "{\n";
  ss << "  \"mode\": \"" << to_string(plan.mode) << "\",\n";
  ss << "  \"depot_lat\": " << plan.depot_lat << ",\n";
  ss << "  \"depot_lon\": " << plan.depot_lon << ",\n";
  ss << "  \"stops\": [\n";
  for (size_t i = 0; i < plan.stops.size(); ++i) {
    const auto& s = plan.stops[i];
    ss << "    { \"lat\": " << s.lat << ", \"lon\": " << s.lon << ", \"node_id\": \"" << escape(s.node_id)
       << "\", \"resource_type\": " << quoted_or_null(s.resource_type) << ", \"quantity\": " << s.quantity
       << ", \"urgency\": " << s.urgency << ", \"distance_from_prev_km\": " << s.distance_from_prev_km << " }";
    if (i + 1 != plan.stops.size()) ss << ",";
    ss << "\n";
  }
  ss << "  ],\n";
  ss << "  \"total_distance_km\": " << plan.total_distance_km << ",\n";
  ss << "  \"estimated_time_minutes\": " << plan.estimated_time_minutes << ",\n";
  ss << "  \"urgent_requests_served\": " << plan.urgent_requests_served << ",\n";

  const auto& md = plan.metadata;
  ss << "  \"metadata\": { \"algorithm\": \"" << md.algorithm << "\"";
  if (md.urgency_weight) ss << ", \"urgency_weight\": " << *md.urgency_weight;
  if (md.distance_weight) ss << ", \"distance_weight\": " << *md.distance_weight;
  if (md.return_to_depot_km) ss << ", \"return_to_depot_km\": " << *md.return_to_depot_km;
  ss << ", \"vehicle_capacity\": " << md.vehicle_capacity << " }\n";
  ss << "}";
  return ss.str();
}

std::string route_plans_to_json(const std::vector<RoutePlan>& plans) {
  std::ostringstream ss;
  ss << "[";
  for (size_t i = 0; i < plans.size(); ++i) {
    ss << (i == 0 ? "\n" : ",\n") << route_plan_to_json(plans[i]);
  }
  ss << (plans.empty() ? "]\n" : "\n]\n");
  return ss.str();
}

long long unix_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

long long unix_s() { return unix_ms() / 1000; }

void set_log_enabled(bool enabled) { g_log_enabled.store(enabled); }

void log_line(const std::string& tag, const std::string& message) {
  if (!g_log_enabled.load()) return;
  std::cerr << "[" << tag << "] " << message << std::endl;
}
