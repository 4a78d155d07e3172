#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "route_types.hpp"

constexpr size_t kMaxPayloadBytes = 100;

struct RouterConfig {
  RouteRequest defaults;
  int max_message_age_hours{72};
};

std::string read_text_file(const std::string& path);

// Flat-object JSON lookups. Keys are matched with their quotes, so "lat" does not hit "depot_lat".
std::optional<std::string> json_find_string(const std::string& json, const std::string& key);
std::optional<double> json_find_number(const std::string& json, const std::string& key);
std::string json_get_string(const std::string& json, const std::string& key, const std::string& default_value);
int json_get_int(const std::string& json, const std::string& key, int default_value);
double json_get_double(const std::string& json, const std::string& key, double default_value);
std::string json_get_topic(const std::string& json, const std::string& topic_key, const std::string& default_value);

// Accepts a JSON array of message objects or one object per line.
std::vector<MeshMessage> parse_messages_json(const std::string& json);
std::vector<MeshMessage> parse_messages_file(const std::string& path);
// Returns nullopt (and logs why) for objects missing a required field or failing message_problem.
std::optional<MeshMessage> parse_message_json(const std::string& json);

bool is_known_message_type(const std::string& message_type);
// Urgency 1..3, coordinates in range, known type, payload within kMaxPayloadBytes.
std::optional<std::string> message_problem(const MeshMessage& msg);

// Cuts to at most max_bytes without splitting a UTF-8 sequence.
std::string truncate_utf8(const std::string& s, size_t max_bytes);
// Plain-text fallback: SOS/HELP/EMERGENCY -> sos (3), SUPPLY/WATER/FOOD/MEDICAL -> supply_request (2),
// anything else -> broadcast (1). No coordinates.
MeshMessage classify_text_message(const std::string& node_id, long long timestamp, const std::string& text);
// JSON object in the message schema when it parses, otherwise the text fallback. Blank input gives nullopt.
std::optional<MeshMessage> parse_incoming_message(const std::string& payload, const std::string& node_id,
                                                  long long now_s);

// supply_request / sos messages with coordinates, no older than since_hours before now_s.
// Ordered by urgency then timestamp, both descending.
std::vector<DemandPoint> select_active_demands(const std::vector<MeshMessage>& messages, long long now_s,
                                               int since_hours);

// Fields missing from json come from defaults; without defaults the depot is required.
RouteRequest parse_route_request_json(const std::string& json,
                                      const std::optional<RouteRequest>& defaults = std::nullopt);
RouterConfig parse_router_config_file(const std::string& path);

std::string message_to_json(const MeshMessage& msg);
std::string route_plan_to_json(const RoutePlan& plan);
std::string route_plans_to_json(const std::vector<RoutePlan>& plans);

long long unix_ms();
long long unix_s();

void set_log_enabled(bool enabled);
void log_line(const std::string& tag, const std::string& message);
