#include <mosquitto.h>

#include <atomic>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "demand_book.hpp"
#include "io.hpp"
#include "router.hpp"

namespace {
std::atomic<bool> g_should_exit{false};

void on_signal(int) { g_should_exit.store(true); }

struct Runtime {
  std::string messages_topic;
  std::string generate_topic;
  std::string plans_topic;
  RouterConfig router;
  DemandBook book;
  int qos{1};
};

void handle_mesh_message(Runtime& rt, const std::string& payload) {
  // plain-text traffic carries no sender, so it is filed under "unknown"
  auto msg = parse_incoming_message(payload, "unknown", unix_s());
  if (!msg) {
    std::cerr << "[meshroute_mqtt] ignoring empty message" << std::endl;
    return;
  }
  const long long id = rt.book.add(std::move(*msg));
  std::cerr << "[meshroute_mqtt] stored message " << id << " (" << rt.book.size() << " held)" << std::endl;
}

void handle_generate(struct mosquitto* mosq, Runtime& rt, const std::string& payload) {
  const RouteRequest req = parse_route_request_json(payload, rt.router.defaults);
  const auto demands = rt.book.active(unix_s(), req.since_hours);

  std::vector<RoutePlan> plans;
  if (!demands.empty()) {
    const Vehicle vehicle{{req.depot_lat, req.depot_lon}, req.vehicle_capacity};
    const auto all = generate_all_routes(demands, vehicle, req.urgency_weight, req.distance_weight);
    plans.assign(all.begin(), all.end());
  }

  const std::string out = route_plans_to_json(plans);
  const int rc = mosquitto_publish(mosq, nullptr, rt.plans_topic.c_str(), static_cast<int>(out.size()), out.c_str(),
                                   rt.qos, false);
  if (rc != MOSQ_ERR_SUCCESS) {
    throw std::runtime_error(std::string("mosquitto_publish failed: ") + mosquitto_strerror(rc));
  }
  std::cerr << "[meshroute_mqtt] published " << plans.size() << " route plans for " << demands.size()
            << " demands (" << rt.plans_topic << ")" << std::endl;
}

void on_message(struct mosquitto* mosq, void* userdata, const struct mosquitto_message* msg) {
  auto* rt = static_cast<Runtime*>(userdata);
  if (!rt || !msg || !msg->topic) return;

  try {
    const std::string payload = msg->payload && msg->payloadlen > 0
                                    ? std::string(static_cast<const char*>(msg->payload),
                                                  static_cast<size_t>(msg->payloadlen))
                                    : std::string();
    const std::string topic(msg->topic);
    if (topic == rt->messages_topic) {
      handle_mesh_message(*rt, payload);
    } else if (topic == rt->generate_topic) {
      handle_generate(mosq, *rt, payload.empty() ? std::string("{}") : payload);
    }
  } catch (const std::exception& e) {
    std::cerr << "[meshroute_mqtt] failed to handle message: " << e.what() << std::endl;
  }
}

// Owns the client and the library init so every exit path releases both.
struct MosquittoSession {
  mosquitto* mosq{nullptr};

  explicit MosquittoSession(void* userdata) {
    mosquitto_lib_init();
    mosq = mosquitto_new(nullptr, true, userdata);
  }
  ~MosquittoSession() {
    if (mosq) mosquitto_destroy(mosq);
    mosquitto_lib_cleanup();
  }
  MosquittoSession(const MosquittoSession&) = delete;
  MosquittoSession& operator=(const MosquittoSession&) = delete;
};

void subscribe(struct mosquitto* mosq, const std::string& topic, int qos) {
  const int rc = mosquitto_subscribe(mosq, nullptr, topic.c_str(), qos);
  if (rc != MOSQ_ERR_SUCCESS) {
    throw std::runtime_error(std::string("mosquitto_subscribe failed: ") + mosquitto_strerror(rc));
  }
}
}

int main(int argc, char* argv[]) {
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  const std::string mqtt_config_path = argc > 1 ? argv[1] : "config/dev/mqtt.json";
  const std::string router_config_path = argc > 2 ? argv[2] : "config/dev/router.json";

  try {
    const std::string mqtt_cfg = read_text_file(mqtt_config_path);

    const std::string broker = json_get_string(mqtt_cfg, "broker", "localhost");
    const int port = json_get_int(mqtt_cfg, "port", 1883);

    Runtime rt;
    rt.qos = json_get_int(mqtt_cfg, "qos", 1);
    rt.messages_topic = json_get_topic(mqtt_cfg, "messages", "meshsos/messages");
    rt.generate_topic = json_get_topic(mqtt_cfg, "generate", "meshsos/routes/generate");
    rt.plans_topic = json_get_topic(mqtt_cfg, "plans", "meshsos/routes/plans");
    rt.router = parse_router_config_file(router_config_path);

    MosquittoSession session(&rt);
    mosquitto* mosq = session.mosq;
    if (!mosq) throw std::runtime_error("mosquitto_new failed");

    mosquitto_message_callback_set(mosq, on_message);

    const int rc_conn = mosquitto_connect(mosq, broker.c_str(), port, 60);
    if (rc_conn != MOSQ_ERR_SUCCESS) {
      throw std::runtime_error(std::string("mosquitto_connect failed: ") + mosquitto_strerror(rc_conn));
    }

    subscribe(mosq, rt.messages_topic, rt.qos);
    subscribe(mosq, rt.generate_topic, rt.qos);

    std::cerr << "[meshroute_mqtt] connected to " << broker << ":" << port << "\n";
    std::cerr << "[meshroute_mqtt] subscribed: " << rt.messages_topic << ", " << rt.generate_topic
              << " -> publishes: " << rt.plans_topic << "\n";

    long long last_prune_s = unix_s();
    while (!g_should_exit.load()) {
      const int rc_loop = mosquitto_loop(mosq, 200 /*ms*/, 1);
      if (rc_loop != MOSQ_ERR_SUCCESS) {
        std::cerr << "[meshroute_mqtt] loop error: " << mosquitto_strerror(rc_loop) << ", retrying..." << std::endl;
        const int rc_re = mosquitto_reconnect(mosq);
        if (rc_re != MOSQ_ERR_SUCCESS) {
          std::cerr << "[meshroute_mqtt] reconnect failed: " << mosquitto_strerror(rc_re) << std::endl;
        }
      }

      const long long now = unix_s();
      if (now - last_prune_s >= 60) {
        const size_t dropped = rt.book.prune(now - static_cast<long long>(rt.router.max_message_age_hours) * 3600);
        if (dropped > 0) std::cerr << "[meshroute_mqtt] pruned " << dropped << " stale messages" << std::endl;
        last_prune_s = now;
      }
    }

    const int rc_disc = mosquitto_disconnect(mosq);
    if (rc_disc != MOSQ_ERR_SUCCESS) {
      std::cerr << "[meshroute_mqtt] disconnect failed: " << mosquitto_strerror(rc_disc) << std::endl;
    }
  } catch (const std::exception& e) {
    std::cerr << "[meshroute_mqtt] error: " << e.what() << std::endl;
    std::cerr << "Usage: meshroute_mqtt_main [config/dev/mqtt.json] [config/dev/router.json]" << std::endl;
    return 1;
  }

  return 0;
}
