/**
 * @file main.cpp
 * @brief pool_sim: session workload driven through intercept_call() over an in-memory transport.
 *
 * **Bootstrap**
 * - Load ApiConfig JSON (or named defaults), publish policies, create the pool.
 *
 * **Workload**
 * - Each worker: CreateSession (BIND) -> ExecuteSql x N (BOUND) -> DeleteSession (UNBIND).
 * - The in-memory server answers synchronously; every few queries fail with UNAVAILABLE.
 *
 * **Report**
 * - Per-channel load and affinity counts, binding table size, observer counters,
 *   and how many queries stayed on their session's channel.
 *
 * Usage: pool_sim [config.json] [workers] [queries-per-session] [--verbose]
 */

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "sticky/affinity/call_pipeline.hpp"
#include "sticky/config/config_loader.hpp"
#include "sticky/demo/session.pb.h"
#include "sticky/pool/local_channel_pool.hpp"
#include "sticky/version.hpp"

namespace sim {

using sticky::call::InputCallProperties;
using sticky::call::OutputCallProperties;
using sticky::call::Status;
using sticky::call::StatusCode;
namespace demo = sticky::demo;

constexpr const char* kCreate  = "/sticky.demo.SessionService/CreateSession";
constexpr const char* kExecute = "/sticky.demo.SessionService/ExecuteSql";
constexpr const char* kDelete  = "/sticky.demo.SessionService/DeleteSession";

/// Loopback transport: remembers its slot, nothing else.
class LoopbackChannel final : public sticky::pool::TransportChannel {
public:
  LoopbackChannel(std::string target, std::size_t slot) : target_(std::move(target)), slot_(slot) {}
  const std::string& target() const noexcept override { return target_; }
  std::size_t slot() const noexcept { return slot_; }
private:
  std::string target_;
  std::size_t slot_;
};

struct Stats {
  std::atomic<uint64_t> queries{0};
  std::atomic<uint64_t> pinned{0};     ///< Query landed on its session's channel
  std::atomic<uint64_t> failed{0};
};

/// Synchronous fake server: answers on the channel the call was dispatched to.
class Server {
public:
  explicit Server(std::shared_ptr<sticky::pool::ChannelPool> pool, sticky::obs::Observer* obs)
      : pool_(std::move(pool)), obs_(obs) {}

  std::string create_session(std::size_t* slot) {
    auto out = dispatch(kCreate, std::make_shared<demo::CreateSessionRequest>());
    demo::Session s;
    s.set_name("sessions/" + std::to_string(next_id_.fetch_add(1)));
    *slot = slot_of(out);
    finish(out, &s, Status{});
    return s.name();
  }

  void execute(const std::string& session, std::size_t expected_slot, uint64_t n, Stats& st) {
    auto req = std::make_shared<demo::ExecuteSqlRequest>();
    req->set_session(session);
    req->set_sql("SELECT " + std::to_string(n));
    auto out = dispatch(kExecute, req);

    st.queries.fetch_add(1, std::memory_order_relaxed);
    if (slot_of(out) == expected_slot) st.pinned.fetch_add(1, std::memory_order_relaxed);

    demo::ResultSet rs;
    rs.add_rows("row-" + std::to_string(n));
    if (n % 7 == 6) {
      st.failed.fetch_add(1, std::memory_order_relaxed);
      finish(out, nullptr, Status{StatusCode::Unavailable, "transient"});
    } else {
      finish(out, &rs, Status{});
    }
  }

  void delete_session(const std::string& session) {
    auto req = std::make_shared<demo::DeleteSessionRequest>();
    req->set_name(session);
    auto out = dispatch(kDelete, req);
    demo::Empty e;
    finish(out, &e, Status{});
  }

private:
  OutputCallProperties dispatch(const char* method, sticky::call::MessagePtr arg) {
    InputCallProperties in;
    in.argument = std::move(arg);
    in.channel = pool_;
    in.method.path = method;
    return sticky::affinity::intercept_call(std::move(in), obs_);
  }

  static void finish(OutputCallProperties& out, const google::protobuf::Message* resp, const Status& st) {
    if (resp) sticky::call::deliver_message(out.options, *resp);
    sticky::call::deliver_status(out.options, st);
  }

  static std::size_t slot_of(const OutputCallProperties& out) {
    auto* ch = dynamic_cast<const LoopbackChannel*>(out.channel.get());
    return ch ? ch->slot() : static_cast<std::size_t>(-1);
  }

  std::shared_ptr<sticky::pool::ChannelPool> pool_;
  sticky::obs::Observer* obs_;
  std::atomic<uint64_t> next_id_{1};
};

} // namespace sim

int main(int argc, char** argv) {
  std::string config_path;
  int workers = 8;
  int queries = 50;
  bool verbose = false;

  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--verbose") verbose = true;
    else positional.push_back(std::move(a));
  }
  if (positional.size() > 0) config_path = positional[0];
  if (positional.size() > 1) workers = std::max(1, std::atoi(positional[1].c_str()));
  if (positional.size() > 2) queries = std::max(1, std::atoi(positional[2].c_str()));

  std::cout << "sticky-channel-pool " << sticky::version_string << ": pool_sim\n"
            << "--------------------------------------------------\n";

  // ---- Bootstrap ----
  const std::string target = "sessions.sim:443";
  auto loaded = config_path.empty()
      ? sticky_detail::expected<sticky::config::ClientConfig, sticky::config::ConfigError>(
            sticky::config::Loader::defaults(target))
      : sticky::config::Loader::load_from_file(config_path, target);
  if (!loaded) {
    std::cerr << "config error (" << sticky::config::to_string(loaded.error().code) << "): "
              << loaded.error().detail << "\n";
    return 1;
  }

  auto registry = std::make_shared<sticky::policy::PolicyRegistry>();
  if (auto applied = sticky::config::Loader::apply(*loaded, *registry); !applied) {
    std::cerr << "policy error: " << applied.error().detail << "\n";
    return 1;
  }

  auto pool = sticky::pool::LocalChannelPool::create(
      loaded->pool,
      [](const std::string& t, std::size_t slot) -> sticky::pool::TransportChannelPtr {
        return std::make_shared<sim::LoopbackChannel>(t, slot);
      },
      registry);
  if (!pool) {
    std::cerr << "pool error: " << sticky::pool::to_string(pool.error()) << "\n";
    return 1;
  }

  sticky::obs::Observer* obs = verbose ? sticky::obs::make_simple_observer()
                                       : sticky::obs::make_counting_observer();
  sim::Server server(*pool, obs);
  sim::Stats stats;

  std::cout << "methods=" << registry->size()
            << " max_size=" << loaded->pool.max_size
            << " low_watermark=" << loaded->pool.low_watermark
            << " workers=" << workers << " queries/session=" << queries << "\n";

  // ---- Workload ----
  std::vector<std::thread> threads;
  threads.reserve(static_cast<std::size_t>(workers));
  for (int w = 0; w < workers; ++w) {
    threads.emplace_back([&] {
      std::size_t slot = 0;
      const auto session = server.create_session(&slot);
      for (int q = 0; q < queries; ++q) {
        server.execute(session, slot, static_cast<uint64_t>(q), stats);
      }
      server.delete_session(session);
    });
  }
  for (auto& t : threads) t.join();

  // ---- Report ----
  std::cout << "\nchannels:\n";
  for (const auto& ch : (*pool)->channels()) {
    std::cout << "  #" << ch->id()
              << " active=" << ch->active_streams()
              << " bound_keys=" << ch->affinity_count() << "\n";
  }
  std::cout << "bindings=" << (*pool)->binding_count() << "\n";

  const auto c = obs->snapshot();
  std::cout << "\ncounters:\n"
            << "  intercepted=" << c.intercepted << " bypassed=" << c.bypassed << "\n"
            << "  binds=" << c.binds << " unbinds=" << c.unbinds << "\n"
            << "  completed=" << c.completed << " released_on_error=" << c.released_on_error
            << " abandoned=" << c.abandoned << "\n"
            << "  key_resolution_failures=" << c.key_resolution_failures << "\n";

  std::cout << "\nqueries=" << stats.queries.load()
            << " pinned=" << stats.pinned.load()
            << " failed=" << stats.failed.load() << "\n"
            << std::endl;
  return 0;
}
