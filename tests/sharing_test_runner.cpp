#include "auto_reconcile.hpp"
#include "connection_registry.hpp"
#include "health_monitor.hpp"
#include "http_client.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "selection_service.hpp"
#include "settings_manager.hpp"
#include "sharing_client.hpp"
#include "sharing_engine.hpp"
#include "sharing_server.hpp"
#include "test_fakes.hpp"
#include "test_runner_utils.hpp"

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <functional>
#include <future>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;
using voiceshare::test::FakeFirewallProbe;
using voiceshare::test::FakeModelInventory;
using voiceshare::test::FakeTranscriptionEngine;
using voiceshare::test::LogCapture;
using voiceshare::test::TempWorkspace;
using voiceshare::test::wait_for_condition;
using voiceshare::test::loopback_only;
using voiceshare::test::with_unbindable_interface;

struct TestContext {
  LogCapture& logs;
  bool verbose = false;
};

const std::vector<uint8_t> kAudio(4096, 0x2a);

// Port that was free a moment ago; nothing listens on it afterwards.
uint16_t unused_port() {
  asio::io_context io;
  asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
  return acceptor.local_endpoint().port();
}

HttpOutcome send_raw(uint16_t port, const HttpRequest& request, std::chrono::milliseconds timeout = 3s) {
  httplib::Client client("127.0.0.1", port);
  return perform_request(client, request, timeout);
}

HttpRequest raw_request(const std::string& method, const std::string& path) {
  HttpRequest request;
  request.method = method;
  request.path = path;
  return request;
}

bool has_status(const HttpOutcome& outcome, int status) {
  return outcome.kind == HttpOutcome::Kind::Response && outcome.status == status;
}

struct ServerFixture {
  std::shared_ptr<Logger> logger = std::make_shared<Logger>("sharing-server");
  std::shared_ptr<FakeModelInventory> inventory;
  std::shared_ptr<FakeTranscriptionEngine> engine;
  std::shared_ptr<LocalSelectionService> selection;
  std::shared_ptr<InferenceGate> gate = std::make_shared<InferenceGate>();
  std::shared_ptr<SharingServer> server;

  ServerFixture(TestContext& ctx,
                std::vector<std::string> models = {"base.en"},
                std::chrono::milliseconds work = 0ms,
                InterfaceLister interfaces = loopback_only(),
                std::string machine_id = "machine-server")
    : inventory(std::make_shared<FakeModelInventory>(models)),
      engine(std::make_shared<FakeTranscriptionEngine>(work)),
      selection(std::make_shared<LocalSelectionService>(
        ActiveSelection{std::nullopt, models.empty() ? std::string() : models.front()})) {
    ctx.logs.attach(logger);
    ServerDependencies deps;
    deps.engine = engine;
    deps.inventory = inventory;
    deps.selection = selection;
    deps.gate = gate;
    deps.firewall = std::make_shared<FakeFirewallProbe>(false);
    deps.interfaces = std::move(interfaces);
    deps.machine_id = std::move(machine_id);
    server = std::make_shared<SharingServer>(deps, logger);
  }

  uint16_t start(std::optional<std::string> password = std::nullopt) {
    auto result = server->start(0, std::move(password), std::string("studio"));
    return result.ok() ? result.value->port : 0;
  }
};

struct ClientFixture {
  std::shared_ptr<Logger> logger = std::make_shared<Logger>("sharing-client");
  std::shared_ptr<ConnectionRegistry> registry = std::make_shared<ConnectionRegistry>();
  std::shared_ptr<SharingClient> client;

  explicit ClientFixture(TestContext& ctx,
                         std::string machine_id = "machine-client",
                         std::chrono::milliseconds status_timeout = 2s)
    : client(std::make_shared<SharingClient>(registry, std::move(machine_id), status_timeout, logger)) {
    ctx.logs.attach(logger);
  }

  std::string save(uint16_t port, std::optional<std::string> password = std::nullopt) {
    SavedConnection c;
    c.host = "127.0.0.1";
    c.port = port;
    c.password = std::move(password);
    return registry->upsert(c).id;
  }
};

bool test_password_protects_every_endpoint(TestContext& ctx) {
  ServerFixture fx(ctx);
  ClientFixture cl(ctx);
  const uint16_t port = fx.start(std::string("secret123"));
  if(port == 0) return false;

  auto wrong = cl.client->test_connection("127.0.0.1", port, std::string("wrong"));
  auto missing = cl.client->test_connection("127.0.0.1", port, std::nullopt);
  auto right = cl.client->test_connection("127.0.0.1", port, std::string("secret123"));

  auto raw = send_raw(port, raw_request("GET", kStatusPath));
  auto raw_transcribe = raw_request("POST", kTranscribePath);
  raw_transcribe.headers.emplace("Content-Type", kAudioContentType);
  raw_transcribe.headers.emplace(kAuthHeader, "wrong");
  raw_transcribe.body = "RIFF";
  auto rejected = send_raw(port, raw_transcribe);

  return !wrong.ok() && wrong.error.code == ShareErrc::Unauthorized &&
         !missing.ok() && missing.error.code == ShareErrc::Unauthorized &&
         right.ok() && right.value->model == "base.en" && right.value->name == "studio" &&
         right.value->machine_id == "machine-server" &&
         has_status(raw, 401) && parse_error_message(raw.body) == "unauthorized" &&
         has_status(rejected, 401) &&
         fx.engine->call_count() == 0 &&
         ctx.logs.contains("REJECTED: authentication failed");
}

bool test_open_server_ignores_key(TestContext& ctx) {
  ServerFixture fx(ctx);
  ClientFixture cl(ctx);
  const uint16_t port = fx.start(std::string(""));
  if(port == 0) return false;
  auto without = cl.client->test_connection("127.0.0.1", port, std::nullopt);
  auto with_any = cl.client->test_connection("127.0.0.1", port, std::string("anything"));
  return without.ok() && with_any.ok() && !fx.server->status().password.has_value();
}

bool test_stop_is_idempotent(TestContext& ctx) {
  ServerFixture fx(ctx);
  const uint16_t port = fx.start();
  if(port == 0) return false;
  bool ok = fx.server->status().enabled && fx.server->status().port == port;
  ok &= !fx.server->stop();
  ok &= !fx.server->stop();
  ok &= !fx.server->status().enabled;
  ok &= ctx.logs.contains("Sharing STOPPED");

  // Nothing listens once stopped.
  auto probe = send_raw(port, raw_request("GET", kStatusPath), 1s);
  ok &= probe.kind == HttpOutcome::Kind::ConnectFailed;

  ok &= fx.start() != 0;
  return ok;
}

bool test_second_start_is_rejected(TestContext& ctx) {
  ServerFixture fx(ctx);
  const uint16_t port = fx.start();
  if(port == 0) return false;
  auto again = fx.server->start(port);
  return !again.ok() && again.error.code == ShareErrc::AlreadyRunning &&
         fx.server->status().enabled && fx.server->status().port == port;
}

bool test_start_without_models_fails(TestContext& ctx) {
  ServerFixture fx(ctx, {});
  auto result = fx.server->start(0);
  return !result.ok() && result.error.code == ShareErrc::NoModelAvailable &&
         !fx.server->status().enabled;
}

bool test_partial_bind_reports_each_interface(TestContext& ctx) {
  ServerFixture fx(ctx, {"base.en"}, 0ms, with_unbindable_interface());
  auto result = fx.server->start(0);
  if(!result.ok()) return false;
  const auto& bindings = result.value->binding_results;
  return bindings.size() == 2 &&
         bindings[0].address == "192.0.2.10" && !bindings[0].success && !bindings[0].error.empty() &&
         bindings[1].address == kLoopbackAddress && bindings[1].success &&
         fx.server->status().binding_results.size() == 2;
}

bool test_no_successful_bind_fails(TestContext& ctx) {
  asio::io_context io;
  asio::ip::tcp::acceptor blocker(io);
  blocker.open(asio::ip::tcp::v4());
  blocker.bind(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
  blocker.listen();
  const uint16_t taken = blocker.local_endpoint().port();

  ServerFixture fx(ctx, {"base.en"}, 0ms, with_unbindable_interface());
  auto result = fx.server->start(taken);
  if(result.ok()) return false;
  const auto& bindings = result.error.binding_results;
  return result.error.code == ShareErrc::BindFailed &&
         bindings.size() == 2 &&
         !bindings[0].success && !bindings[1].success &&
         !fx.server->status().enabled;
}

bool test_concurrent_requests_run_one_at_a_time(TestContext& ctx) {
  ServerFixture fx(ctx, {"base.en"}, 200ms);
  ClientFixture cl(ctx);
  const uint16_t port = fx.start();
  if(port == 0) return false;
  const auto id = cl.save(port);
  const auto connection = *cl.registry->get(id);

  constexpr int kRequests = 4;
  std::mutex mutex;
  std::vector<ShareResult<RemoteTranscription>> results;
  for(int i = 0; i < kRequests; ++i) {
    cl.client->async_transcribe(connection, kAudio, 10s, [&](ShareResult<RemoteTranscription> r){
      std::lock_guard<std::mutex> lock(mutex);
      results.push_back(std::move(r));
    });
  }

  const bool saw_queue = wait_for_condition([&]{
    auto s = fx.server->status();
    return s.active_connection_count == 1 && s.queued_request_count >= 1;
  }, 3s, 5ms);
  const bool all_done = wait_for_condition([&]{
    std::lock_guard<std::mutex> lock(mutex);
    return results.size() == kRequests;
  }, 10s);
  if(!all_done) return false;

  bool ok = saw_queue;
  for(const auto& r : results) {
    ok &= r.ok() && r.value->model_used == "base.en" && r.value->text == "hello world [base.en]";
    // Time spent queued is not counted.
    ok &= r.ok() && r.value->duration_ms >= 150 && r.value->duration_ms < 600;
  }
  auto after = fx.server->status();
  return ok && fx.engine->call_count() == kRequests &&
         fx.engine->max_concurrency() == 1 && !fx.engine->any_overlap() &&
         after.active_connection_count == 0 && after.queued_request_count == 0;
}

bool test_client_timeout_leaves_inference_running(TestContext& ctx) {
  ServerFixture fx(ctx, {"base.en"}, 1500ms);
  ClientFixture cl(ctx);
  const uint16_t port = fx.start();
  if(port == 0) return false;
  const auto id = cl.save(port);

  auto result = cl.client->transcribe(id, kAudio, std::chrono::milliseconds(300));
  if(result.ok() || result.error.code != ShareErrc::Timeout) return false;
  return wait_for_condition([&]{ return fx.engine->call_count() == 1; }, 5s) &&
         ctx.logs.wait_for_substring("completed in", 2s);
}

bool test_failed_inference_returns_500(TestContext& ctx) {
  ServerFixture fx(ctx);
  ClientFixture cl(ctx);
  const uint16_t port = fx.start();
  if(port == 0) return false;
  fx.engine->set_fail(true);
  const auto id = cl.save(port);
  auto result = cl.client->transcribe(id, kAudio, std::chrono::milliseconds(3000));
  return !result.ok() && result.error.code == ShareErrc::ServerError &&
         result.error.message.find("model crashed") != std::string::npos;
}

bool test_routes_and_validation(TestContext& ctx) {
  ServerFixture fx(ctx);
  const uint16_t port = fx.start();
  if(port == 0) return false;

  auto not_found = send_raw(port, raw_request("GET", "/api/v1/models"));
  auto status_post = send_raw(port, raw_request("POST", kStatusPath));
  auto transcribe_get = send_raw(port, raw_request("GET", kTranscribePath));

  auto wrong_type = raw_request("POST", kTranscribePath);
  wrong_type.headers.emplace("Content-Type", "text/plain");
  wrong_type.body = "hello";
  auto unsupported = send_raw(port, wrong_type);

  auto empty = raw_request("POST", kTranscribePath);
  empty.headers.emplace("Content-Type", kAudioContentType);
  auto empty_audio = send_raw(port, empty);

  auto good = raw_request("POST", kTranscribePath + std::string("?lang=en"));
  good.headers.emplace("Content-Type", "audio/webm");
  good.body = std::string(kAudio.begin(), kAudio.end());
  auto transcribed = send_raw(port, good);
  TranscribeResponse body;
  std::string error;

  return has_status(not_found, 404) && parse_error_message(not_found.body) == "not_found" &&
         has_status(status_post, 405) &&
         has_status(transcribe_get, 405) &&
         has_status(unsupported, 415) &&
         has_status(empty_audio, 400) && parse_error_message(empty_audio.body) == "empty_audio" &&
         has_status(transcribed, 200) &&
         parse_transcribe_response(transcribed.body, body, error) &&
         body.model == "base.en" &&
         fx.engine->calls().size() == 1 && fx.engine->calls().front().audio_bytes == kAudio.size();
}

bool test_unreachable_server_reads_offline(TestContext& ctx) {
  ClientFixture cl(ctx);
  const auto id = cl.save(unused_port());
  const auto status = cl.client->check_status(id);
  auto saved = cl.registry->get(id);
  auto transcribed = cl.client->transcribe(id, kAudio, std::chrono::milliseconds(1000));
  return status == ConnectionStatus::Offline &&
         saved->cached_status == ConnectionStatus::Offline && saved->last_checked_at_ms > 0 &&
         !transcribed.ok() && transcribed.error.code == ShareErrc::Unreachable;
}

bool test_own_server_is_never_selectable(TestContext& ctx) {
  ServerFixture fx(ctx, {"base.en"}, 0ms, loopback_only(), "machine-same");
  ClientFixture cl(ctx, "machine-same");
  const uint16_t port = fx.start();
  if(port == 0) return false;
  const auto id = cl.save(port);

  bool ok = cl.client->check_status(id) == ConnectionStatus::SelfConnection;
  ok &= cl.registry->selectable().empty();
  auto transcribed = cl.client->transcribe(id, kAudio, std::chrono::milliseconds(2000));
  ok &= !transcribed.ok() && transcribed.error.code == ShareErrc::SelfConnectionDetected;
  ok &= fx.engine->call_count() == 0;

  // Still this machine even when the server is down.
  ok &= !fx.server->stop();
  ok &= cl.client->check_status(id) == ConnectionStatus::SelfConnection;
  return ok;
}

bool test_wrong_password_reads_auth_failed(TestContext& ctx) {
  ServerFixture fx(ctx);
  ClientFixture cl(ctx);
  const uint16_t port = fx.start(std::string("secret123"));
  if(port == 0) return false;
  const auto id = cl.save(port, std::string("guess"));

  bool ok = cl.client->check_status(id) == ConnectionStatus::AuthFailed;
  ok &= cl.registry->selectable().size() == 1;

  auto fixed = *cl.registry->get(id);
  fixed.password = "secret123";
  ok &= cl.registry->update(id, fixed).ok();
  ok &= cl.client->check_status(id) == ConnectionStatus::Online;
  ok &= cl.registry->get(id)->cached_model_name == std::optional<std::string>("base.en");
  return ok;
}

bool test_model_change_restarts_sharing(TestContext& ctx) {
  ServerFixture fx(ctx, {"base.en", "small.en"});
  ClientFixture cl(ctx);
  const uint16_t port = fx.start(std::string("pw"));
  if(port == 0) return false;

  auto logger = std::make_shared<Logger>("reconcile");
  ctx.logs.attach(logger);
  AutoReconcile reconcile(fx.server, fx.selection, logger);
  bool ok = reconcile.reconcile_once() == AutoReconcile::Outcome::None;

  fx.selection->set_local_model("small.en");
  ok &= reconcile.reconcile_once() == AutoReconcile::Outcome::Restarted;
  auto session = fx.server->status();
  ok &= session.enabled && session.port == port && session.model_name == "small.en" &&
        session.password == std::optional<std::string>("pw") && session.display_name == "studio";

  auto probe = cl.client->test_connection("127.0.0.1", port, std::string("pw"));
  ok &= probe.ok() && probe.value->model == "small.en";
  ok &= reconcile.reconcile_once() == AutoReconcile::Outcome::None;
  return ok;
}

bool test_reconcile_thread_follows_selection(TestContext& ctx) {
  ServerFixture fx(ctx, {"base.en", "small.en"});
  if(fx.start() == 0) return false;
  AutoReconcile reconcile(fx.server, fx.selection);
  std::atomic<int> changes{0};
  reconcile.set_change_callback([&](AutoReconcile::Outcome, const SharingSession&){ ++changes; });
  reconcile.start(50ms);

  fx.selection->set_local_model("small.en");
  const bool converged = wait_for_condition([&]{
    return fx.server->status().model_name == "small.en" && changes.load() == 1;
  }, 3s);
  reconcile.stop();
  return converged && fx.server->status().enabled && reconcile.cycles() >= 1;
}

bool test_failed_restart_stops_sharing_once(TestContext& ctx) {
  ServerFixture fx(ctx, {"base.en"});
  if(fx.start() == 0) return false;
  AutoReconcile reconcile(fx.server, fx.selection);
  std::vector<ShareError> failures;
  reconcile.set_failure_callback([&](const ShareError& e){ failures.push_back(e); });

  fx.inventory->set_models({});
  bool ok = reconcile.reconcile_once() == AutoReconcile::Outcome::Failed;
  ok &= !fx.server->status().enabled;
  ok &= reconcile.last_error() && reconcile.last_error()->code == ShareErrc::RestartFailed;
  ok &= failures.size() == 1 && failures.front().code == ShareErrc::RestartFailed;

  // No retry loop.
  ok &= reconcile.reconcile_once() == AutoReconcile::Outcome::None;
  ok &= failures.size() == 1;
  return ok;
}

bool test_remote_selection_pauses_sharing(TestContext& ctx) {
  ServerFixture fx(ctx, {"base.en"});
  const uint16_t port = fx.start(std::string("pw"));
  if(port == 0) return false;
  AutoReconcile reconcile(fx.server, fx.selection);

  fx.selection->set_active_remote(std::string("conn_elsewhere"));
  bool ok = reconcile.reconcile_once() == AutoReconcile::Outcome::StoppedForRemote;
  ok &= !fx.server->status().enabled;
  ok &= reconcile.remembered() && reconcile.remembered()->port == port;
  ok &= reconcile.reconcile_once() == AutoReconcile::Outcome::None;

  fx.selection->set_local_model("base.en");
  ok &= reconcile.reconcile_once() == AutoReconcile::Outcome::Restored;
  auto session = fx.server->status();
  ok &= session.enabled && session.port == port && session.password == std::optional<std::string>("pw");
  ok &= !reconcile.remembered();
  return ok;
}

bool test_health_probes_run_concurrently(TestContext& ctx) {
  asio::io_context black_hole_io;
  asio::ip::tcp::acceptor black_hole(black_hole_io);
  black_hole.open(asio::ip::tcp::v4());
  black_hole.bind(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
  black_hole.listen();

  ServerFixture fx(ctx);
  ClientFixture cl(ctx, "machine-client", 1000ms);
  const uint16_t port = fx.start();
  if(port == 0) return false;
  const auto silent_id = cl.save(black_hole.local_endpoint().port());
  const auto live_id = cl.save(port);

  auto logger = std::make_shared<Logger>("health");
  ctx.logs.attach(logger);
  HealthMonitor monitor(cl.client, 0s, logger);
  std::mutex mutex;
  std::map<std::string, ConnectionStatus> seen;
  monitor.set_status_listener([&](const std::string& id, ConnectionStatus status){
    std::lock_guard<std::mutex> lock(mutex);
    seen[id] = status;
  });
  auto seen_status = [&](const std::string& id) -> std::optional<ConnectionStatus> {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = seen.find(id);
    if(it == seen.end()) return std::nullopt;
    return it->second;
  };

  monitor.start();
  // The live server answers while the silent probe is still waiting.
  bool ok = wait_for_condition([&]{ return seen_status(live_id).has_value(); }, 800ms, 5ms);
  ok &= seen_status(live_id) == ConnectionStatus::Online;
  ok &= !seen_status(silent_id).has_value() && monitor.in_flight() == 1;

  monitor.check_now(silent_id);
  ok &= monitor.superseded_checks() == 1;
  ok &= wait_for_condition([&]{ return seen_status(silent_id).has_value(); }, 4s);
  ok &= seen_status(silent_id) == ConnectionStatus::Offline;
  ok &= monitor.completed_checks() == 2 && monitor.in_flight() == 0;
  ok &= cl.registry->get(silent_id)->cached_status == ConnectionStatus::Offline;
  monitor.stop();

  monitor.check_now(live_id);
  ok &= monitor.in_flight() == 0;
  return ok;
}

bool test_undownloaded_selection_is_not_shared(TestContext& ctx) {
  ServerFixture fx(ctx, {"base.en"});
  fx.selection->set_local_model("small.en");
  auto result = fx.server->start(0);
  bool ok = !result.ok() && result.error.code == ShareErrc::NoModelAvailable &&
            result.error.message.find("small.en") != std::string::npos;
  ok &= !fx.server->resolve_model() && !fx.server->status().enabled;

  // A running session whose model disappears stops instead of switching.
  fx.selection->set_local_model("base.en");
  if(fx.start() == 0) return false;
  AutoReconcile reconcile(fx.server, fx.selection);
  fx.selection->set_local_model("small.en");
  ok &= reconcile.reconcile_once() == AutoReconcile::Outcome::Failed;
  ok &= !fx.server->status().enabled;
  ok &= reconcile.last_error() && reconcile.last_error()->message.find("small.en") != std::string::npos;
  return ok;
}

bool test_manual_stop_is_not_undone_by_reconcile(TestContext& ctx) {
  ServerFixture fx(ctx, {"base.en", "small.en"});
  if(fx.start() == 0) return false;
  AutoReconcile reconcile(fx.server, fx.selection);
  fx.selection->set_local_model("small.en");

  std::promise<void> entered;
  std::atomic<bool> stopped{false};
  std::thread manual([&]{
    reconcile.run_exclusive([&]{
      entered.set_value();
      std::this_thread::sleep_for(150ms);
      reconcile.forget();
      stopped = !fx.server->stop();
    });
  });
  entered.get_future().wait();
  // Waits for the manual stop, then finds nothing to restart.
  const auto outcome = reconcile.reconcile_once();
  manual.join();
  return stopped.load() && outcome == AutoReconcile::Outcome::None && !fx.server->status().enabled;
}

bool test_cancelled_exchange_frees_its_worker(TestContext& ctx) {
  asio::io_context black_hole_io;
  asio::ip::tcp::acceptor black_hole(black_hole_io);
  black_hole.open(asio::ip::tcp::v4());
  black_hole.bind(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
  black_hole.listen();

  ServerFixture fx(ctx);
  const uint16_t port = fx.start();
  if(port == 0) return false;

  asio::thread_pool pool(1);
  std::atomic<bool> silent_called{false};
  auto silent = HttpExchange::start(pool, "127.0.0.1", black_hole.local_endpoint().port(),
                                    raw_request("GET", kStatusPath), 10s,
                                    [&](HttpOutcome){ silent_called = true; });
  std::this_thread::sleep_for(100ms);
  silent->cancel();

  // The single worker is free again well before the 10 s deadline.
  std::promise<HttpOutcome> answered;
  auto future = answered.get_future();
  auto live = HttpExchange::start(pool, "127.0.0.1", port, raw_request("GET", kStatusPath), 2s,
                                  [&](HttpOutcome outcome){ answered.set_value(std::move(outcome)); });
  const bool in_time = future.wait_for(2s) == std::future_status::ready;
  bool ok = in_time && has_status(future.get(), 200);
  pool.join();
  ok &= !silent_called.load();
  return ok;
}

struct EngineFixture {
  TempWorkspace workspace;
  std::shared_ptr<SettingsManager> settings = std::make_shared<SettingsManager>();
  std::shared_ptr<FakeModelInventory> inventory;
  std::shared_ptr<FakeTranscriptionEngine> engine;
  std::unique_ptr<SharingEngine> sharing;

  EngineFixture(const std::string& name,
                std::string machine_id,
                std::vector<std::string> models,
                std::string text = "hello world")
    : workspace(name),
      inventory(std::make_shared<FakeModelInventory>(std::move(models))),
      engine(std::make_shared<FakeTranscriptionEngine>(0ms, std::move(text))) {
    settings->set_settings_path(workspace.root() / ".config" / "settings.json");
    settings->load();

    SharingEngine::Options options;
    options.workspace_root = workspace.root();
    options.start_health_monitor = false;
    options.reconcile_poll = 50ms;
    options.interfaces = loopback_only();

    SharingEngine::Collaborators collaborators;
    collaborators.engine = engine;
    collaborators.inventory = inventory;
    collaborators.firewall = std::make_shared<FakeFirewallProbe>(false);
    collaborators.machine_id = std::move(machine_id);
    sharing = std::make_unique<SharingEngine>(settings, options, collaborators);
  }
};

bool test_engine_restores_persisted_sharing(TestContext& ctx) {
  const uint16_t port = unused_port();
  EngineFixture fx("voiceshare-engine", "machine-a", {"base.en"});
  voiceshare::test::write_config_before_start(fx.workspace.root(), "settings.json", {
    {"sharing_enabled", true},
    {"sharing_port", port},
    {"sharing_password", "pw"},
    {"current_model", "base.en"}
  });
  fx.settings->load();
  ctx.logs.attach(*fx.sharing);
  fx.sharing->start();

  auto session = fx.sharing->sharing_status();
  bool ok = session.enabled && session.port == port &&
            session.password == std::optional<std::string>("pw") && session.model_name == "base.en";
  ok &= !fx.sharing->stop_sharing();
  ok &= voiceshare::test::read_config(fx.workspace.root(), "settings.json").value("sharing_enabled", true) == false;
  fx.sharing->stop();
  return ok;
}

bool test_engine_rejects_own_server(TestContext& ctx) {
  const uint16_t port = unused_port();
  EngineFixture fx("voiceshare-engine", "machine-a", {"base.en"});
  ctx.logs.attach(*fx.sharing);
  fx.sharing->start();
  if(!fx.sharing->start_sharing(port, std::nullopt, std::string("desk")).ok()) return false;

  auto saved = fx.sharing->add_connection("127.0.0.1", port, std::nullopt, std::nullopt);
  if(!saved.ok()) return false;
  bool ok = saved.value->cached_status == ConnectionStatus::SelfConnection;
  ok &= saved.value->display_name == std::optional<std::string>("desk");
  auto used = fx.sharing->use_remote(saved.value->id);
  ok &= used.code == ShareErrc::SelfConnectionDetected;
  ok &= !fx.sharing->active_selection().is_remote();
  ok &= fx.sharing->use_remote("conn_missing").code == ShareErrc::NotFound;

  auto stored = voiceshare::test::read_config(fx.workspace.root(), "connections.json");
  ok &= stored.is_object() && stored["connections"].size() == 1 &&
        stored["connections"][0].value("cached_status", "") == "self_connection";
  fx.sharing->stop();
  return ok;
}

bool test_engine_readd_keeps_self_connection(TestContext& ctx) {
  const uint16_t port = unused_port();
  EngineFixture fx("voiceshare-engine", "machine-a", {"base.en"});
  ctx.logs.attach(*fx.sharing);
  fx.sharing->start();
  if(!fx.sharing->start_sharing(port, std::nullopt, std::string("desk")).ok()) return false;

  auto first = fx.sharing->add_connection("127.0.0.1", port, std::nullopt, std::nullopt);
  if(!first.ok()) return false;
  bool ok = first.value->cached_status == ConnectionStatus::SelfConnection;
  ok &= !fx.sharing->stop_sharing();

  // The server is gone now; the endpoint is still this machine.
  auto again = fx.sharing->add_connection("127.0.0.1", port, std::nullopt, std::nullopt);
  ok &= again.ok() && again.value->id == first.value->id &&
        again.value->cached_status == ConnectionStatus::SelfConnection;
  ok &= fx.sharing->use_remote(first.value->id).code == ShareErrc::SelfConnectionDetected;

  auto renamed = fx.sharing->update_connection(first.value->id, "127.0.0.1", port,
                                               std::nullopt, std::string("mine"));
  ok &= renamed.ok() && renamed.value->cached_status == ConnectionStatus::SelfConnection;
  ok &= fx.sharing->use_remote(first.value->id).code == ShareErrc::SelfConnectionDetected;
  ok &= !fx.sharing->active_selection().is_remote();
  fx.sharing->stop();
  return ok;
}

bool test_engine_transcribes_through_remote(TestContext& ctx) {
  const uint16_t port = unused_port();
  EngineFixture host("voiceshare-host", "machine-a", {"small.en"}, "from the host");
  EngineFixture user("voiceshare-user", "machine-b", {"base.en"});
  ctx.logs.attach(*host.sharing, "host");
  ctx.logs.attach(*user.sharing, "user");
  host.sharing->start();
  user.sharing->start();
  if(!host.sharing->start_sharing(port, std::string("pw"), std::string("Host")).ok()) return false;

  auto saved = user.sharing->add_connection(" 127.0.0.1 ", port, std::string("pw"), std::nullopt);
  if(!saved.ok()) return false;
  bool ok = saved.value->cached_status == ConnectionStatus::Online &&
            saved.value->cached_model_name == std::optional<std::string>("small.en") &&
            saved.value->display_name == std::optional<std::string>("Host");
  ok &= !user.sharing->use_remote(saved.value->id);

  TranscriptionContext context;
  context.audio_duration_seconds = 2.0;
  auto remote = user.sharing->transcribe(kAudio, context);
  ok &= remote.ok() && remote.value->remote && remote.value->model_used == "small.en" &&
        remote.value->text == "from the host [small.en]" && remote.value->source == "Host";
  ok &= host.engine->call_count() == 1 && user.engine->call_count() == 0;

  ok &= !user.sharing->remove_connection(saved.value->id);
  ok &= !user.sharing->active_selection().is_remote();
  auto local = user.sharing->transcribe(kAudio, context);
  ok &= local.ok() && !local.value->remote && local.value->model_used == "base.en";

  user.sharing->stop();
  host.sharing->stop();
  return ok;
}

// Redirects std::cout into a buffer for the guard's lifetime.
class CoutCapture {
public:
  CoutCapture() : previous_(std::cout.rdbuf(buffer_.rdbuf())) {}
  ~CoutCapture() { std::cout.rdbuf(previous_); }
  std::string text() const { return buffer_.str(); }

private:
  std::ostringstream buffer_;
  std::streambuf* previous_;
};

bool test_cli_commands_drive_engine(TestContext& ctx) {
  const uint16_t port = unused_port();
  EngineFixture fx("voiceshare-cli", "machine-a", {"base.en", "small.en"});
  ctx.logs.attach(*fx.sharing);
  fx.sharing->start();

  CoutCapture out;
  fx.sharing->execute_command("model small.en");
  fx.sharing->execute_command("set port " + std::to_string(port));
  fx.sharing->execute_command("share start");
  const bool started = fx.sharing->sharing_status().enabled;
  const std::string model = fx.sharing->sharing_status().model_name;
  fx.sharing->execute_command("use conn_missing");
  fx.sharing->execute_command("model large-v3");
  fx.sharing->execute_command("share stop");
  const std::string text = out.text();

  int configured_port = 0;
  {
    std::lock_guard<std::mutex> lock(fx.sharing->settings_mutex());
    configured_port = fx.settings->get<int>("sharing_port");
  }
  bool ok = started && model == "small.en";
  ok &= fx.sharing->active_selection().local_model == "small.en";
  ok &= configured_port == port;
  ok &= !fx.sharing->sharing_status().enabled;
  ok &= text.find("Sharing: on, port " + std::to_string(port)) != std::string::npos;
  ok &= text.find("Error [not_found]") != std::string::npos;
  ok &= text.find("Sharing stopped.") != std::string::npos;
  fx.sharing->stop();
  return ok;
}

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

} // namespace

int main(int argc, char** argv) {
  bool verbose = (std::getenv("VOICESHARE_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  const bool suppress_logs = !(std::getenv("VOICESHARE_TEST_LOGS") != nullptr || verbose);
  if(suppress_logs) {
    set_log_passthrough(false);
  }
  LogCapture logs;
  TestContext ctx{logs, verbose};
  std::vector<TestCase> tests = {
    {"password_protects_every_endpoint", test_password_protects_every_endpoint},
    {"open_server_ignores_key", test_open_server_ignores_key},
    {"stop_is_idempotent", test_stop_is_idempotent},
    {"second_start_is_rejected", test_second_start_is_rejected},
    {"start_without_models_fails", test_start_without_models_fails},
    {"partial_bind_reports_each_interface", test_partial_bind_reports_each_interface},
    {"no_successful_bind_fails", test_no_successful_bind_fails},
    {"concurrent_requests_run_one_at_a_time", test_concurrent_requests_run_one_at_a_time},
    {"client_timeout_leaves_inference_running", test_client_timeout_leaves_inference_running},
    {"failed_inference_returns_500", test_failed_inference_returns_500},
    {"routes_and_validation", test_routes_and_validation},
    {"unreachable_server_reads_offline", test_unreachable_server_reads_offline},
    {"own_server_is_never_selectable", test_own_server_is_never_selectable},
    {"wrong_password_reads_auth_failed", test_wrong_password_reads_auth_failed},
    {"model_change_restarts_sharing", test_model_change_restarts_sharing},
    {"reconcile_thread_follows_selection", test_reconcile_thread_follows_selection},
    {"failed_restart_stops_sharing_once", test_failed_restart_stops_sharing_once},
    {"remote_selection_pauses_sharing", test_remote_selection_pauses_sharing},
    {"undownloaded_selection_is_not_shared", test_undownloaded_selection_is_not_shared},
    {"manual_stop_is_not_undone_by_reconcile", test_manual_stop_is_not_undone_by_reconcile},
    {"health_probes_run_concurrently", test_health_probes_run_concurrently},
    {"cancelled_exchange_frees_its_worker", test_cancelled_exchange_frees_its_worker},
    {"engine_restores_persisted_sharing", test_engine_restores_persisted_sharing},
    {"engine_rejects_own_server", test_engine_rejects_own_server},
    {"engine_readd_keeps_self_connection", test_engine_readd_keeps_self_connection},
    {"engine_transcribes_through_remote", test_engine_transcribes_through_remote},
    {"cli_commands_drive_engine", test_cli_commands_drive_engine}
  };

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " sharing tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    logs.detach_all();
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " sharing tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}
