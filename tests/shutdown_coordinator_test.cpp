#include "shutdown_coordinator.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <stdexcept>
#include <thread>

#include "builtin_generator.hpp"
#include "certificate_provisioner.hpp"
#include "http_server.hpp"
#include "test_helpers.hpp"
#include "tls_context.hpp"

namespace ds {

using namespace std::chrono_literals;

TEST(ShutdownCoordinator, StartsRunning) {
  ShutdownCoordinator coordinator([] {});
  EXPECT_EQ(coordinator.state(), ShutdownCoordinator::State::Running);
  EXPECT_FALSE(coordinator.wait_until_stopped(10ms));
  EXPECT_STREQ(to_string(coordinator.state()), "running");
}

TEST(ShutdownCoordinator, StopRunsExactlyOnce) {
  std::atomic<int> calls{0};
  ShutdownCoordinator coordinator([&] { ++calls; });

  EXPECT_TRUE(coordinator.request_shutdown("first"));
  EXPECT_FALSE(coordinator.request_shutdown("second"));
  ASSERT_TRUE(coordinator.wait_until_stopped(2s));
  EXPECT_FALSE(coordinator.request_shutdown("third"));

  EXPECT_EQ(calls.load(), 1);
  EXPECT_EQ(coordinator.state(), ShutdownCoordinator::State::Stopped);
}

TEST(ShutdownCoordinator, ShuttingDownWhileStopRuns) {
  std::atomic<bool> release{false};
  ShutdownCoordinator coordinator([&] {
    while (!release.load()) {
      std::this_thread::sleep_for(5ms);
    }
  });

  // request_shutdown returns before the stop function finishes
  ASSERT_TRUE(coordinator.request_shutdown("test"));
  EXPECT_EQ(coordinator.state(), ShutdownCoordinator::State::ShuttingDown);
  EXPECT_FALSE(coordinator.wait_until_stopped(50ms));

  release.store(true);
  EXPECT_TRUE(coordinator.wait_until_stopped(2s));
  EXPECT_STREQ(to_string(coordinator.state()), "stopped");
}

TEST(ShutdownCoordinator, ThrowingStopStillReachesStopped) {
  ShutdownCoordinator coordinator([] { throw std::runtime_error("boom"); });
  ASSERT_TRUE(coordinator.request_shutdown("test"));
  EXPECT_TRUE(coordinator.wait_until_stopped(2s));
}

TEST(ShutdownCoordinator, SignalTriggersStop) {
  std::atomic<int> calls{0};
  ShutdownCoordinator coordinator([&] { ++calls; });
  coordinator.install();

  std::raise(SIGINT);
  ASSERT_TRUE(coordinator.wait_until_stopped(2s));

  // Repeated signals are absorbed rather than killing the process
  std::raise(SIGTERM);
  std::raise(SIGINT);
  std::this_thread::sleep_for(50ms);

  coordinator.uninstall();
  EXPECT_EQ(calls.load(), 1);
}

TEST(ShutdownCoordinator, OnlyOneInstalledAtATime) {
  ShutdownCoordinator first([] {});
  ShutdownCoordinator second([] {});
  first.install();
  EXPECT_THROW(second.install(), std::runtime_error);

  first.uninstall();
  EXPECT_NO_THROW(second.install());
  second.uninstall();
}

TEST(ShutdownCoordinator, StopsRunningServer) {
  test::TempDir root;
  BuiltinGenerator generator;
  CertificateProvisioner provisioner(generator);
  provisioner.ensure(root.file("cert.pem"), root.file("key.pem"), "127.0.0.1");
  test::writeFile(root.file("index.html"), "ok");

  ServerConfig config;
  config.host = "127.0.0.1";
  config.port = 0;
  config.root = root.path().string();
  config.poll_interval_ms = 200;
  HttpServer server(config, create_server_context(root.file("cert.pem"), root.file("key.pem")));
  server.listen();

  ShutdownCoordinator coordinator([&server] { server.stop(); });
  coordinator.install();

  std::thread serveThread([&server] { server.serve(); });
  {
    test::TlsClient client(server.port());
    EXPECT_EQ(client.get("/index.html").body, "ok");
  }

  auto begin = std::chrono::steady_clock::now();
  std::raise(SIGTERM);
  serveThread.join();
  EXPECT_TRUE(coordinator.wait_until_stopped(2s));
  EXPECT_LT(std::chrono::steady_clock::now() - begin, 2s);
  EXPECT_FALSE(server.is_running());

  coordinator.uninstall();
}

}  // namespace ds
