/** LICENSE TEMPLATE */
// cdpr
#include <configuration/command_line.h>
#include <configuration/config.h>
#include <events/event_dispatcher.h>
#include <interface/cdp/domain_controllers.h>
#include <interface/cdp/execution_state.h>
#include <interface/cdp/protocol_relay.h>
#include <interface/cdp/proxy_server.h>
#include <interface/cdp/request_correlator.h>
#include <interface/cdp/websocket_upstream.h>
#include <interface/http/http_server.h>
#include <interface/http/session_api.h>
#include <session/session_registry.h>
#include <session/workspace_guard.h>
#include <supervisor/process_supervisor.h>
#include <utils/logger.h>
#include <utils/reactor.h>

// fmt
#include <fmt/core.h>

// boost
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>

// stdlib
#include <cstdlib>
#include <span>

// system
#include <csignal>

int
main(int argc, const char **argv)
{
  using cdpr::logging::Logger;
  namespace cdp = cdpr::cdp;

  cdpr::cfg::CommandLineRegistry parser;
  const auto config = cdpr::cfg::RelayConfiguration::ConfigureWithParser(parser);
  const auto parsed = parser.Parse(argc, argv);
  if (!parsed.mErrors.empty()) {
    for (const auto &error : parsed.mErrors) {
      fmt::print(stderr, "{}\n", error);
    }
    fmt::print(stderr, "Run 'cdpr --help' for the list of options.\n");
    return EXIT_FAILURE;
  }
  if (parsed.mExitRequested) {
    return EXIT_SUCCESS;
  }

  Logger::ConfigureLogging(config->mLogDirectory, config->mLogChannels);
  DBGLOG(core, "cdpr CLI Arguments");
  for (const auto arg : std::span{ argv, static_cast<size_t>(argc) }.subspan(1)) {
    DBGLOG(core, "{}", arg);
  }

  // The proxy and API sockets may outlive their peers.
  signal(SIGPIPE, SIG_IGN);

  cdpr::Reactor reactor{ "cdpr-reactor" };
  auto &context = reactor.Context();

  cdpr::EventDispatcher dispatcher;
  cdp::RequestCorrelator correlator{ context, config->CommandTimeout() };
  cdp::ProtocolRelay relay{ context, dispatcher, correlator, &cdp::WebSocketUpstream::Create };
  cdp::ExecutionStateMachine stateMachine{ dispatcher };
  cdp::DomainControllers domains{ correlator, dispatcher, stateMachine };

  cdpr::ProcessSupervisor supervisor{ context,
    cdpr::SupervisorSettings{
      .mExecutable = config->mDebuggeeExecutable, .mKillGrace = config->KillGrace(), .mEchoOutput = true } };
  const cdpr::WorkspaceGuard workspace{ config->mWorkspaceRoot };
  cdpr::SessionRegistry registry{ context,
    workspace,
    supervisor,
    relay,
    domains,
    stateMachine,
    cdpr::SessionSettings{ .mInspectPort = config->mInspectPort,
      .mInspectHost = config->mInspectHost,
      .mProxyPort = config->mProxyPort,
      .mBreakOnStart = config->mBreakOnStart,
      .mHandshakeTimeout = config->HandshakeTimeout() } };

  cdpr::http::SessionApi api{ registry };
  cdpr::http::HttpServer apiServer{ context, api };
  cdp::ProxyServer proxyServer{ context, relay };

  if (auto listening = proxyServer.Listen(config->mBindAddress, config->mProxyPort); !listening) {
    fmt::print(stderr, "{}\n", listening.error());
    return EXIT_FAILURE;
  }
  if (auto listening = apiServer.Listen(config->mBindAddress, config->mApiPort); !listening) {
    fmt::print(stderr, "{}\n", listening.error());
    return EXIT_FAILURE;
  }

  boost::asio::signal_set shutdownSignals{ context, SIGINT, SIGTERM };
  shutdownSignals.async_wait([&](const boost::system::error_code &ec, int signo) {
    if (ec) {
      return;
    }
    DBGLOG(core, "received signal {}, shutting down", signo);
    apiServer.Stop();
    proxyServer.Stop();
    registry.Stop(std::nullopt, [&](cdpr::RelayResult<cdpr::DebugSession> stopped) {
      if (stopped) {
        DBGLOG(core, "stopped {}", stopped->mSessionId);
      }
      relay.CloseClients("Relay shutting down");
      // Lets the close frames go out before the reactor stops.
      boost::asio::post(context, [&reactor]() { reactor.Stop(); });
    });
  });

  fmt::print("cdpr: workspace {}\n", workspace.Root().c_str());
  fmt::print("cdpr: session API on http://{}:{}/debug/session\n", config->mBindAddress, apiServer.Port());
  fmt::print("cdpr: DevTools proxy on ws://{}:{}\n", config->mBindAddress, proxyServer.Port());

  reactor.Start();
  reactor.Join();

  DBGLOG(core, "Exited...");
  return EXIT_SUCCESS;
}
