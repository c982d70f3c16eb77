#pragma once

//
// relay umbrella header
//
// Usage:
//   #include <relay.hpp>
//
// This pulls in the main building blocks:
//
//   - relay::Config               → typed configuration (from vix::config::Config)
//   - relay::Message / protocol   → JSON wire format and timestamps
//   - relay::HttpFront            → page server + POST /message endpoint
//   - relay::SocketSender         → one-shot delivery client
//   - relay::SocketListener       → delivery receiver, persists documents
//   - relay::IDocumentStore       → abstract storage sink
//   - relay::SqliteDocumentStore  → SQLite + WAL implementation
//   - relay::Supervisor           → runs the units side by side
//

#include <relay/config.hpp>
#include <relay/protocol.hpp>
#include <relay/form.hpp>
#include <relay/static_content.hpp>
#include <relay/tcp_server.hpp>
#include <relay/socket_client.hpp>
#include <relay/socket_listener.hpp>
#include <relay/http_front.hpp>
#include <relay/DocumentStore.hpp>
#include <relay/SqliteDocumentStore.hpp>
#include <relay/supervisor.hpp>
#include <relay/units.hpp>
