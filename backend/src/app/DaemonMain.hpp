#pragma once

#include <future>

namespace pb::rpc
{
struct ConnectionInfo;
}

namespace pb::app
{

// Runs the PutBridge daemon (RPC server + janitor) until SIGINT/SIGTERM.
// If ready_promise is provided, it is fulfilled once the RPC listener has
// its final port.
int daemon_main(int argc, char *argv[],
                std::promise<pb::rpc::ConnectionInfo> *ready_promise);

} // namespace pb::app
