#pragma once

// mwclient: RPC client for the storage middleware over `midclt` on a
// secure shell or a persistent JSON-RPC websocket.

#include "client.hpp"
#include "context.hpp"
#include "errors.hpp"
#include "job.hpp"
#include "job_poller.hpp"
#include "log.hpp"
#include "net.hpp"
#include "rate_limited_transport.hpp"
#include "rate_limiter.hpp"
#include "retry.hpp"
#include "shell.hpp"
#include "socket_transport.hpp"
#include "ssh_session.hpp"
#include "ssh_transport.hpp"
#include "sync.hpp"
#include "transport.hpp"
#include "version.hpp"
#include "websocket.hpp"
