#ifndef TOOLHOST_HPP
#define TOOLHOST_HPP

// Main header that includes everything

#include <toolhost/environment.hpp>
#include <toolhost/errors.hpp>
#include <toolhost/launch.hpp>
#include <toolhost/options.hpp>
#include <toolhost/supervisor.hpp>
#include <toolhost/tools.hpp>
#include <toolhost/transport.hpp>
#include <toolhost/types.hpp>
#include <toolhost/version.hpp>

// Lower-level JSON-RPC framing and correlation, for callers driving a transport themselves
#include <toolhost/protocol/jsonrpc.hpp>

#endif // TOOLHOST_HPP
