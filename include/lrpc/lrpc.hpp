#pragma once

/// Umbrella header for the lrpcxx RPC library.

#include "version.hpp"
#include "error.hpp"
#include "context.hpp"
#include "result.hpp"
#include "call.hpp"
#include "handler.hpp"
#include "http/http_handler.hpp"
#include "http/http_server.hpp"
#include "json2/json2.hpp"
#include "json2/codec.hpp"
#include "json2/client.hpp"
