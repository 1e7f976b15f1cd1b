#pragma once

// JSON-RPC 2.0 reserved error codes used on the wire.
namespace json_rpc {

inline constexpr int kParseError = -32700;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
inline constexpr int kInternalError = -32603;

// Echoed when a request id cannot be read.
inline constexpr int kFallbackId = 1;

inline constexpr char kVersion[] = "2.0";

} // namespace json_rpc

namespace mcp {

inline constexpr char kProtocolVersion[] = "2024-11-05";
inline constexpr char kServerName[] = "powershell-mcp-server";
inline constexpr char kServerVersion[] = "1.1.0";

} // namespace mcp
