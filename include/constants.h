#pragma once

#include <cstddef>  // for size_t

namespace neurax {

// Crypto parameters
constexpr int RSA_KEY_BITS = 2048;                               // Per-session keypair
constexpr size_t SESSION_KEY_BYTES = 32;                         // AES-256
constexpr size_t GCM_NONCE_BYTES = 12;                           // 96-bit nonce
constexpr size_t GCM_TAG_BYTES = 16;                             // 128-bit tag

// Memory limits
constexpr size_t STANDARD_MEMORY_LIMIT_BYTES = 1024ULL * 1024 * 1024;  // 1GB
constexpr size_t EXTENDED_MEMORY_LIMIT_BYTES = 2048ULL * 1024 * 1024;  // 2GB
constexpr size_t MAX_OUTPUT_SIZE = 10 * 1024 * 1024;             // 10MB per stream

// Time limits
constexpr int STANDARD_TIMEOUT_SECONDS = 30;
constexpr int EXTENDED_TIMEOUT_SECONDS = 300;                    // 5 minutes
constexpr int SUPERVISOR_GRACE_SECONDS = 5;                      // Outer kill after timeout + grace
constexpr int RUNTIME_PROBE_TIMEOUT_SECONDS = 5;

// Process limits
constexpr int SANDBOX_CPU_SHARES = 1;                            // At most one CPU
constexpr int MAX_OPEN_FILES = 1024;                             // File descriptors per task
constexpr int MAX_PROCESSES_PER_TASK = 64;                       // Host fallback only

// Session timing
constexpr int READY_TIMEOUT_SECONDS = 30;                        // Client readiness wait
constexpr int RESULT_TIMEOUT_SECONDS = 60;                       // Client result wait
constexpr int READY_POLL_INTERVAL_MS = 100;
constexpr int NODE_SESSION_IDLE_SECONDS = 60;                    // Node gives up on a silent peer
constexpr int SESSION_SWEEP_INTERVAL_MS = 1000;

// Relay reconnect policy
constexpr int INITIAL_CONNECT_ATTEMPTS = 5;
constexpr int BACKOFF_BASE_SECONDS = 5;
constexpr int BACKOFF_CAP_SECONDS = 30;
constexpr int RELAY_CONNECT_TIMEOUT_SECONDS = 10;

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;                        // Read buffer size
constexpr size_t MAX_RELAY_LINE = 64 * 1024 * 1024;              // Largest relay frame

// Network
constexpr int DEFAULT_RELAY_PORT = 10000;

} // namespace neurax
