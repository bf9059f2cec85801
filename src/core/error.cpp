#include "trellis/error.hpp"

namespace trellis::core {

auto to_string(error_code code) -> std::string_view {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::io_eof: return "io_eof";
    case error_code::io_error: return "io_error";
    case error_code::config_invalid: return "config_invalid";
    case error_code::legacy_layout: return "legacy_layout";
    case error_code::data_integrity: return "data_integrity";
    case error_code::store_mismatch: return "store_mismatch";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::resource_exhausted: return "resource_exhausted";
    case error_code::out_of_memory: return "out_of_memory";
    case error_code::not_found: return "not_found";
    case error_code::missing_files: return "missing_files";
    case error_code::logs_missing: return "logs_missing";
    case error_code::unavailable: return "unavailable";
    case error_code::cancelled: return "cancelled";
    case error_code::start_aborted: return "start_aborted";
    case error_code::timed_out: return "timed_out";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::not_initialized: return "not_initialized";
    case error_code::out_of_range: return "out_of_range";
    case error_code::unsupported: return "unsupported";
  }
  return "unknown";
}

auto describe(const error& e) -> std::string {
  std::string out;
  if (!e.component.empty()) { out += e.component; out += ": "; }
  out += e.message;
  out += " (";
  out += to_string(e.code);
  out += ")";
  for (const auto& s : e.suppressed) {
    out += "; suppressed: ";
    out += describe(s);
  }
  return out;
}

} // namespace trellis::core
