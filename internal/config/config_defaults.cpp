#include "config_defaults.hpp"

namespace ito::config {

void ApplyDefaults(ito::runtime::config::RuntimeConfig* config) {
  auto* audit = config->mutable_audit();
  if (!audit->has_enabled()) {
    audit->set_enabled(true);
  }
  if (audit->state_dir().empty()) {
    audit->set_state_dir(kDefaultStateDir);
  }
  if (audit->log_relative_path().empty()) {
    audit->set_log_relative_path(kDefaultLogRelativePath);
  }
  if (!audit->has_fail_on_append_error()) {
    audit->set_fail_on_append_error(true);
  }

  auto* stream = config->mutable_stream();
  if (stream->poll_interval_ms() == 0) {
    stream->set_poll_interval_ms(kDefaultPollIntervalMs);
  }
  if (stream->last() == 0) {
    stream->set_last(kDefaultStreamLast);
  }
}

ito::runtime::config::RuntimeConfig DefaultConfig() {
  ito::runtime::config::RuntimeConfig config;
  ApplyDefaults(&config);
  return config;
}

} // namespace ito::config
