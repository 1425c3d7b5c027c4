#pragma once

#include <clap/helpers/checking-level.hh>
#include <clap/helpers/misbehaviour-handler.hh>

#include <string>

namespace plugin_bridge {

// None: trust the peer completely
// Minimal: lifecycle ordering (init, activate, start_processing)
// Maximal: minimal plus thread affinity of every dispatched call
// The plugin side hands both knobs to clap-helpers as template arguments.
typedef ::clap::helpers::CheckingLevel checking_level;
typedef ::clap::helpers::MisbehaviourHandler misbehaviour_handler;

struct bridge_config
{
  checking_level checking = checking_level::Minimal;
  misbehaviour_handler misbehaviour = misbehaviour_handler::Ignore;

  bool checks_lifecycle() const { return checking != checking_level::None; }
  bool checks_threads() const { return checking == checking_level::Maximal; }
};

// host side counterpart of clap-helpers hostMisbehaving
void report_misbehaviour(bridge_config const& config, char const* func, std::string const& message);

}
