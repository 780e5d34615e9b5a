// file      : libxboot/orchestrator.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBXBOOT_ORCHESTRATOR_HXX
#define LIBXBOOT_ORCHESTRATOR_HXX

#include <libxboot/types.hxx>
#include <libxboot/utility.hxx>

#include <libxboot/context.hxx>
#include <libxboot/artifact.hxx>
#include <libxboot/toolchain.hxx>
#include <libxboot/environment.hxx>

#include <libxboot/export.hxx>

namespace xboot
{
  // Cross-compilation strategies.
  //
  // The fast strategy uses an existing (native) binary of the tool from the
  // build prefix to generate the install artifacts and to install the
  // result. The bootstrap strategy uses the underlying build system instead
  // and installs manually. Both build the bootstrap executable with the
  // native compiler, swap the toolchain to the cross one, and run the
  // bootstrap executable to produce the cross-compiled binary.
  //
  enum class strategy
  {
    fast,
    bootstrap
  };

  LIBXBOOT_SYMEXPORT string
  to_string (strategy);

  inline ostream&
  operator<< (ostream& o, strategy s) {return o << to_string (s);}

  enum class phase
  {
    idle,
    artifact_generation, // 1
    bootstrap_build,     // 2
    toolchain_swap,      // 3
    cross_build,         // 4
    reassembly,          // 5
    done
  };

  // Return the phase description, for example, "building bootstrap tool".
  //
  LIBXBOOT_SYMEXPORT string
  to_string (phase);

  // Phase number (1-5) or 0 for idle/done.
  //
  inline size_t
  phase_number (phase p)
  {
    return p == phase::done ? 0 : static_cast<size_t> (p);
  }

  // State of a single orchestration attempt.
  //
  struct attempt
  {
    xboot::strategy strategy;
    xboot::phase    phase = xboot::phase::idle;

    // Environment overrides accumulated by the phases.
    //
    environment env;

    // Saved artifacts (set after phase 1).
    //
    optional<artifact_tree> snapshot;

    // Swaps performed in phase 3, in order.
    //
    swap_token swaps;

    // Version of the fast path tool as reported in phase 1.
    //
    string tool_version;

    attempt (xboot::strategy s, environment e)
        : strategy (s), env (move (e)) {}
  };

  // Remove the working state of any attempt: the _boot/ and _build/
  // directories, the artifacts snapshot, the bootstrap executable, and the
  // saved install metadata. Succeed if there is nothing to remove.
  //
  LIBXBOOT_SYMEXPORT void
  clean_working_state (const build_context&);

  // Return the fast path tool path (<build-prefix>/bin/<package>).
  //
  LIBXBOOT_SYMEXPORT path
  fast_path_tool (const build_context&);

  // Run all the phases of the attempt's strategy, installing the result into
  // the context's install prefix. Issue diagnostics and throw failed if any
  // phase fails. For the fast strategy the diagnostics is issued as
  // warnings.
  //
  LIBXBOOT_SYMEXPORT void
  run_strategy (const build_context&, attempt&);

  // Cross-compile and install the package. Try the fast strategy if enabled
  // and the fast path tool is available, falling back to the bootstrap
  // strategy (after cleaning the working state) if it fails. Return the
  // strategy that succeeded and fail if the bootstrap strategy fails.
  //
  LIBXBOOT_SYMEXPORT strategy
  cross_compile (const build_context&,
                 const environment&,
                 bool fast_path = true);

  // Native build: build the release target and install with the underlying
  // build system.
  //
  LIBXBOOT_SYMEXPORT void
  native_build (const build_context&, const environment&);
}

#endif // LIBXBOOT_ORCHESTRATOR_HXX
