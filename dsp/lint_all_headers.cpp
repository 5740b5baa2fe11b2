// ==============================================================================
// PhasorDSP Lint Stub - Compiles every public header standalone
// ==============================================================================
// This file gives static analysis a .cpp translation unit that includes every
// public DSP header, and catches headers that are missing their own includes.
//
// This file is NOT part of the PhasorDSP library itself; it is compiled as a
// separate OBJECT library target (phasor_dsp_lint) for compile_commands.json.
// ==============================================================================

// Layer 0: Core
#include <phasor/dsp/core/db_utils.h>
#include <phasor/dsp/core/detector_config.h>
#include <phasor/dsp/core/detector_types.h>
#include <phasor/dsp/core/filter_design.h>
#include <phasor/dsp/core/logging.h>
#include <phasor/dsp/core/math_constants.h>
#include <phasor/dsp/core/phase_utils.h>

// Layer 1: Primitives
#include <phasor/dsp/primitives/biquad.h>
#include <phasor/dsp/primitives/fft.h>
#include <phasor/dsp/primitives/phase_tracker.h>
#include <phasor/dsp/primitives/sample_window.h>
#include <phasor/dsp/primitives/trigger_policy.h>

// Layer 2: Processors
#include <phasor/dsp/processors/band_filter.h>
#include <phasor/dsp/processors/hilbert_phase_estimator.h>
#include <phasor/dsp/processors/phase_estimator.h>
#include <phasor/dsp/processors/phase_mapping_estimator.h>

// Layer 3: Systems
#include <phasor/dsp/systems/i_sample_source.h>
#include <phasor/dsp/systems/i_trigger_sink.h>
#include <phasor/dsp/systems/phase_detector.h>
