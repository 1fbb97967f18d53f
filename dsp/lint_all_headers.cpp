// ==============================================================================
// ScopelabDSP Lint Stub - Strict analysis of all public headers
// ==============================================================================
// This file exists solely to give clang-tidy a .cpp translation unit that
// includes every public DSP header, so header-only code is checked even when
// no test includes it directly.
//
// This file is NOT part of the ScopelabDSP library itself; it is compiled as a
// separate OBJECT library target (scopelab_lint_stub) for compile_commands.json.
// ==============================================================================

// Layer 0: Core
#include <scopelab/dsp/core/analysis_errors.h>
#include <scopelab/dsp/core/analysis_log.h>
#include <scopelab/dsp/core/analysis_params.h>
#include <scopelab/dsp/core/analysis_types.h>
#include <scopelab/dsp/core/cancellation.h>
#include <scopelab/dsp/core/math_constants.h>
#include <scopelab/dsp/core/numeric_guards.h>
#include <scopelab/dsp/core/statistics.h>
#include <scopelab/dsp/core/window_functions.h>

// Layer 1: Primitives
#include <scopelab/dsp/primitives/dpss.h>
#include <scopelab/dsp/primitives/fft.h>
#include <scopelab/dsp/primitives/fft_correlation.h>
#include <scopelab/dsp/primitives/levinson.h>
#include <scopelab/dsp/primitives/peak_refiner.h>
#include <scopelab/dsp/primitives/template_loader.h>

// Layer 2: Processors
#include <scopelab/dsp/processors/ar_spectrum_detector.h>
#include <scopelab/dsp/processors/bicoherence.h>
#include <scopelab/dsp/processors/cepstrum_detector.h>
#include <scopelab/dsp/processors/coherence_detector.h>
#include <scopelab/dsp/processors/cyclostationary_analyzer.h>
#include <scopelab/dsp/processors/harmonic_analyzer.h>
#include <scopelab/dsp/processors/line_detection.h>
#include <scopelab/dsp/processors/matched_filter_detector.h>
#include <scopelab/dsp/processors/multitaper_detector.h>
#include <scopelab/dsp/processors/psd_cfar_detector.h>
#include <scopelab/dsp/processors/spectral_estimator.h>
#include <scopelab/dsp/processors/spectral_kurtosis_detector.h>
#include <scopelab/dsp/processors/spectrogram_detector.h>

// Layer 3: Systems
#include <scopelab/dsp/systems/analysis_engine.h>
#include <scopelab/dsp/systems/analysis_presets.h>
