// ==============================================================================
// scopelab_analyze - Command-line front end for the analysis engine
// ==============================================================================
// Runs one analysis method on a captured waveform stored as delimited text
// (the "y" column if a header names it, otherwise the last column) and prints
// the result.
//
// Usage:
//   scopelab_analyze <capture.csv> --fs <Hz> [--method <name>] [--preset <name>]
//                    [--set key=value]... [--second <capture.csv>]
//                    [--template <file>] [--verbose]
//
// Keys for --set: nfft seglen overlap hop pfa smooth_bins topk msc_thr k_tapers
// sk_thr qmin_ms qmax_ms cep_topk ar_order alpha_max db_floor auto_level
// level_span level_pct bico_nfft window n_harmonics include_dc thdn
// ==============================================================================

#include <scopelab/dsp/core/analysis_errors.h>
#include <scopelab/dsp/core/analysis_log.h>
#include <scopelab/dsp/primitives/template_loader.h>
#include <scopelab/dsp/systems/analysis_engine.h>
#include <scopelab/dsp/systems/analysis_presets.h>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

using namespace Scopelab::DSP;

namespace {

struct CommandLine {
    std::string inputPath;
    std::string secondPath;
    std::string method = "PSD+CFAR";
    std::string preset = kDefaultPresetName;
    std::vector<std::string> overrides;
    double sampleRate = 0.0;
    bool verbose = false;
};

void printUsage() {
    std::cerr << "usage: scopelab_analyze <capture.csv> --fs <Hz> [--method <name>]\n"
                 "                        [--preset <name>] [--set key=value]...\n"
                 "                        [--second <capture.csv>] [--template <file>] [--verbose]\n";
}

bool parseCommandLine(int argc, char* argv[], CommandLine& cmd) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool hasValue = i + 1 < argc;

        if (arg == "--fs" && hasValue) {
            cmd.sampleRate = std::strtod(argv[++i], nullptr);
        } else if (arg == "--method" && hasValue) {
            cmd.method = argv[++i];
        } else if (arg == "--preset" && hasValue) {
            cmd.preset = argv[++i];
        } else if (arg == "--set" && hasValue) {
            cmd.overrides.emplace_back(argv[++i]);
        } else if (arg == "--second" && hasValue) {
            cmd.secondPath = argv[++i];
        } else if (arg == "--template" && hasValue) {
            cmd.overrides.emplace_back(std::string("template=") + argv[++i]);
        } else if (arg == "--verbose") {
            cmd.verbose = true;
        } else if (!arg.empty() && arg[0] != '-' && cmd.inputPath.empty()) {
            cmd.inputPath = arg;
        } else {
            std::cerr << "unrecognized argument: " << arg << "\n";
            return false;
        }
    }
    return !cmd.inputPath.empty();
}

void printWarnings(const std::vector<std::string>& warnings) {
    for (const auto& w : warnings) std::printf("warning: %s\n", w.c_str());
}

void printHarmonics(const HarmonicResult& r) {
    std::printf("Harmonics  fs=%.6g Hz  N=%zu  window=%s\n", r.sampleRate, r.numSamples,
                r.window.c_str());
    std::printf("f1        %.6f Hz\n", r.fundamentalHz);
    std::printf("V1        %.6g Vrms\n", r.fundamentalRms);
    std::printf("THD       %.4f %% (%.2f dB)\n", 100.0 * r.thd, r.thdDb);
    if (r.thdN) std::printf("THD+N     %.4f %%\n", 100.0 * *r.thdN);
    if (r.sinadDb) std::printf("SINAD     %.2f dB\n", *r.sinadDb);
    if (r.snrDb) std::printf("SNR       %.2f dB\n", *r.snrDb);
    std::printf("Vrms      %.6g  crest %.4f  form %.4f  cycles %.1f\n", r.totalRms,
                r.crestFactor, r.formFactor, r.coherenceCycles);

    std::printf("\n  k  f (Hz)          Vrms           %%      phase\n");
    for (const auto& row : r.rows) {
        std::printf("%3d  %-14.6f  %-13.6g  %7.3f  %8.2f\n", row.order, row.frequencyHz,
                    row.magnitudeRms, row.percentOfFundamental, row.phaseDeg);
    }
    printWarnings(r.warnings);
}

void printDetector(const DetectorResult& r) {
    std::printf("%s  fs=%.6g Hz  N=%zu  %.3f s\n", r.methodName.c_str(), r.sampleRate,
                r.numSamples, r.elapsedSeconds);
    if (r.dfHz) std::printf("df        %.6g Hz\n", *r.dfHz);
    for (const auto& [key, value] : r.params.numeric) std::printf("  %s = %.6g\n", key.c_str(), value);
    for (const auto& [key, value] : r.params.text) std::printf("  %s = %s\n", key.c_str(), value.c_str());
    if (r.curve) std::printf("curve     %zu points (%s)\n", r.curve->x.size(), r.curve->yLabel.c_str());
    if (r.image) std::printf("image     %zu x %zu\n", r.image->rows, r.image->cols);

    std::printf("\n%zu detection(s)\n", r.detections.size());
    for (const auto& d : r.detections) {
        std::printf("  %-8s f0=%-12.6f %s=%-10.4g bw=%-10.4g", d.type.c_str(), d.f0Hz,
                    metricLabel(d.metricKind), d.metric, d.bandwidthHz);
        if (d.secondaryHz) std::printf(" f2=%.6f", *d.secondaryHz);
        if (!d.notes.empty()) std::printf(" %s", d.notes.c_str());
        std::printf("\n");
    }
    if (r.cancelled) std::printf("cancelled\n");
    printWarnings(r.warnings);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CommandLine cmd;
    if (!parseCommandLine(argc, argv, cmd)) {
        printUsage();
        return 2;
    }

    setLogLevel(cmd.verbose ? LogLevel::Debug : LogLevel::Warning);

    try {
        const AnalysisMethod method = parseAnalysisMethod(cmd.method);
        AnalysisParams params;
        applyPreset(params, method, cmd.preset);
        for (const auto& assignment : cmd.overrides) applyOverride(params, assignment);

        const std::vector<float> samples = loadTemplate(cmd.inputPath);

        if (method == AnalysisMethod::Coherence) {
            if (cmd.secondPath.empty()) {
                throw AnalysisError(ErrorKind::ChannelMismatch, "MSC needs --second <capture.csv>");
            }
            const std::vector<float> second = loadTemplate(cmd.secondPath);
            printDetector(analyzeTwoChannel(samples.data(), samples.size(), cmd.sampleRate,
                                            second.data(), second.size(), cmd.sampleRate,
                                            params));
            return 0;
        }

        const AnalysisResult result = analyze(samples, cmd.sampleRate, method, params);
        if (const auto* harmonics = std::get_if<HarmonicResult>(&result)) {
            printHarmonics(*harmonics);
        } else {
            printDetector(std::get<DetectorResult>(result));
        }
    } catch (const AnalysisError& e) {
        std::cerr << "error (" << errorKindName(e.kind()) << "): " << e.what() << "\n";
        return 1;
    }
    return 0;
}
