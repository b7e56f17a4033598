/**
 * Gene Score - Main Entry Point
 *
 * Batch driver: aggregate evidence layers into composite scores, run QC,
 * validate against positive/negative control genes, measure weight
 * sensitivity and write the validation report.
 */

#include "gene_scoring.hpp"
#include "evidence_store.hpp"
#include "quality_control.hpp"
#include "control_validation.hpp"
#include "sensitivity.hpp"
#include "validation_report.hpp"
#include "tiering.hpp"
#include "file_parsers.hpp"
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

void print_usage(const char* program_name) {
    std::cout << "Gene Score - Multi-Evidence Scoring & Validation\n"
              << "================================================\n\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Evidence Tables:\n"
              << "  --universe FILE         Gene universe table (gene_id, gene_symbol)\n"
              << "  --layer NAME:FILE       Evidence layer table (repeat for each layer)\n"
              << "                          NAME: gnomad, expression, annotation,\n"
              << "                                localization, animal_model, literature\n"
              << "                          Tables may be gzip compressed (.gz)\n\n"
              << "Scoring:\n"
              << "  --weights SPEC          Layer weights, e.g. gnomad=0.3,expression=0.1\n"
              << "                          Unlisted layers keep their default; total must be 1.0\n\n"
              << "Sensitivity Analysis:\n"
              << "  --deltas SPEC           Weight perturbations (default: -0.10,-0.05,0.05,0.10)\n"
              << "  --top-n N               Genes compared per perturbation (default: 100)\n"
              << "  --skip-sensitivity      Do not run sensitivity analysis\n\n"
              << "Reference Genes:\n"
              << "  --known-genes FILE      Positive controls (gene_symbol[, source, confidence])\n"
              << "  --housekeeping-genes FILE\n"
              << "                          Negative controls (gene_symbol[, source, confidence])\n"
              << "                          Built-in lists are used when not given\n\n"
              << "Output Options:\n"
              << "  --report FILE           Write markdown validation report\n"
              << "  --strict                Exit with status 2 unless all validations pass\n\n"
              << "Other Options:\n"
              << "  -h, --help              Show this help message\n"
              << "  --debug                 Enable debug logging\n\n"
              << "Examples:\n"
              << "  " << program_name << " --universe genes.tsv \\\n"
              << "      --layer gnomad:gnomad.tsv.gz --layer expression:expression.tsv \\\n"
              << "      --layer annotation:annotation.tsv --layer localization:localization.tsv \\\n"
              << "      --layer animal_model:animal.tsv --layer literature:literature.tsv \\\n"
              << "      --report validation/validation_report.md\n"
              << std::endl;
}

// Parse layer argument: NAME:FILE
bool parse_layer_arg(const std::string& arg, std::string& name, std::string& path) {
    size_t colon = arg.find(':');
    if (colon == std::string::npos) return false;
    name = arg.substr(0, colon);
    path = arg.substr(colon + 1);
    return !name.empty() && !path.empty();
}

bool parse_count(const std::string& text, size_t& value) {
    const char* begin = text.c_str();
    char* end = nullptr;
    unsigned long parsed = std::strtoul(begin, &end, 10);
    if (end == begin || *end != '\0' || text[0] == '-' || parsed == 0) return false;
    value = static_cast<size_t>(parsed);
    return true;
}

int main(int argc, char* argv[]) {
    std::string universe_path;
    std::vector<std::pair<std::string, std::string>> layer_tables;  // (layer, path)
    std::string weights_spec;
    std::string deltas_spec;
    std::string report_path;
    std::string known_genes_path;
    std::string housekeeping_genes_path;
    size_t top_n = 0;
    bool skip_sensitivity = false;
    bool strict = false;
    bool debug = false;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--universe" && i + 1 < argc) {
            universe_path = argv[++i];
        } else if (arg == "--layer" && i + 1 < argc) {
            std::string layer_str = argv[++i];
            std::string name, path;
            if (parse_layer_arg(layer_str, name, path)) {
                layer_tables.emplace_back(name, path);
            } else {
                std::cerr << "Error: Invalid layer format: " << layer_str << "\n"
                          << "Expected: NAME:FILE" << std::endl;
                return 1;
            }
        } else if (arg == "--weights" && i + 1 < argc) {
            weights_spec = argv[++i];
        } else if (arg == "--deltas" && i + 1 < argc) {
            deltas_spec = argv[++i];
        } else if (arg == "--top-n" && i + 1 < argc) {
            std::string value = argv[++i];
            if (!parse_count(value, top_n)) {
                std::cerr << "Error: --top-n expects a positive integer, got: " << value << std::endl;
                return 1;
            }
        } else if (arg == "--skip-sensitivity") {
            skip_sensitivity = true;
        } else if (arg == "--report" && i + 1 < argc) {
            report_path = argv[++i];
        } else if (arg == "--known-genes" && i + 1 < argc) {
            known_genes_path = argv[++i];
        } else if (arg == "--housekeeping-genes" && i + 1 < argc) {
            housekeeping_genes_path = argv[++i];
        } else if (arg == "--strict") {
            strict = true;
        } else if (arg == "--debug") {
            debug = true;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    // Set log level
    if (debug) {
        genescore::set_log_level(genescore::LogLevel::DEBUG);
    }

    // Validate required arguments
    if (universe_path.empty()) {
        std::cerr << "Error: --universe is required.\n" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    try {
        // Configuration errors surface before any table is read
        genescore::ScoringWeights weights = weights_spec.empty()
            ? genescore::ScoringWeights::defaults()
            : genescore::parse_weights(weights_spec);

        genescore::SensitivityConfig sensitivity_config;
        if (!deltas_spec.empty()) sensitivity_config.deltas = genescore::parse_deltas(deltas_spec);
        if (top_n > 0) sensitivity_config.top_n = top_n;

        genescore::TsvEvidenceStore store(universe_path);
        for (const auto& [layer, path] : layer_tables) {
            store.add_layer_table(layer, path);
        }
        if (!known_genes_path.empty()) {
            store.add_reference_table(genescore::KNOWN_GENES_SET, known_genes_path);
        }
        if (!housekeeping_genes_path.empty()) {
            store.add_reference_table(genescore::HOUSEKEEPING_GENES_SET, housekeeping_genes_path);
        }

        // Aggregate
        genescore::ScoredGeneSet scored = genescore::compute_composite_scores(store, weights);
        std::cout << "\nEvidence store: " << store.get_stats() << std::endl;
        std::cout << "Scored genes: " << scored.scored_count() << "/" << scored.size() << std::endl;

        auto tiers = genescore::count_tiers(genescore::assign_tiers(scored));
        std::cout << "Confidence tiers:";
        for (const auto& [tier, count] : tiers) {
            std::cout << " " << genescore::confidence_tier_to_string(tier) << "=" << count;
        }
        std::cout << "\n" << std::endl;

        // Quality control
        genescore::QcReport qc = genescore::run_qc_checks(scored);
        std::cout << genescore::format_qc_report(qc) << std::endl;

        // Controls
        genescore::ValidationConfig validation_config;
        auto known = genescore::load_reference_set(store, genescore::KNOWN_GENES_SET);
        auto housekeeping = genescore::load_reference_set(store, genescore::HOUSEKEEPING_GENES_SET);

        auto positive = genescore::validate_positive_controls(scored, known, validation_config);
        std::cout << genescore::format_positive_control_report(positive) << std::endl;

        auto negative = genescore::validate_negative_controls(scored, housekeeping, validation_config);
        std::cout << genescore::format_negative_control_report(negative) << std::endl;

        // Sensitivity
        std::unique_ptr<genescore::SensitivityResult> sensitivity;
        genescore::SensitivitySummary summary = genescore::skipped_sensitivity_summary(
            "sensitivity analysis disabled (--skip-sensitivity)");
        if (!skip_sensitivity) {
            sensitivity = std::make_unique<genescore::SensitivityResult>(
                genescore::run_sensitivity_analysis(store, weights, sensitivity_config));
            summary = genescore::summarize_sensitivity(*sensitivity);
            std::cout << genescore::format_sensitivity_report(*sensitivity, summary) << std::endl;
        }

        // Report
        genescore::OverallStatus status =
            genescore::determine_overall_status(positive, negative, summary);

        if (!report_path.empty()) {
            std::string report = genescore::generate_comprehensive_validation_report(
                positive, negative, sensitivity.get(), summary);
            genescore::save_validation_report(report, report_path);
            std::cout << "Validation report saved to: " << report_path << std::endl;
        }

        std::cout << "\nOverall: " << genescore::overall_status_to_string(status) << "\n"
                  << genescore::synthesize_verdict(status) << std::endl;

        if (strict && status != genescore::OverallStatus::ALL_PASSED) {
            return 2;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
