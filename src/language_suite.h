//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "build_pipeline.h"
#include "exec_core.h"
#include "phase.h"
#include "sandbox.h"
#include "settings.h"
#include "supervisor.h"
#include "workspace.h"

namespace runbox {

struct prepared_run_t {
    launch_conf_t launch;
    watch_conf_t watch;
};

// How one language is laid out, built and started
class LanguageSuite {
  public:
    LanguageSuite(language_t lang, lang_conf_t conf) : lang_(lang), conf_(std::move(conf)) {}
    virtual ~LanguageSuite() = default;
    LanguageSuite(const LanguageSuite &) = delete;
    LanguageSuite &operator=(const LanguageSuite &) = delete;

    language_t language() const { return lang_; }
    const lang_conf_t &conf() const { return conf_; }
    // Whether results carry a meaningful compileError
    virtual bool compiled() const { return false; }

    phase_result_t detect(const std::vector<source_file_t> &files,
                          const std::optional<std::string> &entry_file) const {
        return detect_phase(lang_, files, entry_file);
    }

    // Launch settings shared by every step of a request in `ws`
    launch_conf_t base_launch(const Workspace &ws) const;

    // Builds whatever must exist before the program starts. Phases built
    // together with the run report nothing to do.
    virtual build_outcome_t build(const phase_info_t &info, const std::vector<source_file_t> &files,
                                  BuildPipeline &pipeline, const launch_conf_t &base) const;

    virtual prepared_run_t prepare_run(const phase_info_t &info, const launch_conf_t &base,
                                       const detection_conf_t &det) const;

  protected:
    language_t lang_;
    lang_conf_t conf_;

    watch_conf_t base_watch(const detection_conf_t &det) const;
    prepared_run_t make_run(std::vector<std::string> argv, const launch_conf_t &base,
                            const detection_conf_t &det) const;
};

class InterpretedSuite : public LanguageSuite {
  public:
    using LanguageSuite::LanguageSuite;
};

class JavaSuite : public LanguageSuite {
  public:
    using LanguageSuite::LanguageSuite;

    bool compiled() const override { return true; }
    build_outcome_t build(const phase_info_t &info, const std::vector<source_file_t> &files,
                          BuildPipeline &pipeline, const launch_conf_t &base) const override;
    prepared_run_t prepare_run(const phase_info_t &info, const launch_conf_t &base,
                               const detection_conf_t &det) const override;

  private:
    // Classes go to the scratch directory unless compiled in place
    bool separate_outdir(const phase_info_t &info) const;
};

class CSuite : public LanguageSuite {
  public:
    using LanguageSuite::LanguageSuite;

    bool compiled() const override { return true; }
    build_outcome_t build(const phase_info_t &info, const std::vector<source_file_t> &files,
                          BuildPipeline &pipeline, const launch_conf_t &base) const override;
    prepared_run_t prepare_run(const phase_info_t &info, const launch_conf_t &base,
                               const detection_conf_t &det) const override;

    // Compile and link steps of a multi-file program
    std::vector<build_step_t> multi_file_steps(const phase_info_t &info) const;
    // `sh -c` script compiling a single file, announcing `sentinel` on
    // stderr, then replacing itself with the program
    std::string single_file_script(const phase_info_t &info, const std::string &sentinel) const;
};

std::unique_ptr<LanguageSuite> make_suite(language_t lang, const lang_conf_t &conf);

}  // namespace runbox
